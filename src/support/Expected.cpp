//===----------------------------------------------------------------------===//
//
// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/Expected.cpp
// Purpose: Out-of-line members of Expected<void>.
// Key invariants: A default-constructed Expected<void> is a success.
// Ownership/Lifetime: Owns its optional error.
// Links: support/Expected.hpp
//
//===----------------------------------------------------------------------===//

#include "support/Expected.hpp"

namespace rulesvm::support
{

Expected<void>::Expected(RulesError error) : error_(std::move(error)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const RulesError &Expected<void>::error() const &
{
    return *error_;
}

} // namespace rulesvm::support
