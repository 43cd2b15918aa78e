// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/RulesFunction.hpp"

#include <utility>

namespace rulesvm::bytecode
{

namespace
{

/// @brief RulesFunction backed by a std::function.
class LambdaFunction final : public RulesFunction
{
  public:
    LambdaFunction(std::string name, uint32_t argc, FunctionBody body)
        : name_(std::move(name)), argc_(argc), body_(std::move(body))
    {
    }

    std::string_view name() const override
    {
        return name_;
    }

    uint32_t argumentCount() const override
    {
        return argc_;
    }

    support::Expected<Value> apply(std::span<const Value> args) const override
    {
        return body_(args);
    }

  private:
    std::string name_;
    uint32_t argc_;
    FunctionBody body_;
};

} // namespace

std::shared_ptr<const RulesFunction> makeFunction(std::string name,
                                                  uint32_t argumentCount,
                                                  FunctionBody body)
{
    return std::make_shared<LambdaFunction>(std::move(name), argumentCount, std::move(body));
}

} // namespace rulesvm::bytecode
