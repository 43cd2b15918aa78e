// File: tests/unit/test_register_allocator.cpp
// Purpose: Verify register allocation, lookup and limits.
// Key invariants: Names are unique; at most 256 registers; indices are dense.
// Ownership/Lifetime: Standalone unit test executable.
// Links: bytecode/RegisterAllocator.hpp

#include <gtest/gtest.h>

#include "bytecode/RegisterAllocator.hpp"

#include <string>

using namespace rulesvm::bytecode;
using rulesvm::support::TrapKind;

TEST(RegisterAllocator, AllocatesDenseIndices)
{
    RegisterAllocator alloc;
    EXPECT_EQ(alloc.allocate("Region", true).value(), 0);
    EXPECT_EQ(alloc.allocate("UseFIPS", false, Value::boolean(false)).value(), 1);
    EXPECT_EQ(alloc.allocate("Endpoint", false, std::nullopt, std::string("SDK::Endpoint")).value(),
              2);

    const auto &defs = alloc.registry();
    ASSERT_EQ(defs.size(), 3u);
    EXPECT_TRUE(defs[0].required);
    EXPECT_TRUE(defs[1].defaultValue == Value::boolean(false));
    EXPECT_TRUE(defs[2].builtin == std::string("SDK::Endpoint"));
    EXPECT_FALSE(defs[2].temporary);
}

TEST(RegisterAllocator, RejectsDuplicates)
{
    RegisterAllocator alloc;
    ASSERT_TRUE(alloc.allocate("Region"));
    auto dup = alloc.allocate("Region");
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().kind, TrapKind::DuplicateRegister);
    EXPECT_EQ(dup.error().message, "Register already allocated: Region");
}

TEST(RegisterAllocator, GetOrAllocateCreatesTemporaries)
{
    RegisterAllocator alloc;
    ASSERT_TRUE(alloc.allocate("Region"));
    EXPECT_EQ(alloc.getOrAllocateRegister("Region").value(), 0);
    EXPECT_EQ(alloc.getOrAllocateRegister("partition").value(), 1);
    EXPECT_EQ(alloc.getOrAllocateRegister("partition").value(), 1);
    EXPECT_TRUE(alloc.registry()[1].temporary);
}

TEST(RegisterAllocator, GetRegisterReportsUnknownNames)
{
    RegisterAllocator alloc;
    auto missing = alloc.getRegister("Nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, TrapKind::UnknownRegister);
    EXPECT_EQ(missing.error().message, "Register not allocated: Nope");
}

TEST(RegisterAllocator, LimitIs256)
{
    RegisterAllocator alloc;
    for (int i = 0; i < 256; ++i)
        ASSERT_TRUE(alloc.allocate("r" + std::to_string(i)));
    EXPECT_EQ(alloc.getRegister("r255").value(), 255);
    auto overflow = alloc.allocate("r256");
    ASSERT_FALSE(overflow);
    EXPECT_EQ(overflow.error().kind, TrapKind::RegisterOverflow);
    EXPECT_EQ(overflow.error().message, "Too many registers: limit is 256");
}
