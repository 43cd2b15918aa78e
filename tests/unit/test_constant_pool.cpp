// File: tests/unit/test_constant_pool.cpp
// Purpose: Verify constant pool deduplication and ordering.
// Key invariants: Equal values share one index; indices follow first insertion.
// Ownership/Lifetime: Standalone unit test executable.
// Links: bytecode/ConstantPool.hpp

#include <gtest/gtest.h>

#include "bytecode/ConstantPool.hpp"

using rulesvm::bytecode::ConstantPool;
using rulesvm::bytecode::Value;

TEST(ConstantPool, DeduplicatesStructurallyEqualValues)
{
    ConstantPool pool;
    EXPECT_EQ(pool.indexOf(Value::string("a")), 0u);
    EXPECT_EQ(pool.indexOf(Value::integer(1)), 1u);
    EXPECT_EQ(pool.indexOf(Value::string("a")), 0u);
    EXPECT_EQ(pool.indexOf(Value::list({Value::integer(1)})), 2u);
    EXPECT_EQ(pool.indexOf(Value::list({Value::integer(1)})), 2u);
    EXPECT_EQ(pool.size(), 3u);
}

TEST(ConstantPool, DistinguishesKinds)
{
    ConstantPool pool;
    pool.indexOf(Value::string("1"));
    pool.indexOf(Value::integer(1));
    pool.indexOf(Value::boolean(true));
    pool.indexOf(Value());
    EXPECT_EQ(pool.size(), 4u);
    EXPECT_EQ(pool.values()[3], Value());
}

TEST(ConstantPool, TakeTransfersValues)
{
    ConstantPool pool;
    pool.indexOf(Value::string("x"));
    auto values = pool.take();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0], Value::string("x"));
}
