/**
 * @file TestAssert.cpp
 * @brief Unit tests for SYNAPSE_ASSERT and SYNAPSE_UNLIKELY.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/core/Assert.hpp>

TEST_CASE("SYNAPSE_UNLIKELY keeps the truth value of its operand", "[core][assert]")
{
    int calls = 0;
    auto bump = [&] { return ++calls; };

    REQUIRE(SYNAPSE_UNLIKELY(bump() == 1));
    REQUIRE_FALSE(SYNAPSE_UNLIKELY(bump() == 1));
    REQUIRE(calls == 2);
    REQUIRE(SYNAPSE_UNLIKELY(7));
}

TEST_CASE("SYNAPSE_ASSERT on a true condition is a no-op", "[core][assert]")
{
    int value = 4;
    SYNAPSE_ASSERT(value == 4);
    SYNAPSE_ASSERT(value % 2 == 0);
    REQUIRE(value == 4);
}
