/**
 * @file TestError.cpp
 * @brief Unit tests for synapse::core::Error and the TRY macros.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/core/Expected.hpp>

using namespace synapse::core;

namespace {

Expected<int> half(int value)
{
    if (value % 2 != 0)
        return makeError(ErrorCode::kInvalidArgument, "odd value");
    return value / 2;
}

Expected<int> quarter(int value)
{
    const int h = SYNAPSE_TRY(half(value));
    return SYNAPSE_TRY(half(h));
}

ExpectedVoid requireEven(int value)
{
    SYNAPSE_TRY_VOID(half(value));
    return {};
}

} // namespace

TEST_CASE("Error carries code, message and location", "[core][error]")
{
    Error err{ErrorCode::kNotConnected, "socket closed"};
    REQUIRE(err.code() == ErrorCode::kNotConnected);
    REQUIRE(err.message() == "socket closed");
    REQUIRE(err.describe() == "NotConnected: socket closed");
    REQUIRE(err.location().line() > 0);
}

TEST_CASE("errorCodeName gives stable labels", "[core][error]")
{
    REQUIRE(errorCodeName(ErrorCode::kSerializationFailed) == "SerializationFailed");
    REQUIRE(errorCodeName(ErrorCode::kConnectionFailed) == "ConnectionFailed");
    REQUIRE(errorCodeName(ErrorCode::kFileParseError) == "FileParseError");
}

TEST_CASE("SYNAPSE_TRY propagates the first error", "[core][error]")
{
    auto ok = quarter(8);
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 2);

    auto bad = quarter(6);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == ErrorCode::kInvalidArgument);

    REQUIRE(requireEven(4).has_value());
    REQUIRE_FALSE(requireEven(3).has_value());
}
