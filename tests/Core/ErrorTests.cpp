/// @file ErrorTests.cpp
/// @brief Tests for error construction and rendering.

#include <Arbor/Core/Error.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace Arbor;

TEST_CASE("Fail carries every field", "[Core][Error]")
{
    const Expected<int> result = Fail(ErrorCode::DisallowedChild, "a", "area", "area is not allowed in a");

    REQUIRE_FALSE(result.has_value());
    const Error& error = result.error();
    CHECK(error.code == ErrorCode::DisallowedChild);
    CHECK(error.tag == "a");
    CHECK(error.subject == "area");
    CHECK_FALSE(error.HasIndex());
    CHECK(error.message == "area is not allowed in a");
}

TEST_CASE("Describe includes the child index when present", "[Core][Error]")
{
    Error error = MakeError(ErrorCode::InvalidHandle, "div", "", "handle belongs to another arena");
    CHECK(Describe(error) == "InvalidHandle: handle belongs to another arena");

    error.index = 2;
    CHECK(Describe(error) == "InvalidHandle: handle belongs to another arena (child 2)");
}

TEST_CASE("Every error code has a name", "[Core][Error]")
{
    CHECK(ToString(ErrorCode::UnknownTag) == "UnknownTag");
    CHECK(ToString(ErrorCode::PlainTextUnavailable) == "PlainTextUnavailable");
    CHECK(ToString(ErrorCode::SchemaIO) == "SchemaIO");
}
