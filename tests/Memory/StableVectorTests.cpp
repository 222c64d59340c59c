/// @file StableVectorTests.cpp
/// @brief Tests for the segmented StableVector.

#include <Arbor/Memory/StableVector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using Arbor::Memory::StableVector;

TEST_CASE("StableVector elements never move", "[Memory][StableVector]")
{
    StableVector<int, 4> values;
    int& first = values.PushBack(1);
    for (int i = 2; i <= 100; ++i)
        values.PushBack(i);

    CHECK(values.Size() == 100);
    CHECK(values.Capacity() == 100);
    CHECK(&values[0] == &first);
    CHECK(values[0] == 1);
    CHECK(values[99] == 100);
}

TEST_CASE("StableVector Clear destroys elements but keeps segments", "[Memory][StableVector]")
{
    auto tracker = std::make_shared<int>(0);
    {
        StableVector<std::shared_ptr<int>, 8> values;
        for (int i = 0; i < 20; ++i)
            values.EmplaceBack(tracker);
        CHECK(tracker.use_count() == 21);

        const auto capacity = values.Capacity();
        values.Clear();
        CHECK(values.IsEmpty());
        CHECK(values.Capacity() == capacity);
        CHECK(tracker.use_count() == 1);

        values.EmplaceBack(tracker);
        values.PopBack();
        CHECK(tracker.use_count() == 1);

        values.EmplaceBack(tracker);
    }
    CHECK(tracker.use_count() == 1);
}

TEST_CASE("StableVector Release frees all segments", "[Memory][StableVector]")
{
    StableVector<std::string, 2> values;
    values.EmplaceBack("a");
    values.EmplaceBack("b");
    values.EmplaceBack("c");
    CHECK(values[2] == "c");

    values.Release();
    CHECK(values.Size() == 0);
    CHECK(values.Capacity() == 0);
}
