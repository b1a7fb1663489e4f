#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <imprint/buffers.hpp>
#include <imprint/dynamic_array.hpp>
#include <imprint/image.hpp>
#include <imprint/scalar.hpp>
#include <imprint/string.hpp>

#include "helpers/buffer_utility.hpp"
#include "helpers/image_utility.hpp"
#include "helpers/mock_imageable.hpp"


namespace imprint::test {

    static_assert(imageable<dynamic_array<std::int32_t>>);
    static_assert(imageable<dynamic_array<dynamic_array<string>>>);
    static_assert(!imageable<dynamic_array<std::int32_t*>>);


    TEST(DynamicArrayTest, DefaultEmpty) {
        dynamic_array<std::int32_t> const array;
        EXPECT_TRUE(array.empty());
        EXPECT_EQ(array.size(), 0u);
        EXPECT_EQ(array.capacity(), 0u);
        EXPECT_EQ(array.data(), nullptr);
        EXPECT_EQ(array.begin(), array.end());
    }

    TEST(DynamicArrayTest, Construct) {
        dynamic_array<std::int32_t> const listed{4, 5, 6};
        ASSERT_EQ(listed.size(), 3u);
        EXPECT_EQ(listed[0], 4);
        EXPECT_EQ(listed.back(), 6);

        dynamic_array<std::string> const filled(3, "abc");
        ASSERT_EQ(filled.size(), 3u);
        EXPECT_EQ(filled[2], "abc");

        std::vector<std::int32_t> const source{7, 8};
        dynamic_array<std::int64_t> const ranged(source.begin(), source.end());
        ASSERT_EQ(ranged.size(), 2u);
        EXPECT_EQ(ranged.front(), 7);
    }

    TEST(DynamicArrayTest, CopyAndMove) {
        dynamic_array<std::string> original{"x", "y"};
        auto copy = original;
        EXPECT_EQ(copy, original);
        EXPECT_NE(copy.data(), original.data());

        auto const data = original.data();
        auto moved = std::move(original);
        EXPECT_EQ(moved.data(), data);
        EXPECT_TRUE(original.empty());

        copy = moved;
        EXPECT_EQ(copy, moved);
        moved = dynamic_array<std::string>{"z"};
        EXPECT_EQ(moved.size(), 1u);
    }

    TEST(DynamicArrayTest, PushAndPop) {
        dynamic_array<std::string> array;
        for (int i = 0; i < 100; ++i) {
            array.push_back(std::to_string(i));
        }
        ASSERT_EQ(array.size(), 100u);
        EXPECT_GE(array.capacity(), 100u);
        EXPECT_EQ(array[57], "57");

        array.pop_back();
        EXPECT_EQ(array.size(), 99u);
        EXPECT_EQ(array.back(), "98");

        array.emplace_back(3, 'q');
        EXPECT_EQ(array.back(), "qqq");
    }

    TEST(DynamicArrayTest, EmplaceSelfReference) {
        dynamic_array<std::string> array{"self"};
        array.reserve(1);
        ASSERT_EQ(array.size(), array.capacity());
        array.push_back(array[0]);
        EXPECT_EQ(array[1], "self");
    }

    TEST(DynamicArrayTest, ResizeAndClear) {
        dynamic_array<std::int32_t> array{1, 2, 3};
        array.resize(5);
        ASSERT_EQ(array.size(), 5u);
        EXPECT_EQ(array[4], 0);
        array.resize(1);
        ASSERT_EQ(array.size(), 1u);
        EXPECT_EQ(array[0], 1);

        auto const capacity = array.capacity();
        array.clear();
        EXPECT_TRUE(array.empty());
        EXPECT_EQ(array.capacity(), capacity);
    }

    TEST(DynamicArrayTest, AtChecksBounds) {
        dynamic_array<std::int32_t> array{1, 2};
        EXPECT_EQ(array.at(1), 2);
        EXPECT_THROW(static_cast<void>(array.at(2)), std::out_of_range);
    }

    TEST(DynamicArrayTest, RoundTripEmpty) {
        dynamic_array<string> const value;
        auto buffer = encode_to_buffer(value);
        auto const result = decode<dynamic_array<string>>(buffer.span());
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->value.empty());
        EXPECT_TRUE(result->remaining.empty());
        EXPECT_TRUE(validate_buffer<dynamic_array<string>>(buffer.span()).has_value());
    }

    TEST(DynamicArrayTest, RoundTripScalars) {
        dynamic_array<std::uint64_t> const value{1, 1ull << 63, 12345};
        auto buffer = encode_to_buffer(value);
        EXPECT_EQ(buffer.span().size(), sizeof(value) + 3 * sizeof(std::uint64_t));

        auto const result = decode<dynamic_array<std::uint64_t>>(buffer.span());
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->value, value);
        EXPECT_EQ(static_cast<void const*>(result->value.data()),
            static_cast<void const*>(buffer.span().data() + sizeof(value)));
        EXPECT_TRUE(all_prefixes_rejected<dynamic_array<std::uint64_t>>(buffer.span()));
    }

    TEST(DynamicArrayTest, RoundTripNested) {
        dynamic_array<dynamic_array<string>> const value{
            {string{"a"}, string{"bc"}},
            {},
            {string{"def"}}
        };
        auto buffer = encode_to_buffer(value);

        auto const result = decode<dynamic_array<dynamic_array<string>>>(buffer.span());
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->value, value);
        EXPECT_TRUE(result->remaining.empty());
        EXPECT_TRUE(validate_buffer<dynamic_array<dynamic_array<string>>>(buffer.span()).has_value());
        EXPECT_TRUE(all_prefixes_rejected<dynamic_array<dynamic_array<string>>>(buffer.span()));
    }

    TEST(DynamicArrayTest, CapacityNormalised) {
        dynamic_array<std::int32_t> value{1, 2};
        value.reserve(50);
        ASSERT_EQ(value.capacity(), 50u);

        auto buffer = encode_to_buffer(value);
        EXPECT_EQ(value.capacity(), 50u);
        EXPECT_EQ(buffer.span().size(), sizeof(value) + 2 * sizeof(std::int32_t));

        auto const result = decode<dynamic_array<std::int32_t>>(buffer.span());
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->value.size(), 2u);
        EXPECT_EQ(result->value.capacity(), 2u);
    }

    TEST(DynamicArrayTest, HeadersBeforeTails) {
        std::vector<mock_call> calls;
        dynamic_array<mock_imageable> const value{mock_imageable{1, 2, &calls}, mock_imageable{2, 1, &calls}};
        auto buffer = encode_to_buffer(value);

        std::vector<mock_call> const expected_calls{
            {"neutralise", 1}, {"neutralise", 2}, {"serialise_tail", 1}, {"serialise_tail", 2}};
        EXPECT_EQ(calls, expected_calls);

        auto const tail = buffer.span().subspan(sizeof(value) + 2 * sizeof(mock_imageable));
        ASSERT_EQ(tail.size(), 3u);
        EXPECT_EQ(tail[0], std::byte{1});
        EXPECT_EQ(tail[1], std::byte{1});
        EXPECT_EQ(tail[2], std::byte{2});
    }

    TEST(DynamicArrayTest, ValidateRejectsMovedElements) {
        dynamic_array<string> const value{string{"moved"}};
        auto buffer = encode_to_buffer(value);
        ASSERT_TRUE(decode<dynamic_array<string>>(buffer.span()).has_value());

        auto copy = copy_all(buffer.span());
        EXPECT_FALSE(validate_buffer<dynamic_array<string>>(copy.span()).has_value());
    }

}
