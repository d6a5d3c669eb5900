#include <gtest/gtest.h>
#include "../../ragged/adapt.hpp"
#include "../../ragged/nullable_index_view.hpp"

#include <type_traits>

using ragged::adapt;

TEST(NullableIndexViewTest, missing_positions) {
    ragged::nullable_index_view view(adapt({-1, 3}), adapt({1, 2, 3, 4}));
    EXPECT_EQ(-1, view.masked_when());
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_EQ(4, view.get(1).value<int32_t>());
    EXPECT_TRUE(view.is_missing(0));
    EXPECT_FALSE(view.is_missing(1));
    EXPECT_EQ((std::vector<bool>{true, false}), view.mask().to_vector<bool>());
}

TEST(NullableIndexViewTest, custom_sentinel) {
    ragged::nullable_index_view view(adapt({0, 99, 1}), adapt({5, 6}), 99);
    EXPECT_EQ(5, view.get(0).value<int32_t>());
    EXPECT_TRUE(view.get(1).is_none());
    EXPECT_EQ(6, view.get(2).value<int32_t>());
}

TEST(NullableIndexViewTest, slice_keeps_nulls) {
    auto content = adapt({1, 2, 3, 4});
    ragged::nullable_index_view view(adapt({3, -1, 0}), content);
    auto sliced = view.slice(ragged::slice::range(1, 3));
    const auto* inner = sliced.dynamic_cast_<ragged::nullable_index_view>();
    ASSERT_NE(nullptr, inner);
    EXPECT_EQ(2, sliced.size());
    EXPECT_TRUE(sliced[0].is_none());
    EXPECT_EQ(1, sliced[1].value<int32_t>());

    auto taken = view.take(adapt({2, 1}));
    EXPECT_EQ(1, taken[0].value<int32_t>());
    EXPECT_TRUE(taken[1].is_none());
}

TEST(NullableIndexViewTest, write_missing_marker) {
    auto index = adapt({0, 1, 2});
    ragged::nullable_index_view view(index, adapt({1, 2, 3}));
    view.set(1, ragged::missing);
    EXPECT_TRUE(view.get(1).is_none());
    EXPECT_EQ(-1, index[1].value<int32_t>());

    view.set(0, ragged::singleton(ragged::missing));
    EXPECT_TRUE(view.get(0).is_none());

    view.set(2, ragged::none());
    EXPECT_TRUE(view.get(2).is_none());
}

TEST(NullableIndexViewTest, write_values) {
    auto content = adapt({1, 2, 3});
    ragged::nullable_index_view view(adapt({2, 0, 1}), content);
    view.set(0, adapt(30));
    EXPECT_EQ(30, content[2].value<int32_t>());

    view.set(1, ragged::singleton(adapt(10)));
    EXPECT_EQ(10, content[0].value<int32_t>());

    view.set(2, adapt({20}));
    EXPECT_EQ(20, content[1].value<int32_t>());

    view.set(ragged::slice::all(), adapt({7, 8, 9}));
    EXPECT_EQ((std::vector<int32_t>{8, 9, 7}), content.to_vector<int32_t>());

    view.put(adapt({0, 1}), adapt(0));
    EXPECT_EQ((std::vector<int32_t>{0, 9, 0}), content.to_vector<int32_t>());

    ragged::array handle(view);
    handle.set(2, adapt(4));
    EXPECT_EQ(4, content[1].value<int32_t>());
}

TEST(NullableIndexViewTest, markerless_write_keeps_masked_slots_masked) {
    auto index = adapt({-1, 0});
    auto content = adapt({5, 6});
    ragged::nullable_index_view view(index, content);

    view.set(0, adapt(42));
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_EQ(-1, index[0].value<int32_t>());
    EXPECT_EQ((std::vector<int32_t>{5, 6}), content.to_vector<int32_t>());

    view.set(ragged::slice::all(), adapt({7, 8}));
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_EQ(8, view.get(1).value<int32_t>());
    EXPECT_EQ((std::vector<int32_t>{8, 6}), content.to_vector<int32_t>());

    view.set(0, ragged::singleton(adapt(1)));
    EXPECT_TRUE(view.get(0).is_none());
}

TEST(NullableIndexViewTest, masked_source_either_polarity) {
    auto values = adapt({10, 20, 30});
    {
        auto index = adapt({0, 1, 2});
        auto content = adapt({0, 0, 0});
        ragged::nullable_index_view view(index, content);
        view.set(ragged::slice::all(), ragged::masked_source(values, adapt({false, true, false})));
        EXPECT_EQ((std::vector<int32_t>{0, -1, 2}), index.to_vector<int32_t>());
        EXPECT_EQ((std::vector<int32_t>{10, 0, 30}), content.to_vector<int32_t>());
    }
    {
        auto index = adapt({0, 1, 2});
        auto content = adapt({0, 0, 0});
        ragged::nullable_index_view view(index, content);
        view.set(ragged::slice::all(), ragged::masked_source(values, adapt({true, false, true}), false));
        EXPECT_EQ((std::vector<int32_t>{0, -1, 2}), index.to_vector<int32_t>());
        EXPECT_EQ((std::vector<int32_t>{10, 0, 30}), content.to_vector<int32_t>());
    }
}

TEST(NullableIndexViewTest, masked_source_validation) {
    EXPECT_THROW(ragged::masked_source(adapt({1, 2}), adapt({true})), ragged::shape_mismatch);
    EXPECT_THROW(ragged::masked_source(adapt({1, 2}), adapt({1, 0})), ragged::invalid_type);

    ragged::nullable_index_view view(adapt({0, 1, 2}), adapt({0, 0, 0}));
    EXPECT_THROW(view.set(ragged::slice::all(), ragged::masked_source(adapt({1, 2}), adapt({true, false}))),
                 ragged::length_mismatch);
}

TEST(NullableIndexViewTest, marked_sequence) {
    auto index = adapt({0, 1, 2});
    auto content = adapt({0, 0, 0});
    ragged::nullable_index_view view(index, content);
    view.set(ragged::slice::all(), ragged::marked_sequence{adapt(1), ragged::missing, adapt(3)});
    EXPECT_EQ((std::vector<int32_t>{0, -1, 2}), index.to_vector<int32_t>());
    EXPECT_EQ((std::vector<int32_t>{1, 0, 3}), content.to_vector<int32_t>());

    view.put(adapt({0, 2}), ragged::marked_sequence{ragged::missing});
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_TRUE(view.get(2).is_none());

    EXPECT_THROW(view.set(ragged::slice::all(), ragged::marked_sequence{adapt(1), adapt(2)}), ragged::length_mismatch);
}

TEST(NullableIndexViewTest, copy_between_views) {
    ragged::nullable_index_view source(adapt({-1, 1}), adapt({1, 2}));
    auto index = adapt({0, 1});
    auto content = adapt({0, 0});
    ragged::nullable_index_view target(index, content);
    target.set(ragged::slice::all(), source.to_masked_source());
    EXPECT_TRUE(target.get(0).is_none());
    EXPECT_EQ(2, target.get(1).value<int32_t>());
    EXPECT_EQ((std::vector<int32_t>{0, 2}), content.to_vector<int32_t>());
}

TEST(NullableIndexViewTest, read_only) {
    auto index = adapt({0});
    ragged::nullable_index_view view(index, adapt({1}), -1, false);
    EXPECT_THROW(view.set(0, ragged::missing), ragged::read_only);
    EXPECT_THROW(view.set(0, adapt(2)), ragged::read_only);
    EXPECT_EQ(0, index[0].value<int32_t>());
}

TEST(NullableIndexViewTest, column_projection) {
    auto x = adapt({1, 2});
    auto y = adapt({3, 4});
    ragged::nullable_index_view view(adapt({1, -1}), ragged::record({{"x", x}, {"y", y}}));
    auto column = view.column("y");
    EXPECT_EQ(4, column.get(0).value<int32_t>());
    EXPECT_TRUE(column.get(1).is_none());

    view.set("x", adapt(9));
    EXPECT_EQ((std::vector<int32_t>{1, 9}), x.to_vector<int32_t>());
}

TEST(NullableIndexViewTest, unsigned_index) {
    auto index = adapt(std::vector<uint8_t>{0, 1});
    EXPECT_THROW(ragged::nullable_index_view(index, adapt({1, 2})), ragged::invalid_type);

    ragged::nullable_index_view view(index, adapt({1, 2}), 255);
    view.set(0, ragged::missing);
    EXPECT_EQ(255, index.get(0).value<int64_t>());
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_TRUE(view.is_missing(0));
    view.set(0, adapt(7));
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_EQ(2, view.get(1).value<int32_t>());

    EXPECT_THROW(view.set_masked_when(-1), ragged::invalid_type);
    EXPECT_THROW(view.set_masked_when(256), ragged::invalid_type);
    EXPECT_EQ(255, view.masked_when());
    view.set_masked_when(1);
    EXPECT_TRUE(view.get(1).is_none());
}

TEST(NullableIndexViewTest, index_must_hold_sentinel) {
    ragged::nullable_index_view view(adapt({0, -1}), adapt({1, 2}));
    EXPECT_THROW(view.set_index(adapt(std::vector<uint16_t>{0, 1})), ragged::invalid_type);
    EXPECT_TRUE(view.get(1).is_none());

    view.set_index(adapt(std::vector<int8_t>{-1, 1}));
    EXPECT_TRUE(view.get(0).is_none());
    EXPECT_EQ(2, view.get(1).value<int32_t>());
    EXPECT_EQ(0, view.slice(ragged::slice::range(0, 0)).size());
}

TEST(NullableIndexViewTest, not_usable_as_plain_index_view) {
    static_assert(!std::is_convertible_v<ragged::nullable_index_view*, ragged::index_view*>);
    static_assert(!std::is_convertible_v<ragged::nullable_index_view&, const ragged::index_view&>);

    ragged::nullable_index_view view(adapt({-1, 3}), adapt({1, 2, 3, 4}));
    ragged::array a(view);
    EXPECT_TRUE(a[0].is_none());
    EXPECT_TRUE(a[-2].is_none());
    EXPECT_EQ(4, a[1].value<int32_t>());
}
