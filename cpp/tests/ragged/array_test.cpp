#include <gtest/gtest.h>
#include "../../ragged/adapt.hpp"

using ragged::adapt;

TEST(ArrayTest, adapt_vector) {
    auto a = adapt(std::vector<int32_t>{1, 2, 3});
    EXPECT_EQ(ragged::dtype::int32, a.dtype());
    EXPECT_EQ(1, a.dimensions());
    EXPECT_EQ(3, a.size());
    EXPECT_EQ(2, a[1].value<int32_t>());
    EXPECT_EQ(3, a[-1].value<int32_t>());
    EXPECT_THROW(a.get(3), ragged::index_out_of_bounds);
    EXPECT_THROW(a.get(-4), ragged::index_out_of_bounds);
}

TEST(ArrayTest, adapt_with_shape) {
    auto a = adapt(std::vector<int64_t>{1, 2, 3, 4, 5, 6}, ragged::shape{3, 2});
    EXPECT_EQ("(3, 2)", a.shape().to_string());
    EXPECT_EQ((std::vector<int64_t>{5, 6}), a[2].to_vector<int64_t>());
    EXPECT_THROW(adapt(std::vector<int64_t>{1, 2, 3}, ragged::shape{2, 2}), ragged::invalid_shape);
}

TEST(ArrayTest, scalar_has_no_size) {
    auto a = adapt(7.5);
    EXPECT_EQ(0, a.dimensions());
    EXPECT_EQ(7.5, a.value<double>());
    EXPECT_THROW(a.size(), ragged::invalid_operation);
}

TEST(ArrayTest, null_handle) {
    ragged::array a;
    EXPECT_FALSE(a);
    EXPECT_THROW(a.shape(), ragged::invalid_operation);
}

TEST(ArrayTest, slice_shares_storage) {
    auto a = adapt({1, 2, 3, 4, 5});
    auto s = a.slice(ragged::slice(1, std::nullopt, 2));
    EXPECT_EQ((std::vector<int32_t>{2, 4}), s.to_vector<int32_t>());
    s.set(0, 20);
    EXPECT_EQ(20, a[1].value<int32_t>());

    auto r = a.slice(ragged::slice(std::nullopt, std::nullopt, -1));
    EXPECT_EQ((std::vector<int32_t>{5, 4, 3, 20, 1}), r.to_vector<int32_t>());
}

TEST(ArrayTest, take_copies) {
    auto a = adapt({1, 2, 3, 4, 5});
    auto t = a.take(adapt({4, 0, -1}));
    EXPECT_EQ((std::vector<int32_t>{5, 1, 5}), t.to_vector<int32_t>());
    t.set(0, 50);
    EXPECT_EQ(5, a[4].value<int32_t>());

    auto m = a.take(adapt({true, false, false, true, false}));
    EXPECT_EQ((std::vector<int32_t>{1, 4}), m.to_vector<int32_t>());
    EXPECT_THROW(a.take(adapt({true, false})), ragged::length_mismatch);
    EXPECT_THROW(a.take(adapt({1.0})), ragged::invalid_type);
    EXPECT_THROW(a.take(adapt({5})), ragged::index_out_of_bounds);
}

TEST(ArrayTest, put_broadcasts) {
    auto a = adapt({1, 2, 3});
    a.put(adapt({0, 2}), adapt(7));
    EXPECT_EQ((std::vector<int32_t>{7, 2, 7}), a.to_vector<int32_t>());
    a.put(adapt({0, 1}), adapt({8}));
    EXPECT_EQ((std::vector<int32_t>{8, 8, 7}), a.to_vector<int32_t>());
    a.put(adapt({2, 1}), adapt({1.9, 2.1}));
    EXPECT_EQ((std::vector<int32_t>{8, 2, 1}), a.to_vector<int32_t>());
    EXPECT_THROW(a.put(adapt({0, 1}), adapt({1, 2, 3})), ragged::length_mismatch);
}

TEST(ArrayTest, read_only) {
    auto a = adapt({1, 2, 3});
    a.set_writeable(false);
    EXPECT_FALSE(a.writeable());
    EXPECT_THROW(a.set(0, 1), ragged::read_only);
    EXPECT_THROW(a.slice(ragged::slice::all()).set(0, 1), ragged::read_only);
}

TEST(ArrayTest, record_fields) {
    auto r = ragged::record({{"x", adapt({1, 2})}, {"y", adapt({1.5, 2.5})}});
    EXPECT_EQ(ragged::dtype::record, r.dtype());
    EXPECT_EQ(2, r.size());
    EXPECT_EQ((std::vector<std::string>{"x", "y"}), r.fields());
    EXPECT_EQ(2.5, r.field("y")[1].value<double>());
    EXPECT_EQ(2.5, r[1].field("y").value<double>());
    EXPECT_THROW(r.field("z"), ragged::invalid_operation);
    EXPECT_THROW(adapt({1}).field("x"), ragged::invalid_operation);
    EXPECT_THROW(ragged::record({{"x", adapt({1, 2})}, {"y", adapt({1})}}), ragged::shape_mismatch);
}

TEST(ArrayTest, record_assignment) {
    auto x = adapt({1, 2});
    auto y = adapt({3, 4});
    auto r = ragged::record({{"x", x}, {"y", y}});
    r.set(0, ragged::record({{"x", adapt(10)}, {"y", adapt(30)}}));
    EXPECT_EQ(10, x[0].value<int32_t>());
    EXPECT_EQ(30, y[0].value<int32_t>());
    EXPECT_THROW(r.set(1, adapt(5)), ragged::invalid_type);
}

TEST(ArrayTest, reinterpret_bytes) {
    auto a = adapt(std::vector<uint8_t>{1, 0, 2, 0});
    auto v = ragged::reinterpret(a, ragged::dtype::uint16);
    EXPECT_EQ((std::vector<uint16_t>{1, 2}), v.to_vector<uint16_t>());
    EXPECT_THROW(ragged::reinterpret(adapt(std::vector<uint8_t>{1, 2, 3}), ragged::dtype::uint16),
                 ragged::invalid_operation);
}

TEST(ArrayTest, as_bytes) {
    auto a = adapt(std::vector<uint16_t>{0x0102, 0x0304});
    auto b = ragged::as_bytes(a);
    EXPECT_EQ(ragged::dtype::uint8, b.dtype());
    EXPECT_EQ((std::vector<uint8_t>{2, 1, 4, 3}), b.to_vector<uint8_t>());
    b.set(0, 9);
    EXPECT_EQ(0x0109, a[0].value<uint16_t>());

    auto strided = a.slice(ragged::slice(std::nullopt, std::nullopt, -1));
    auto c = ragged::as_bytes(strided);
    EXPECT_EQ((std::vector<uint8_t>{4, 3, 9, 1}), c.to_vector<uint8_t>());
    c.set(0, 0);
    EXPECT_EQ(0x0304, a[1].value<uint16_t>());
    EXPECT_THROW(ragged::as_bytes(a, ragged::dtype::int16), ragged::invalid_type);
}

TEST(ArrayTest, astype) {
    auto a = ragged::astype(adapt({1.7, -2.2}), ragged::dtype::int64);
    EXPECT_EQ(ragged::dtype::int64, a.dtype());
    EXPECT_EQ((std::vector<int64_t>{1, -2}), a.to_vector<int64_t>());
}

TEST(ArrayTest, none) {
    auto n = ragged::none();
    EXPECT_TRUE(n.is_none());
    EXPECT_FALSE(adapt(1).is_none());
    EXPECT_EQ(0, n.dimensions());
}

TEST(ShapeTest, format) {
    EXPECT_EQ("(3,)", ragged::shape{3}.to_string());
    EXPECT_EQ("(2, 3)", (ragged::shape{2, 3}).to_string());
    EXPECT_EQ("()", ragged::shape().to_string());
    EXPECT_EQ(6, (ragged::shape{2, 3}).volume());
    EXPECT_EQ("(3,)", (ragged::shape{2, 3}).tail().to_string());
}

TEST(SliceTest, resolve) {
    auto r = ragged::slice(-2, std::nullopt).resolve(5);
    EXPECT_EQ(3, r.start);
    EXPECT_EQ(2, r.count);

    auto back = ragged::slice(std::nullopt, std::nullopt, -2).resolve(5);
    EXPECT_EQ(3, back.count);
    EXPECT_EQ(4, back[0]);
    EXPECT_EQ(0, back[2]);

    EXPECT_EQ(0, ragged::slice(4, 2).resolve(5).count);
    EXPECT_EQ(5, ragged::slice(-10, 10).resolve(5).count);
    EXPECT_THROW(ragged::slice(std::nullopt, std::nullopt, 0).resolve(5), ragged::invalid_operation);
}
