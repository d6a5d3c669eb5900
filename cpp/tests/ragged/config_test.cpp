#include <gtest/gtest.h>
#include "../../ragged/config.hpp"
#include "../../ragged/exceptions.hpp"

#include <cstdlib>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear();
    }

    void TearDown() override {
        clear();
    }

    static void clear() {
        for (const auto* name : {"RAGGED_LOG_LEVEL", "RAGGED_INDEX_DTYPE", "RAGGED_BYTE_DTYPE", "RAGGED_CACHE_CAPACITY"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, defaults) {
    auto c = ragged::config::from_env();
    EXPECT_EQ(ragged::log_level::warning, c.level);
    EXPECT_EQ(ragged::dtype::int64, c.layout.index);
    EXPECT_EQ(ragged::dtype::uint8, c.layout.byte);
    EXPECT_EQ(0, c.cache_capacity);
}

TEST_F(ConfigTest, reads_environment) {
    setenv("RAGGED_LOG_LEVEL", "Debug", 1);
    setenv("RAGGED_INDEX_DTYPE", "int32", 1);
    setenv("RAGGED_BYTE_DTYPE", "int8", 1);
    setenv("RAGGED_CACHE_CAPACITY", "16", 1);
    auto c = ragged::config::from_env();
    EXPECT_EQ(ragged::log_level::debug, c.level);
    EXPECT_EQ(ragged::dtype::int32, c.layout.index);
    EXPECT_EQ(ragged::dtype::int8, c.layout.byte);
    EXPECT_EQ(16, c.cache_capacity);
}

TEST_F(ConfigTest, invalid_values) {
    setenv("RAGGED_INDEX_DTYPE", "float32", 1);
    EXPECT_THROW(ragged::config::from_env(), ragged::invalid_type);
    unsetenv("RAGGED_INDEX_DTYPE");

    setenv("RAGGED_BYTE_DTYPE", "bytes", 1);
    EXPECT_THROW(ragged::config::from_env(), ragged::unknown_dtype);
    unsetenv("RAGGED_BYTE_DTYPE");

    setenv("RAGGED_BYTE_DTYPE", "uint16", 1);
    EXPECT_THROW(ragged::config::from_env(), ragged::invalid_type);
    unsetenv("RAGGED_BYTE_DTYPE");

    setenv("RAGGED_LOG_LEVEL", "verbose", 1);
    EXPECT_THROW(ragged::config::from_env(), ragged::invalid_type);
    unsetenv("RAGGED_LOG_LEVEL");

    setenv("RAGGED_CACHE_CAPACITY", "-1", 1);
    EXPECT_THROW(ragged::config::from_env(), ragged::invalid_type);
}

TEST(DtypeTest, names) {
    EXPECT_EQ("int16", ragged::dtype_to_str(ragged::dtype::int16));
    EXPECT_EQ(ragged::dtype::float64, ragged::dtype_from_str("float64"));
    EXPECT_THROW(ragged::dtype_from_str("complex128"), ragged::unknown_dtype);
    EXPECT_EQ(4, ragged::dtype_bytes(ragged::dtype::float32));
    EXPECT_THROW(ragged::dtype_bytes(ragged::dtype::object), ragged::non_numeric_dtype);
    EXPECT_THROW(ragged::dtype_bytes(ragged::dtype::unknown), ragged::unknown_dtype);
    EXPECT_TRUE(ragged::dtype_is_integral(ragged::dtype::uint32));
    EXPECT_FALSE(ragged::dtype_is_integral(ragged::dtype::boolean));
}
