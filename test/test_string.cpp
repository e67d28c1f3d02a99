#include <gtest/gtest.h>
#include <cowl/support/string.h>

#include <cstdint>
#include <limits>

using namespace cowl;

TEST(String, IntToStr) {
    EXPECT_EQ(int_to_str((int64_t)0), "0");
    EXPECT_EQ(int_to_str((int64_t)-42), "-42");
    EXPECT_EQ(int_to_str(std::numeric_limits<int64_t>::min()), "-9223372036854775808");
    EXPECT_EQ(int_to_str(std::numeric_limits<uint64_t>::max()), "18446744073709551615");
}

TEST(String, FloatToStr) {
    Float value;
    ASSERT_TRUE(str_to_float(float_to_str(0.1), value));
    EXPECT_EQ(value, 0.1);
    ASSERT_TRUE(str_to_float(float_to_str(-1e300), value));
    EXPECT_EQ(value, -1e300);
}

TEST(String, StrToInt) {
    Int value = 0;
    EXPECT_TRUE(str_to_int("-17", value));
    EXPECT_EQ(value, -17);
    EXPECT_FALSE(str_to_int("", value));
    EXPECT_FALSE(str_to_int("17 ", value));
    EXPECT_FALSE(str_to_int("0x11", value));
    EXPECT_FALSE(str_to_int("9223372036854775808", value));
}

TEST(String, StrToUInt) {
    UInt value = 0;
    EXPECT_TRUE(str_to_uint("18446744073709551615", value));
    EXPECT_EQ(value, std::numeric_limits<uint64_t>::max());
    EXPECT_FALSE(str_to_uint("-1", value));
    EXPECT_FALSE(str_to_uint("18446744073709551616", value));
}

TEST(String, StrToFloat) {
    Float value = 0;
    EXPECT_TRUE(str_to_float("2.5", value));
    EXPECT_EQ(value, 2.5);
    EXPECT_TRUE(str_to_float("-1e-3", value));
    EXPECT_EQ(value, -1e-3);
    EXPECT_FALSE(str_to_float("", value));
    EXPECT_FALSE(str_to_float("1.5x", value));
    EXPECT_FALSE(str_to_float("1e999", value));
}
