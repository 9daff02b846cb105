/**
 * @file work_test.cpp
 * @brief Unit tests for Work parameters and coercions
 */

#include <gtest/gtest.h>
#include <string>

#include "jobrack/core/work.hpp"

using namespace jobrack;

class WorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_ = Work(Params{
            {"Hello", std::string("World")},
            {"Truth", true},
            {"The Answer", std::int64_t{42}},
        });
    }

    Work work_;
};

TEST_F(WorkTest, ValuesAccessible) {
    EXPECT_FALSE(work_.get("Does not exist").has_value());
    EXPECT_EQ(work_.get_string("Hello"), "World");
    EXPECT_TRUE(work_.get_bool("Truth"));
    EXPECT_EQ(work_.get_int("The Answer"), 42);

    auto raw = work_.get("The Answer");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*raw), 42);

    EXPECT_EQ(work_.size(), 3);
    EXPECT_TRUE(work_.contains("Truth"));
    EXPECT_FALSE(work_.contains("truth"));
}

TEST_F(WorkTest, MismatchedGettersCoerce) {
    EXPECT_FALSE(work_.get_bool("Hello"));
    EXPECT_EQ(work_.get_string("The Answer"), "42");
    EXPECT_EQ(work_.get_int("Truth"), 1);
    EXPECT_EQ(work_.get_string("Truth"), "true");
    EXPECT_EQ(work_.get_int("Hello"), 0);
    EXPECT_TRUE(work_.get_bool("The Answer"));
}

TEST_F(WorkTest, MissingKeysYieldZeroValues) {
    EXPECT_EQ(work_.get_string("nope"), "");
    EXPECT_FALSE(work_.get_bool("nope"));
    EXPECT_EQ(work_.get_int("nope"), 0);
}

TEST_F(WorkTest, EmptyWork) {
    Work empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_FALSE(empty.get("anything").has_value());
    EXPECT_EQ(empty.get_int("anything"), 0);
}

TEST(ValueCoercionTest, StringToInt) {
    EXPECT_EQ(to_int64(Value{std::string("17")}), 17);
    EXPECT_EQ(to_int64(Value{std::string("-8")}), -8);
    EXPECT_EQ(to_int64(Value{std::string("42.000")}), 42);
    EXPECT_EQ(to_int64(Value{std::string("0x1f")}), 31);
    EXPECT_EQ(to_int64(Value{std::string("42.5")}), 0);
    EXPECT_EQ(to_int64(Value{std::string("12abc")}), 0);
    EXPECT_EQ(to_int64(Value{std::string("")}), 0);
}

TEST(ValueCoercionTest, StringToBool) {
    for (const char* yes : {"1", "t", "T", "TRUE", "true", "True"}) {
        EXPECT_TRUE(to_bool(Value{std::string(yes)})) << yes;
    }
    for (const char* no : {"0", "f", "false", "yes", "", "World"}) {
        EXPECT_FALSE(to_bool(Value{std::string(no)})) << no;
    }
}

TEST(ValueCoercionTest, Doubles) {
    EXPECT_EQ(to_string(Value{3.5}), "3.5");
    EXPECT_EQ(to_string(Value{42.0}), "42");
    EXPECT_EQ(to_string(Value{1e21}), "1000000000000000000000");
    EXPECT_EQ(to_string(Value{1e-7}), "0.0000001");
    EXPECT_EQ(to_string(Value{-2.5e-3}), "-0.0025");
    EXPECT_EQ(to_int64(Value{9.99}), 9);
    EXPECT_EQ(to_int64(Value{-9.99}), -9);
    EXPECT_TRUE(to_bool(Value{0.25}));
    EXPECT_FALSE(to_bool(Value{0.0}));
}

TEST(ValueCoercionTest, Nil) {
    Value nil;
    EXPECT_EQ(to_string(nil), "");
    EXPECT_FALSE(to_bool(nil));
    EXPECT_EQ(to_int64(nil), 0);
}

TEST(ValueCoercionTest, IntNarrowingOutOfRange) {
    Work work(Params{{"big", std::int64_t{1} << 40}});
    EXPECT_EQ(work.get_int("big"), 0);
    EXPECT_EQ(work.get_string("big"), "1099511627776");
}
