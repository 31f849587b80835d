#include <gtest/gtest.h>

#include <gmshim/Value.hpp>

using namespace gmshim;

TEST(ValueTest, StringifyInteger) {
    EXPECT_EQ(stringify(Value{50L}), "50");
    EXPECT_EQ(stringify(Value{-3L}), "-3");
}

TEST(ValueTest, StringifySymbol) {
    EXPECT_EQ(stringify(Value{Symbol("center")}), "center");
}

TEST(ValueTest, StringifyBytes) {
    EXPECT_EQ(stringify(Value{Bytes{'a', '.', 'j', 'p', 'g'}}), "a.jpg");
    EXPECT_EQ(stringify(Value{Bytes{}}), "");
}

TEST(ValueTest, StringifyText) {
    EXPECT_EQ(stringify(Value{std::string("my file.png")}), "my file.png");
}

TEST(ValueTest, SymbolCompare) {
    EXPECT_EQ(Symbol("width"), Symbol("width"));
    EXPECT_LT(Symbol("height"), Symbol("width"));
    EXPECT_TRUE(Symbol("width") == std::string_view("width"));
}
