#include "cdb/core/types.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace cdb;

TEST(Latin1Str, AsciiDecodesUnchanged)
{
    auto s = Latin1Str::from("Brick Fury");
    EXPECT_EQ(s.size(), 10u);
    EXPECT_EQ(s.decode(), "Brick Fury");
    EXPECT_EQ(s.view(), "Brick Fury");
}

TEST(Latin1Str, HighBytesDecodeToTwoByteUtf8)
{
    // "Caf\xe9" in Latin-1 is "Café"
    const std::string raw("Caf\xe9");
    auto s = Latin1Str::from(raw);
    EXPECT_EQ(s.size(), 4u);
    EXPECT_EQ(s.decode(), "Caf\xc3\xa9");

    const std::string all_high("\xff\x80");
    EXPECT_EQ(Latin1Str::from(all_high).decode(), "\xc3\xbf\xc2\x80");
}

TEST(Latin1Str, EmptyIsDistinctFromDefault)
{
    Latin1Str none;
    auto empty = Latin1Str::from("");
    EXPECT_TRUE(none.empty());
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.decode(), "");
}

TEST(Latin1Str, ComparesByContent)
{
    const std::string a("Widget");
    const std::string b("Widget");
    EXPECT_EQ(Latin1Str::from(a), Latin1Str::from(b));
    EXPECT_NE(Latin1Str::from(a), Latin1Str::from("Widgets"));
    EXPECT_NE(Latin1Str::from(""), Latin1Str::from("x"));
}

TEST(Latin1Str, StreamsDecodedText)
{
    std::ostringstream oss;
    oss << Latin1Str::from("na\xefve");
    EXPECT_EQ(oss.str(), "na\xc3\xafve");
}
