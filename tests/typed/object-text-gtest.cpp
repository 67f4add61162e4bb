#include "cdb/typed/object-text.h"
#include <gtest/gtest.h>
#include <optional>

using namespace cdb;
using namespace cdb::typed;

namespace {
std::optional<Latin1Str>
t(const char* s)
{
    return Latin1Str::from(s);
}
}  // namespace

TEST(ObjectTitle, EqualNamesCollapse)
{
    EXPECT_EQ(
        format_object_title(5, t("Widget"), t("Widget")), "Widget | Object #5");
}

TEST(ObjectTitle, EmptyNameCountsAsAbsent)
{
    EXPECT_EQ(
        format_object_title(5, t(""), t("Big Widget")),
        "Big Widget | Object #5");
    EXPECT_EQ(
        format_object_title(5, t("Widget"), t("")), "Widget | Object #5");
}

TEST(ObjectTitle, DifferentNamesShowBoth)
{
    EXPECT_EQ(
        format_object_title(5, t("Widget"), t("Big Widget")),
        "Big Widget (Widget) | Object #5");
}

TEST(ObjectTitle, OnlyOneName)
{
    EXPECT_EQ(
        format_object_title(12, t("Widget"), std::nullopt),
        "Widget | Object #12");
    EXPECT_EQ(
        format_object_title(12, std::nullopt, t("Shown")),
        "Shown | Object #12");
}

TEST(ObjectTitle, NoNames)
{
    EXPECT_EQ(format_object_title(9, std::nullopt, std::nullopt), "Object #9");
    EXPECT_EQ(format_object_title(9, t(""), t("")), "Object #9");
    EXPECT_EQ(
        format_object_title(-1, std::nullopt, std::nullopt), "Object #-1");
}

TEST(ObjectTitle, Latin1IsDecoded)
{
    EXPECT_EQ(
        format_object_title(1, t("Caf\xe9"), std::nullopt),
        "Caf\xc3\xa9 | Object #1");
}

TEST(ObjectDescription, EqualValuesCollapse)
{
    EXPECT_EQ(format_object_description(t("A box."), t("A box.")), "A box.");
}

TEST(ObjectDescription, EmptyDescriptionFallsBackToNotes)
{
    EXPECT_EQ(
        format_object_description(t(""), t("debug only")), "debug only");
    EXPECT_EQ(
        format_object_description(std::nullopt, t("debug only")),
        "debug only");
}

TEST(ObjectDescription, BothDifferent)
{
    EXPECT_EQ(
        format_object_description(t("A box."), t("unused")),
        "A box. (unused)");
}

TEST(ObjectDescription, OnlyDescription)
{
    EXPECT_EQ(format_object_description(t("A box."), t("")), "A box.");
    EXPECT_EQ(
        format_object_description(t("A box."), std::nullopt), "A box.");
}

TEST(ObjectDescription, NeitherIsEmpty)
{
    EXPECT_EQ(format_object_description(std::nullopt, std::nullopt), "");
    EXPECT_EQ(format_object_description(t(""), t("")), "");
}
