#include "cdm/type_widths.hpp"
#include "printers.hpp"
#include "gtest/gtest.h"

using namespace cdm;

namespace {

TEST(TypeWidthsTest, widthsAreSizesInOctets)
{
    for (const DataModel model : all_data_models)
    {
        for (const TypeCategory category : all_type_categories)
        {
            EXPECT_EQ(size_of(model, category) * 8, width_of(model, category))
                << to_string(model) << ", " << to_string(category);
        }
    }
}

TEST(TypeWidthsTest, lp64)
{
    const TypeWidths widths = type_widths(DataModel::LP64);
    EXPECT_EQ(8u, widths.char_width);
    EXPECT_EQ(16u, widths.short_width);
    EXPECT_EQ(32u, widths.int_width);
    EXPECT_EQ(64u, widths.long_width);
    EXPECT_EQ(64u, widths.long_long_width);
    EXPECT_EQ(64u, widths.pointer_width);
}

TEST(TypeWidthsTest, missingTypesHaveZeroWidth)
{
    const TypeWidths widths = type_widths(DataModel::IP16);
    EXPECT_EQ(8u, widths.char_width);
    EXPECT_EQ(0u, widths.short_width);
    EXPECT_EQ(16u, widths.int_width);
    EXPECT_EQ(0u, widths.long_width);
    EXPECT_EQ(0u, widths.long_long_width);
    EXPECT_EQ(16u, widths.pointer_width);
}

TEST(TypeWidthsTest, unknownModelIsAllZero)
{
    EXPECT_EQ(TypeWidths(), type_widths(DataModel::Unknown));
}

TEST(TypeWidthsTest, modelsDifferingInOneTypeDifferInOneWidth)
{
    const TypeWidths ilp64 = type_widths(DataModel::ILP64);
    TypeWidths silp64 = type_widths(DataModel::SILP64);

    EXPECT_NE(ilp64, silp64);
    EXPECT_EQ(64u, silp64.short_width);
    silp64.short_width = ilp64.short_width;
    EXPECT_EQ(ilp64, silp64);
}

} // namespace
