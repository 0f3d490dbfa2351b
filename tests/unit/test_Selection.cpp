#include <gtest/gtest.h>

#include "placement/Selection.hpp"
#include "util/errors.hpp"

using namespace uc::placement;

TEST(SelectionTest, ParsesCommaSeparatedIndices) {
    const auto sel = parseSelection(" 3, 1 ,2", 3);
    EXPECT_FALSE(sel.skip);
    EXPECT_EQ(sel.indices, (std::vector<std::size_t>{1, 2, 3}));
}

TEST(SelectionTest, RepeatedIndicesAreKept) {
    EXPECT_EQ(parseSelection("2,2,1", 2).indices, (std::vector<std::size_t>{1, 2, 2}));
}

TEST(SelectionTest, ZeroAnywhereMeansSkip) {
    EXPECT_TRUE(parseSelection("0", 2).skip);
    EXPECT_TRUE(parseSelection("1,0", 2).skip);
    EXPECT_TRUE(parseSelection("5, 0, x", 2).skip);
}

TEST(SelectionTest, OutOfRangeIsRejected) {
    EXPECT_THROW(parseSelection("3", 2), uc::ValidationError);
    EXPECT_THROW(parseSelection("1,3", 2), uc::ValidationError);
}

TEST(SelectionTest, MalformedIsRejected) {
    EXPECT_THROW(parseSelection("", 2), uc::ValidationError);
    EXPECT_THROW(parseSelection("a", 2), uc::ValidationError);
    EXPECT_THROW(parseSelection("1,", 2), uc::ValidationError);
    EXPECT_THROW(parseSelection("-1", 2), uc::ValidationError);
    EXPECT_THROW(parseSelection("1.5", 2), uc::ValidationError);
}

TEST(SelectionTest, ErrorNamesTheValidRange) {
    try {
        parseSelection("7", 4);
        FAIL() << "expected ValidationError";
    } catch (const uc::ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid preferences. Please select indices where 0 <= index <= 4");
    }
}
