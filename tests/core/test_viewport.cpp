#include "beadview/core/viewport.hpp"
#include <gtest/gtest.h>

namespace beadview {

TEST(ViewportTest, JumpFarDownKeepsCursorVisible)
{
    auto scroll = ensure_visible(5, 0, 100, 10);
    EXPECT_EQ(scroll, 0);

    scroll = ensure_visible(95, scroll, 100, 10);

    EXPECT_LE(scroll, 95);
    EXPECT_LE(95, scroll + 9);
    EXPECT_LE(scroll, 90);
}

TEST(ViewportTest, MovingAboveViewScrollsUp)
{
    EXPECT_EQ(ensure_visible(3, 20, 100, 10), 3);
}

TEST(ViewportTest, CursorInsideViewKeepsScroll)
{
    EXPECT_EQ(ensure_visible(25, 20, 100, 10), 20);
}

TEST(ViewportTest, ScrollIsClampedToListEnd)
{
    EXPECT_EQ(ensure_visible(99, 95, 100, 10), 90);
    EXPECT_EQ(ensure_visible(2, 7, 5, 10), 0);
}

TEST(ViewportTest, ZeroHeightActsAsOneRow)
{
    EXPECT_EQ(ensure_visible(4, 0, 10, 0), 4);
}

TEST(ViewportTest, ClampCursor)
{
    EXPECT_EQ(clamp_cursor(10, 3), 2);
    EXPECT_EQ(clamp_cursor(1, 3), 1);
    EXPECT_EQ(clamp_cursor(5, 0), 0);
}

} // namespace beadview
