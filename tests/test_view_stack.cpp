#include <gtest/gtest.h>

#include "ViewStack.hpp"

TEST(ViewStack, PushThenPopRestoresThePreviousView)
{
    ViewStack views;
    views.pushView(ViewMode::Detail);
    views.pushView(ViewMode::DetailRaw);
    EXPECT_EQ(views.current(), ViewMode::DetailRaw);
    EXPECT_EQ(views.depth(), 2u);

    EXPECT_TRUE(views.popView());
    EXPECT_EQ(views.current(), ViewMode::Detail);
    EXPECT_TRUE(views.popView());
    EXPECT_EQ(views.current(), ViewMode::Entries);
}

TEST(ViewStack, PopOnEmptyStackKeepsTheCurrentView)
{
    ViewStack views(ViewMode::MetricsDashboard);
    EXPECT_FALSE(views.popView());
    EXPECT_EQ(views.current(), ViewMode::MetricsDashboard);
    EXPECT_EQ(views.depth(), 0u);
}

TEST(ViewStack, PeekShowsTheViewBelowAnOverlay)
{
    ViewStack views;
    EXPECT_EQ(views.peek(), ViewMode::Entries);

    views.pushView(ViewMode::Detail);
    views.pushView(ViewMode::ErrorModal);
    EXPECT_EQ(views.peek(), ViewMode::Detail);
    EXPECT_EQ(views.current(), ViewMode::ErrorModal);
}

TEST(ViewStack, SetBaseDropsHistory)
{
    ViewStack views;
    views.pushView(ViewMode::Detail);
    views.pushView(ViewMode::Help);

    views.setBase(ViewMode::TransactionNames);
    EXPECT_EQ(views.current(), ViewMode::TransactionNames);
    EXPECT_EQ(views.depth(), 0u);
    EXPECT_FALSE(views.popView());
}

TEST(ViewStack, ClearKeepsCurrent)
{
    ViewStack views;
    views.pushView(ViewMode::Fields);
    views.clear();
    EXPECT_EQ(views.current(), ViewMode::Fields);
    EXPECT_EQ(views.depth(), 0u);
}

TEST(ViewStack, ViewClasses)
{
    EXPECT_TRUE(isBaseView(ViewMode::Entries));
    EXPECT_TRUE(isBaseView(ViewMode::Chat));
    EXPECT_FALSE(isBaseView(ViewMode::Detail));

    EXPECT_TRUE(isOverlayView(ViewMode::ErrorModal));
    EXPECT_TRUE(isOverlayView(ViewMode::Search));
    EXPECT_FALSE(isOverlayView(ViewMode::Fields));

    EXPECT_TRUE(isTextInputView(ViewMode::Search));
    EXPECT_TRUE(isTextInputView(ViewMode::IndexPicker));
    EXPECT_FALSE(isTextInputView(ViewMode::Help));
}
