#include <gtest/gtest.h>

#include "keymap.hpp"

TEST(Keymap, Bindings)
{
    EXPECT_EQ(getAction("up"), Action::ScrollUp);
    EXPECT_EQ(getAction("k"), Action::ScrollUp);
    EXPECT_EQ(getAction("j"), Action::ScrollDown);
    EXPECT_EQ(getAction("G"), Action::GoBottom);
    EXPECT_EQ(getAction("?"), Action::Help);
    EXPECT_EQ(getAction("h"), Action::Help);
    EXPECT_EQ(getAction("/"), Action::Search);
    EXPECT_EQ(getAction("space"), Action::Toggle);
    EXPECT_EQ(getAction("esc"), Action::Back);
    EXPECT_EQ(getAction("x"), Action::None);
    EXPECT_EQ(getAction(""), Action::None);
}

TEST(Keymap, ListNavStepsAndStopsAtTheEnds)
{
    EXPECT_EQ(listNav(3, 10, "up"), 2);
    EXPECT_EQ(listNav(0, 10, "up"), 0);
    EXPECT_EQ(listNav(3, 10, "down"), 4);
    EXPECT_EQ(listNav(9, 10, "down"), 9);
    EXPECT_EQ(listNav(5, 10, "g"), 0);
    EXPECT_EQ(listNav(5, 10, "home"), 0);
    EXPECT_EQ(listNav(5, 10, "G"), 9);
    EXPECT_EQ(listNav(5, 10, "end"), 9);
}

TEST(Keymap, ListNavPages)
{
    EXPECT_EQ(listNav(15, 40, "pgup"), 5);
    EXPECT_EQ(listNav(4, 40, "pgup"), 0);
    EXPECT_EQ(listNav(15, 40, "pgdown"), 25);
    EXPECT_EQ(listNav(35, 40, "pgdown"), 39);
}

TEST(Keymap, ListNavOnEmptyList)
{
    EXPECT_EQ(listNav(0, 0, "G"), 0);
    EXPECT_EQ(listNav(0, 0, "down"), 0);
    EXPECT_EQ(listNav(0, 0, "up"), 0);
}

TEST(Keymap, ListNavIgnoresOtherKeys)
{
    EXPECT_EQ(listNav(3, 10, "enter"), -1);
    EXPECT_EQ(listNav(3, 10, "left"), -1);
    EXPECT_EQ(listNav(3, 10, "z"), -1);
}

TEST(Keymap, NavKeys)
{
    EXPECT_TRUE(isNavKey("down"));
    EXPECT_TRUE(isNavKey("pgup"));
    EXPECT_TRUE(isNavKey("G"));
    EXPECT_FALSE(isNavKey("left"));
    EXPECT_FALSE(isNavKey("enter"));
    EXPECT_FALSE(isNavKey("q"));

    EXPECT_TRUE(isNavAction(Action::NextItem));
    EXPECT_FALSE(isListNavAction(Action::NextItem));
}

TEST(Keymap, HelpListsEveryGroup)
{
    const auto groups = helpGroups();
    ASSERT_FALSE(groups.empty());
    EXPECT_EQ(groups.front().title, "Navigation");
    for (const auto& g : groups)
        EXPECT_FALSE(g.hints.empty()) << g.title;
}
