/**
 * @file test_whiptail_prompt.cpp
 * @date 2025
 */

#include "ctforge/ui/whiptail_prompt.hpp"

#include <gtest/gtest.h>

using namespace ctforge;

TEST(WhiptailPromptTest, RadiolistArguments) {
    core::StorageMenu menu;
    menu.width = 38;
    menu.rows = {{"local", "  Type: dir        Free:    50.00GB "},
                 {"local-zfs", "  Type: zfspool    Free:   200.00GB "}};

    auto args = ui::BuildWhiptailArgs(menu);

    ASSERT_EQ(8u + 6u, args.size());
    EXPECT_EQ("whiptail", args[0]);
    EXPECT_EQ("--radiolist", args[3]);
    EXPECT_EQ("16", args[5]);
    EXPECT_EQ(std::to_string(38 + ui::kWhiptailFrameWidth), args[6]);
    EXPECT_EQ("6", args[7]);

    EXPECT_EQ("local", args[8]);
    EXPECT_EQ(menu.rows[0].label, args[9]);
    EXPECT_EQ("OFF", args[10]);
    EXPECT_EQ("local-zfs", args[11]);
    EXPECT_EQ("OFF", args[13]);
}
