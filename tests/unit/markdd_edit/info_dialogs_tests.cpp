#include <gtest/gtest.h>

#include "markdd/edit/info_dialogs.hpp"
#include "markdd/hotkeys.hpp"

#include <string>

TEST(InfoDialogs, AboutTextListsVersionAndBuild)
{
    std::string text = markdd::edit::aboutText("1.2.3", "Jan  1 2026 12:00:00");

    EXPECT_EQ(text.rfind("MarkDD Edit\n\n", 0), 0u);
    EXPECT_NE(text.find("\n\nVersion: 1.2.3\n\nBuild: Jan  1 2026 12:00:00"), std::string::npos);
}

TEST(InfoDialogs, AboutTextSkipsEmptyFields)
{
    std::string text = markdd::edit::aboutText("", "");

    EXPECT_EQ(text.find("Version:"), std::string::npos);
    EXPECT_EQ(text.find("Build:"), std::string::npos);
}

TEST(InfoDialogs, StatisticsShowCountsAndCursor)
{
    markdd::core::DocumentStats stats{12, 80, 3};
    markdd::core::CursorPosition position{2, 7};

    EXPECT_EQ(markdd::edit::statisticsText(stats, position),
              "Words:      12\nCharacters: 80\nLines:      3\nCursor:     Ln 2, Col 7");
}

TEST(InfoDialogs, HotkeyListFollowsTheScheme)
{
    markdd::hotkeys::init();

    std::string linuxList = markdd::edit::hotkeyListText("linux");
    EXPECT_NE(linuxList.find("Alt-B      Bold\n"), std::string::npos);
    EXPECT_NE(linuxList.find("Alt-X      Quit\n"), std::string::npos);

    std::string macList = markdd::edit::hotkeyListText("mac");
    EXPECT_NE(macList.find("Ctrl-Q     Quit\n"), std::string::npos);
    EXPECT_TRUE(markdd::edit::hotkeyListText("missing").empty());
}
