#include <gtest/gtest.h>

#include "markdd/hotkeys.hpp"
#include "markdd/commands/markdd_edit.hpp"

#include <string>

namespace cmds = markdd::commands::edit;

namespace
{

class Hotkeys : public ::testing::Test
{
protected:
    void SetUp() override
    {
        markdd::hotkeys::init();
        ASSERT_TRUE(markdd::hotkeys::selectScheme("linux"));
    }
};

std::string displayFor(std::string_view scheme, std::uint16_t command)
{
    for (const auto &binding : markdd::hotkeys::schemeBindings(scheme))
    {
        if (binding.command == command)
            return binding.display;
    }
    return {};
}

void disposeMenu(TMenuItem *item)
{
    while (item)
    {
        TMenuItem *next = item->next;
        delete item;
        item = next;
    }
}

} // namespace

TEST_F(Hotkeys, AutoResolvesToThePlatformScheme)
{
#if defined(__APPLE__)
    EXPECT_EQ("mac", markdd::hotkeys::resolveScheme("auto"));
#else
    EXPECT_EQ("linux", markdd::hotkeys::resolveScheme("auto"));
#endif
    EXPECT_EQ("mac", markdd::hotkeys::resolveScheme("mac"));
    EXPECT_EQ(markdd::hotkeys::resolveScheme("auto"), markdd::hotkeys::resolveScheme(""));
}

TEST_F(Hotkeys, UnknownSchemeKeepsTheActiveOne)
{
    EXPECT_FALSE(markdd::hotkeys::selectScheme("emacs"));
    EXPECT_EQ("linux", markdd::hotkeys::activeScheme());
    EXPECT_TRUE(markdd::hotkeys::selectScheme("mac"));
    EXPECT_EQ("mac", markdd::hotkeys::activeScheme());
}

TEST_F(Hotkeys, LookupReturnsFormattingBinding)
{
    const auto *binding = markdd::hotkeys::lookup(cmds::cmBold);
    ASSERT_NE(nullptr, binding);
    EXPECT_NE(0, binding->key.code);
    EXPECT_EQ("Alt-B", binding->display);
    EXPECT_EQ("~Alt-B~ Bold", markdd::hotkeys::statusLabel(cmds::cmBold, "Bold"));

    EXPECT_EQ(nullptr, markdd::hotkeys::lookup(cmds::cmDocumentStats));
    EXPECT_EQ("Stats", markdd::hotkeys::statusLabel(cmds::cmDocumentStats, "Stats"));
}

TEST_F(Hotkeys, SchemesDifferOnPlatformConventions)
{
    EXPECT_EQ("Alt-X", displayFor("linux", cmQuit));
    EXPECT_EQ("Ctrl-Q", displayFor("mac", cmQuit));
    EXPECT_EQ("Alt-U", displayFor("linux", cmds::cmSuperscript));
    EXPECT_TRUE(displayFor("mac", cmds::cmSuperscript).empty());
    EXPECT_TRUE(markdd::hotkeys::schemeBindings("missing").empty());

    auto schemes = markdd::hotkeys::availableSchemes();
    ASSERT_GE(schemes.size(), 3u);
    EXPECT_EQ("auto", schemes[0].first);
    EXPECT_EQ("linux", schemes[1].first);
    EXPECT_EQ("mac", schemes[2].first);
}

TEST_F(Hotkeys, CommandLabelsProvideDisplayNames)
{
    EXPECT_EQ("Bold", markdd::hotkeys::commandLabel(cmds::cmBold));
    EXPECT_EQ("Quit", markdd::hotkeys::commandLabel(cmQuit));
    EXPECT_EQ("Keyboard Shortcut", markdd::hotkeys::commandLabel(cmds::cmInsertKeyboardShortcut));
    EXPECT_TRUE(markdd::hotkeys::commandLabel(0).empty());
}

TEST_F(Hotkeys, MenuTreeFollowsASchemeSwitch)
{
    TMenuItem &levels = *new TMenuItem("Heading ~1", cmds::cmHeading1, kbNoKey);
    TMenuItem *root = new TMenuItem("~B~old", cmds::cmBold, kbNoKey);
    root->next = new TMenuItem("~H~eadings", kbNoKey, new TMenu(levels), hcNoContext);

    markdd::hotkeys::configureMenuTree(*root);
    EXPECT_STREQ("Alt-B", root->param);
    EXPECT_STREQ("Alt-1", levels.param);

    ASSERT_TRUE(markdd::hotkeys::selectScheme("mac"));
    markdd::hotkeys::configureMenuTree(*root);
    EXPECT_STREQ("Ctrl-B", root->param);
    EXPECT_STREQ("Ctrl-1", levels.param);

    // A scheme without a Bold binding clears the shortcut from the menu.
    const markdd::hotkeys::KeyBinding unbound[] = {{cmds::cmHeading1, TKey(kbNoKey), ""}};
    const markdd::hotkeys::Scheme bare[] = {{"bare", "Bare", unbound}};
    markdd::hotkeys::registerSchemes(bare);
    ASSERT_TRUE(markdd::hotkeys::selectScheme("bare"));
    markdd::hotkeys::configureMenuTree(*root);
    EXPECT_EQ(nullptr, root->param);
    EXPECT_EQ(TKey(kbNoKey), root->keyCode);

    disposeMenu(root);
}

TEST(HotkeysCommandLine, SchemeArgumentIsRemoved)
{
    int argc = 4;
    char arg0[] = "markdd-edit";
    char arg1[] = "--hotkeys=mac";
    char arg2[] = "notes.md";
    char arg3[] = "todo.md";
    char *argv[] = {arg0, arg1, arg2, arg3, nullptr};

    auto scheme = markdd::hotkeys::takeCommandLineScheme(argc, argv);
    ASSERT_TRUE(scheme.has_value());
    EXPECT_EQ("mac", *scheme);
    EXPECT_EQ(3, argc);
    EXPECT_STREQ("notes.md", argv[1]);
    EXPECT_STREQ("todo.md", argv[2]);
    EXPECT_EQ(nullptr, argv[3]);
}

TEST(HotkeysCommandLine, SeparateValueIsConsumed)
{
    int argc = 3;
    char arg0[] = "markdd-edit";
    char arg1[] = "--hotkeys";
    char arg2[] = "linux";
    char *argv[] = {arg0, arg1, arg2, nullptr};

    EXPECT_EQ("linux", markdd::hotkeys::takeCommandLineScheme(argc, argv).value_or(""));
    EXPECT_EQ(1, argc);
}

TEST(HotkeysCommandLine, NoSchemeLeavesArgumentsAlone)
{
    int argc = 2;
    char arg0[] = "markdd-edit";
    char arg1[] = "notes.md";
    char *argv[] = {arg0, arg1, nullptr};

    EXPECT_FALSE(markdd::hotkeys::takeCommandLineScheme(argc, argv).has_value());
    EXPECT_EQ(2, argc);
}
