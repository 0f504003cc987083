#include <gtest/gtest.h>

#include "markdd/settings.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using markdd::config::Setting;
using markdd::config::SettingKind;
using markdd::config::SettingsStore;

namespace
{

std::filesystem::path scratchFile(const std::string &name)
{
    auto path = std::filesystem::temp_directory_path() / "markdd_settings_tests" / name;
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path;
}

void defineSample(SettingsStore &store)
{
    store.define({"wrap", SettingKind::Toggle, true, "Wrap long lines."});
    store.define({"width", SettingKind::Number, 80, "Wrap column.", 20, 200});
    store.define({"theme", SettingKind::Choice, "dark", "Colour theme.", 0, 0, {"dark", "light"}});
}

} // namespace

TEST(SettingsStore, FallbacksApplyUntilSet)
{
    SettingsStore store("sample", scratchFile("fallbacks.json"));
    defineSample(store);

    EXPECT_TRUE(store.toggle("wrap"));
    EXPECT_EQ(store.number("width"), 80);
    EXPECT_EQ(store.choice("theme"), "dark");
    EXPECT_EQ(store.text("width"), "80");
    EXPECT_EQ(store.number("missing"), 0);
}

TEST(SettingsStore, RejectsValuesOfTheWrongKind)
{
    SettingsStore store("sample", scratchFile("kinds.json"));
    defineSample(store);

    EXPECT_FALSE(store.set("wrap", 1));
    EXPECT_FALSE(store.set("width", "wide"));
    EXPECT_FALSE(store.set("theme", "sepia"));
    EXPECT_FALSE(store.set("missing", true));
    EXPECT_TRUE(store.toggle("wrap"));
    EXPECT_EQ(store.choice("theme"), "dark");
}

TEST(SettingsStore, NumbersAreClampedAndChoicesLowercased)
{
    SettingsStore store("sample", scratchFile("clamp.json"));
    defineSample(store);

    EXPECT_TRUE(store.set("width", 5000));
    EXPECT_EQ(store.number("width"), 200);
    EXPECT_TRUE(store.set("theme", "LIGHT"));
    EXPECT_EQ(store.choice("theme"), "light");
}

TEST(SettingsStore, AssignmentsParseCommandLineText)
{
    SettingsStore store("sample", scratchFile("assign.json"));
    defineSample(store);

    EXPECT_TRUE(store.assign("wrap=off"));
    EXPECT_FALSE(store.toggle("wrap"));
    EXPECT_TRUE(store.assign("width=120"));
    EXPECT_EQ(store.number("width"), 120);

    EXPECT_FALSE(store.assign("width=12x"));
    EXPECT_FALSE(store.assign("wrap=maybe"));
    EXPECT_FALSE(store.assign("nothing"));
    EXPECT_FALSE(store.assign("unknown=1"));
    EXPECT_EQ(store.number("width"), 120);
}

TEST(SettingsStore, SavedValuesLoadIntoAFreshStore)
{
    auto path = scratchFile("saved.json");
    {
        SettingsStore store("sample", path);
        defineSample(store);
        store.set("wrap", false);
        store.set("theme", "light");
        ASSERT_TRUE(store.save());
    }

    SettingsStore reloaded("sample", path);
    defineSample(reloaded);
    EXPECT_TRUE(reloaded.load());
    EXPECT_FALSE(reloaded.toggle("wrap"));
    EXPECT_EQ(reloaded.choice("theme"), "light");
    EXPECT_EQ(reloaded.number("width"), 80);
}

TEST(SettingsStore, MissingFileIsNotAnError)
{
    SettingsStore store("sample", scratchFile("absent.json"));
    defineSample(store);
    EXPECT_TRUE(store.load());
    EXPECT_TRUE(store.toggle("wrap"));
}

TEST(SettingsStore, MalformedFileKeepsFallbacks)
{
    auto path = scratchFile("broken.json");
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << "{ \"wrap\": false, ";

    SettingsStore store("sample", path);
    defineSample(store);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.toggle("wrap"));
}

TEST(SettingsStore, UnfitEntriesInAFileAreSkipped)
{
    auto path = scratchFile("mixed.json");
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << R"({"wrap": "yes", "width": 40, "stale": 3})";

    SettingsStore store("sample", path);
    defineSample(store);
    EXPECT_TRUE(store.load());
    EXPECT_TRUE(store.toggle("wrap"));
    EXPECT_EQ(store.number("width"), 40);
}

TEST(SettingsStore, DefaultPathIsPerApplication)
{
    SettingsStore store("markdd-edit");
    EXPECT_EQ(store.path().filename(), "settings.json");
    EXPECT_EQ(store.path().parent_path().filename(), "markdd-edit");
    EXPECT_EQ(store.path().parent_path().parent_path(), markdd::config::configRoot());
}

TEST(SettingsStore, ParsesToggleSpellings)
{
    Setting toggle{"t", SettingKind::Toggle, false, ""};
    EXPECT_EQ(markdd::config::parseSettingText(toggle, "Yes").value_or(nullptr), nlohmann::json(true));
    EXPECT_EQ(markdd::config::parseSettingText(toggle, "0").value_or(nullptr), nlohmann::json(false));
    EXPECT_FALSE(markdd::config::parseSettingText(toggle, "").has_value());
}
