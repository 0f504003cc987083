#include <gtest/gtest.h>

#include "markdd/core/key_action.hpp"

using markdd::core::HostCommand;
using markdd::core::KeyAction;
using markdd::core::KeyActionKind;
using markdd::core::SelectionRange;

TEST(KeyAction, EnterFallsBackToPlainNewline)
{
    auto plan = markdd::core::planKeyAction("text", SelectionRange::caret(4), KeyAction::of(KeyActionKind::Enter));
    ASSERT_TRUE(plan.edit.has_value());
    EXPECT_EQ(plan.edit->text, "\n");
    EXPECT_EQ(plan.edit->selection, SelectionRange::caret(5));
}

TEST(KeyAction, EnterIgnoresListsWhenContinuationIsOff)
{
    auto plan = markdd::core::planKeyAction("- a", SelectionRange::caret(3), KeyAction::of(KeyActionKind::Enter), false);
    ASSERT_TRUE(plan.edit.has_value());
    EXPECT_EQ(plan.edit->text, "\n");
}

TEST(KeyAction, HostCommandsCarryNoEdit)
{
    auto save = markdd::core::planKeyAction("x", SelectionRange::caret(0), KeyAction::of(KeyActionKind::Save));
    EXPECT_FALSE(save.edit.has_value());
    EXPECT_EQ(save.hostCommand, HostCommand::Save);

    auto find = markdd::core::planKeyAction("x", SelectionRange::caret(0), KeyAction::of(KeyActionKind::Find));
    EXPECT_EQ(find.hostCommand, HostCommand::Find);

    auto undo = markdd::core::planKeyAction("x", SelectionRange::caret(0), KeyAction::of(KeyActionKind::Undo));
    EXPECT_TRUE(undo.historyUndo);
    EXPECT_EQ(undo.hostCommand, HostCommand::None);
}

TEST(KeyAction, PlainInsertReplacesTheSelection)
{
    auto plan = markdd::core::planKeyAction("hello", SelectionRange{1, 4}, KeyAction::insert("EY"));
    ASSERT_TRUE(plan.edit.has_value());
    EXPECT_EQ(plan.edit->replace, (SelectionRange{1, 4}));
    EXPECT_EQ(plan.edit->selection, SelectionRange::caret(3));
}
