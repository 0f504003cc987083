#include <gtest/gtest.h>

#include "markdd/core/formatting_engine.hpp"

#include <string>

using markdd::core::EditInstruction;
using markdd::core::InlineStyle;
using markdd::core::SelectionRange;

namespace
{

std::string applied(const std::string &content, const EditInstruction &instruction)
{
    std::string result = content;
    result.replace(instruction.replace.start, instruction.replace.length(), instruction.text);
    return result;
}

} // namespace

TEST(FormattingEngine, DetectsListMarkers)
{
    auto bullet = markdd::core::detectListMarker("  - item");
    ASSERT_TRUE(bullet.has_value());
    EXPECT_EQ(bullet->indent, "  ");
    EXPECT_EQ(bullet->token, "-");
    EXPECT_FALSE(bullet->ordered);

    auto numbered = markdd::core::detectListMarker("12. item");
    ASSERT_TRUE(numbered.has_value());
    EXPECT_TRUE(numbered->ordered);
    EXPECT_EQ(numbered->token, "12.");

    auto task = markdd::core::detectListMarker("- [x] done");
    ASSERT_TRUE(task.has_value());
    EXPECT_TRUE(task->task);
    EXPECT_EQ(task->length, 6u);

    EXPECT_FALSE(markdd::core::detectListMarker("-item").has_value());
    EXPECT_FALSE(markdd::core::detectListMarker("1.item").has_value());
    EXPECT_FALSE(markdd::core::detectListMarker("plain text").has_value());
}

TEST(FormattingEngine, ListMarkerMayBeFollowedByATab)
{
    std::string content = "-\tfoo";
    auto instruction = markdd::core::planEnter(content, SelectionRange::caret(content.size()));
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(instruction->text, "\n- ");
}

TEST(FormattingEngine, TabAtCaretInsertsFourSpaces)
{
    auto instruction = markdd::core::planTab("ab", SelectionRange::caret(1));
    EXPECT_EQ(applied("ab", instruction), "a    b");
    EXPECT_EQ(instruction.selection, SelectionRange::caret(5));
}

TEST(FormattingEngine, TabIndentsEverySelectedLine)
{
    std::string content = "a\nb\nc";
    auto instruction = markdd::core::planTab(content, SelectionRange{0, content.size()});
    std::string result = applied(content, instruction);
    EXPECT_EQ(result, "    a\n    b\n    c");
    EXPECT_EQ(instruction.selection, (SelectionRange{0, result.size()}));
}

TEST(FormattingEngine, TabSkipsTheLineAfterATrailingNewline)
{
    std::string content = "a\nb\nc";
    auto instruction = markdd::core::planTab(content, SelectionRange{0, 4});
    EXPECT_EQ(applied(content, instruction), "    a\n    b\nc");
}

TEST(FormattingEngine, OutdentRemovesLeadingIndentation)
{
    std::string content = "      a\n\tb\nc";
    auto instruction = markdd::core::planOutdent(content, SelectionRange{0, content.size()});
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(applied(content, *instruction), "  a\nb\nc");

    EXPECT_FALSE(markdd::core::planOutdent("plain", SelectionRange::caret(2)).has_value());
}

TEST(FormattingEngine, EnterContinuesNumberedLists)
{
    std::string content = "1. item";
    auto instruction = markdd::core::planEnter(content, SelectionRange::caret(content.size()));
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(applied(content, *instruction), "1. item\n2. ");
    EXPECT_EQ(instruction->selection, SelectionRange::caret(11));

    std::string carry = "99. item";
    auto next = markdd::core::planEnter(carry, SelectionRange::caret(carry.size()));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->text, "\n100. ");
}

TEST(FormattingEngine, EnterContinuesBulletsWithIndent)
{
    std::string content = "  * item";
    auto instruction = markdd::core::planEnter(content, SelectionRange::caret(content.size()));
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(instruction->text, "\n  * ");
}

TEST(FormattingEngine, EnterContinuesTaskItemsUnchecked)
{
    std::string content = "- [x] done";
    auto instruction = markdd::core::planEnter(content, SelectionRange::caret(content.size()));
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(instruction->text, "\n- [ ] ");
}

TEST(FormattingEngine, EnterOnEmptyItemEndsTheList)
{
    std::string content = "- a\n- ";
    auto instruction = markdd::core::planEnter(content, SelectionRange::caret(content.size()));
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(applied(content, *instruction), "- a\n");
    EXPECT_EQ(instruction->selection, SelectionRange::caret(4));

    std::string first = "1. ";
    auto cleared = markdd::core::planEnter(first, SelectionRange::caret(first.size()));
    ASSERT_TRUE(cleared.has_value());
    EXPECT_EQ(applied(first, *cleared), "");
}

TEST(FormattingEngine, EnterPreservesPlainIndentation)
{
    std::string content = "    code";
    auto instruction = markdd::core::planEnter(content, SelectionRange::caret(content.size()));
    ASSERT_TRUE(instruction.has_value());
    EXPECT_EQ(instruction->text, "\n    ");

    EXPECT_FALSE(markdd::core::planEnter("plain", SelectionRange::caret(5)).has_value());
}

TEST(FormattingEngine, InlineToggleIsAnInvolution)
{
    std::string content = "say hello now";
    SelectionRange word{4, 9};

    auto on = markdd::core::planInlineToggle(content, word, InlineStyle::Bold);
    std::string bold = applied(content, on);
    EXPECT_EQ(bold, "say **hello** now");
    EXPECT_EQ(on.selection, (SelectionRange{4, 13}));

    auto off = markdd::core::planInlineToggle(bold, on.selection, InlineStyle::Bold);
    EXPECT_EQ(applied(bold, off), content);
    EXPECT_EQ(off.selection, word);
}

TEST(FormattingEngine, ItalicDoesNotStripBoldMarkers)
{
    std::string content = "**x**";
    auto instruction = markdd::core::planInlineToggle(content, SelectionRange{0, content.size()}, InlineStyle::Italic);
    EXPECT_EQ(applied(content, instruction), "***x***");

    std::string italic = "*x*";
    auto stripped = markdd::core::planInlineToggle(italic, SelectionRange{0, italic.size()}, InlineStyle::Italic);
    EXPECT_EQ(applied(italic, stripped), "x");
}

TEST(FormattingEngine, SubscriptDoesNotStripStrikethroughMarkers)
{
    std::string content = "~~x~~";
    auto wrapped = markdd::core::planInlineToggle(content, SelectionRange{0, content.size()}, InlineStyle::Subscript);
    EXPECT_EQ(applied(content, wrapped), "~~~x~~~");

    std::string subscript = "H~2~O";
    auto stripped = markdd::core::planInlineToggle(subscript, SelectionRange{1, 4}, InlineStyle::Subscript);
    EXPECT_EQ(applied(subscript, stripped), "H2O");
    EXPECT_EQ(stripped.selection, (SelectionRange{1, 2}));
}

TEST(FormattingEngine, SuperscriptTogglesCaretMarkers)
{
    std::string content = "x2";
    auto on = markdd::core::planInlineToggle(content, SelectionRange{1, 2}, InlineStyle::Superscript);
    std::string raised = applied(content, on);
    EXPECT_EQ(raised, "x^2^");

    auto off = markdd::core::planInlineToggle(raised, on.selection, InlineStyle::Superscript);
    EXPECT_EQ(applied(raised, off), content);

    auto placeholder = markdd::core::planInlineToggle("", SelectionRange::caret(0), InlineStyle::Superscript);
    EXPECT_EQ(placeholder.text, "^superscript^");
}

TEST(FormattingEngine, KeyboardShortcutWrapsInDoubleBrackets)
{
    auto wrapped = markdd::core::planKeyboardShortcut("Ctrl+S", SelectionRange{0, 6});
    EXPECT_EQ(wrapped.text, "[[Ctrl+S]]");
    EXPECT_EQ(wrapped.selection, (SelectionRange{0, 10}));

    auto placeholder = markdd::core::planKeyboardShortcut("", SelectionRange::caret(0));
    EXPECT_EQ(placeholder.text, "[[Ctrl+Key]]");
    EXPECT_EQ(placeholder.selection, SelectionRange::caret(12));
}

TEST(FormattingEngine, BareMarkerSelectionTogglesBackAndForth)
{
    std::string content = "**";
    auto on = markdd::core::planInlineToggle(content, SelectionRange{0, 2}, InlineStyle::Bold);
    std::string wrapped = applied(content, on);
    EXPECT_EQ(wrapped, "******");

    auto off = markdd::core::planInlineToggle(wrapped, on.selection, InlineStyle::Bold);
    EXPECT_EQ(applied(wrapped, off), "**");
}

TEST(FormattingEngine, InlineToggleWithoutSelectionInsertsPlaceholder)
{
    auto instruction = markdd::core::planInlineToggle("", SelectionRange::caret(0), InlineStyle::Strikethrough);
    EXPECT_EQ(instruction.text, "~~strikethrough text~~");
    EXPECT_EQ(instruction.selection, SelectionRange::caret(instruction.text.size()));
}

TEST(FormattingEngine, HeadingStartsOnItsOwnLine)
{
    std::string content = "intro";
    auto instruction = markdd::core::planHeading(content, SelectionRange::caret(5), 2);
    EXPECT_EQ(applied(content, instruction), "intro\n## Heading 2");

    auto wrapped = markdd::core::planHeading("Title", SelectionRange{0, 5}, 9);
    EXPECT_EQ(wrapped.text, "###### Title");
    EXPECT_EQ(wrapped.selection, (SelectionRange{0, 12}));
}

TEST(FormattingEngine, LinkAndImageUseDefaults)
{
    auto link = markdd::core::planLink("docs", SelectionRange{0, 4}, "");
    EXPECT_EQ(link.text, "[docs](https://example.com)");

    auto image = markdd::core::planImage("", SelectionRange::caret(0), "cat.png");
    EXPECT_EQ(image.text, "![image description](cat.png)");

    auto math = markdd::core::planMath("", SelectionRange::caret(0));
    EXPECT_EQ(math.text, "$E = mc^2$");
}

TEST(FormattingEngine, CodeBlockFencesTheSelection)
{
    std::string content = "x = 1";
    auto instruction = markdd::core::planCodeBlock(content, SelectionRange{0, 5}, "python");
    EXPECT_EQ(instruction.text, "```python\nx = 1\n```");
}

TEST(FormattingEngine, TableHasHeaderSeparatorAndBody)
{
    auto instruction = markdd::core::planTable("", SelectionRange::caret(0), 3, 2);
    EXPECT_EQ(instruction.text,
              "| Header 1 | Header 2 |\n"
              "| --- | --- |\n"
              "| Cell 1.1 | Cell 1.2 |\n"
              "| Cell 2.1 | Cell 2.2 |\n");
}

TEST(FormattingEngine, HorizontalRuleIsSeparatedFromText)
{
    std::string content = "text";
    auto instruction = markdd::core::planHorizontalRule(content, SelectionRange::caret(4));
    EXPECT_EQ(applied(content, instruction), "text\n\n---\n");
}
