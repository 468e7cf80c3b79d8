#include <gtest/gtest.h>
#include "editcore/edit/text_edit_core.h"

#include <algorithm>
#include <optional>
#include <random>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace editcore;
using namespace editcore::edit;
using text::TextError;
using text::TextOutcome;
using text::TextPosition;
using text::TextRange;

namespace {

// Clipboard that can refuse writes.
class RecordingClipboard : public Clipboard {
public:
    bool accept = true;
    std::string value;
    int writes = 0;

    bool setText(std::string_view text) override {
        ++writes;
        if (!accept) return false;
        value.assign(text.data(), text.size());
        return true;
    }
    std::string text() const override { return value; }
};

TextRange range(std::size_t startCol, std::size_t endCol, std::size_t line = 0) {
    return TextRange{TextPosition{line, startCol}, TextPosition{line, endCol}};
}

// Spans as (start, end, tag), independent of application order.
std::vector<std::tuple<std::size_t, std::size_t, std::uint32_t>> spanLayout(const TextEditCore& core) {
    std::vector<std::tuple<std::size_t, std::size_t, std::uint32_t>> out;
    for (const style::StyleSpan& span : core.styles()) {
        out.emplace_back(span.range.start, span.range.end, span.tag);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

class TextEditCoreTest : public ::testing::Test {
protected:
    static TextEditCore::Config multiLine() {
        TextEditCore::Config config;
        config.multiLine = true;
        return config;
    }
};

// =============================================================================
// Editing and outcomes
// =============================================================================

TEST_F(TextEditCoreTest, InsertAndMoveReportOutcomes) {
    TextEditCore core;
    EXPECT_EQ(core.store().kind(), text::TextStoreKind::Flat);
    EXPECT_EQ(core.insertText("hello"), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hello");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 5}));

    EXPECT_EQ(core.insertText(""), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::EmptyOperation);

    EXPECT_EQ(core.moveLeft(), TextOutcome::Changed);
    EXPECT_EQ(core.lastError(), TextError::Ok);
    EXPECT_EQ(core.cursor(), (TextPosition{0, 4}));
    EXPECT_EQ(core.moveToLineStart(), TextOutcome::Changed);
    EXPECT_EQ(core.moveToLineStart(), TextOutcome::Unchanged);
    EXPECT_EQ(core.moveLeft(), TextOutcome::Unchanged);
}

TEST_F(TextEditCoreTest, InsertCharEncodesUtf8) {
    TextEditCore core;
    core.insertChar(0x4E2D);
    core.insertChar('!');
    EXPECT_EQ(core.text(), "\xE4\xB8\xAD!");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 2}));
}

TEST_F(TextEditCoreTest, TypingReplacesSelectionAndUndoRestoresIt) {
    TextEditCore core;
    core.insertText("hello");
    ASSERT_EQ(core.setSelection(range(1, 4)), TextOutcome::Changed);
    EXPECT_EQ(core.selectedText(), "ell");
    EXPECT_EQ(core.anchor(), (TextPosition{0, 1}));
    EXPECT_EQ(core.cursor(), (TextPosition{0, 4}));

    EXPECT_EQ(core.insertText("ipp"), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hippo");
    EXPECT_FALSE(core.hasSelection());

    EXPECT_EQ(core.undo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hello");
    EXPECT_EQ(core.anchor(), (TextPosition{0, 1}));
    EXPECT_EQ(core.cursor(), (TextPosition{0, 4}));

    EXPECT_EQ(core.redo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hippo");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 4}));
    EXPECT_EQ(core.redo(), TextOutcome::Unchanged);
}

TEST_F(TextEditCoreTest, InsertedTextIsSeparateUndoSteps) {
    TextEditCore core;
    core.insertText("a");
    core.insertText("b");
    core.undo();
    EXPECT_EQ(core.text(), "a");

    core.beginUndoSequence();
    core.insertText("c");
    core.insertText("d");
    core.endUndoSequence();
    EXPECT_EQ(core.text(), "acd");
    core.undo();
    EXPECT_EQ(core.text(), "a");
    EXPECT_EQ(core.remainingUndo(), 1u);
}

TEST_F(TextEditCoreTest, UndoLimitDropsOldEdits) {
    TextEditCore::Config config;
    config.undoLimit = 2;
    TextEditCore core(config);
    core.insertText("a");
    core.insertText("b");
    core.insertText("c");
    while (core.undo() != TextOutcome::Unchanged) {
    }
    EXPECT_EQ(core.text(), "a");
}

TEST_F(TextEditCoreTest, DeleteCharsByCluster) {
    TextEditCore core;
    core.insertText("xe\xCC\x81y");
    core.moveLeft();
    EXPECT_EQ(core.deletePrevChar(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "xy");
    EXPECT_EQ(core.deleteNextChar(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "x");
    EXPECT_EQ(core.deleteNextChar(), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::EmptyOperation);
}

TEST_F(TextEditCoreTest, DeletePrevWordStopsAtClassChanges) {
    TextEditCore core;
    core.insertText("foo.bar baz");
    core.deletePrevWord();
    EXPECT_EQ(core.text(), "foo.bar ");
    core.deletePrevWord();
    EXPECT_EQ(core.text(), "foo.");
    core.deletePrevWord();
    EXPECT_EQ(core.text(), "foo");
    core.deletePrevWord();
    EXPECT_EQ(core.text(), "");
    EXPECT_EQ(core.deletePrevWord(), TextOutcome::Unchanged);
}

TEST_F(TextEditCoreTest, DeleteNextWordSkipsLeadingSpace) {
    TextEditCore core;
    core.insertText("  foo bar");
    core.moveToDocumentStart();
    core.deleteNextWord();
    EXPECT_EQ(core.text(), " bar");
}

TEST_F(TextEditCoreTest, WordMotion) {
    TextEditCore core;
    core.insertText("foo bar");
    core.moveToDocumentStart();
    core.moveToNextWord();
    EXPECT_EQ(core.cursorByte(), 3u);
    core.moveToNextWord();
    EXPECT_EQ(core.cursorByte(), 7u);
    core.moveToPrevWord(true);
    EXPECT_EQ(core.cursorByte(), 4u);
    EXPECT_EQ(core.selectedText(), "bar");
}

// =============================================================================
// Multi-line
// =============================================================================

TEST_F(TextEditCoreTest, NewlinesOnlyInMultiLine) {
    TextEditCore single;
    single.insertText("ab");
    EXPECT_EQ(single.insertNewline(), TextOutcome::Unchanged);
    EXPECT_EQ(single.text(), "ab");

    TextEditCore core(multiLine());
    EXPECT_EQ(core.store().kind(), text::TextStoreKind::Rope);
    core.insertText("ab");
    EXPECT_EQ(core.insertNewline(), TextOutcome::TextChanged);
    core.insertText("cd");
    EXPECT_EQ(core.text(), "ab\ncd");
    EXPECT_EQ(core.lineCount(), 2u);
    EXPECT_EQ(core.cursor(), (TextPosition{1, 2}));
}

TEST_F(TextEditCoreTest, CrLfNewlineIsOneStep) {
    TextEditCore::Config config = multiLine();
    config.newline = "\r\n";
    TextEditCore core(config);
    core.insertText("a");
    core.insertNewline();
    core.insertText("b");
    EXPECT_EQ(core.text(), "a\r\nb");

    core.moveToLineStart();
    EXPECT_EQ(core.moveLeft(), TextOutcome::Changed);
    EXPECT_EQ(core.cursorByte(), 1u);
    EXPECT_EQ(core.deleteNextChar(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "ab");
}

TEST_F(TextEditCoreTest, VerticalMotionKeepsColumn) {
    TextEditCore core(multiLine());
    core.setText("abcdef\nx\nabcdef");
    ASSERT_EQ(core.setCursor(TextPosition{0, 5}), TextOutcome::Changed);
    core.moveDown();
    EXPECT_EQ(core.cursor(), (TextPosition{1, 1}));
    core.moveDown();
    EXPECT_EQ(core.cursor(), (TextPosition{2, 5}));
    core.moveUp();
    core.moveUp();
    EXPECT_EQ(core.cursor(), (TextPosition{0, 5}));
    core.moveUp();
    EXPECT_EQ(core.cursor(), (TextPosition{0, 0}));
}

TEST_F(TextEditCoreTest, DeletePrevWordJoinsLines) {
    TextEditCore core(multiLine());
    core.setText("ab\ncd");
    core.setCursor(TextPosition{1, 0});
    core.deletePrevWord();
    EXPECT_EQ(core.text(), "abcd");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 2}));
}

TEST_F(TextEditCoreTest, ExpandedTabsPadToStop) {
    TextEditCore::Config config;
    config.expandTabs = true;
    config.tabWidth = 4;
    TextEditCore core(config);
    core.insertText("ab");
    core.insertTab();
    EXPECT_EQ(core.text(), "ab  ");
    core.insertTab();
    EXPECT_EQ(core.text(), "ab      ");

    core.setExpandTabs(false);
    core.insertTab();
    EXPECT_EQ(core.text(), "ab      \t");
}

// =============================================================================
// Selection / content
// =============================================================================

TEST_F(TextEditCoreTest, SelectAllAndClear) {
    TextEditCore core;
    core.insertText("abc");
    EXPECT_EQ(core.selectAll(), TextOutcome::Changed);
    EXPECT_EQ(core.selectAll(), TextOutcome::Unchanged);
    EXPECT_EQ(core.selectedText(), "abc");
    EXPECT_EQ(core.deleteSelection(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "");
    EXPECT_EQ(core.clear(), TextOutcome::Unchanged);
    EXPECT_EQ(core.deleteSelection(), TextOutcome::Unchanged);
}

TEST_F(TextEditCoreTest, SetTextResetsHistoryAndCursor) {
    TextEditCore core;
    core.insertText("abc");
    EXPECT_EQ(core.setText("xyz"), TextOutcome::TextChanged);
    EXPECT_EQ(core.remainingUndo(), 0u);
    EXPECT_EQ(core.cursorByte(), 0u);
    EXPECT_EQ(core.undo(), TextOutcome::Unchanged);
}

TEST_F(TextEditCoreTest, InvalidPositionsAreRejected) {
    TextEditCore core;
    core.insertText("a\xC3\xA9");
    EXPECT_EQ(core.setCursor(TextPosition{0, 9}), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::InvalidBoundary);
    EXPECT_EQ(core.setCursorByte(2), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::InvalidBoundary);
    EXPECT_EQ(core.setSelection(TextRange{TextPosition{0, 2}, TextPosition{0, 1}}), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::InvalidRange);
    EXPECT_EQ(core.cursor(), (TextPosition{0, 2}));

    EXPECT_EQ(core.setSelection(TextRange::maximum()), TextOutcome::Changed);
    EXPECT_EQ(core.selectedText(), "a\xC3\xA9");
}

// =============================================================================
// Clipboard
// =============================================================================

TEST_F(TextEditCoreTest, CopyCutPaste) {
    TextEditCore core;
    core.insertText("hello world");
    EXPECT_EQ(core.copyToClipboard(), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::EmptyOperation);

    core.setSelection(range(0, 5));
    EXPECT_EQ(core.copyToClipboard(), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::Ok);
    core.moveToDocumentEnd();
    EXPECT_EQ(core.pasteFromClipboard(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hello worldhello");

    core.setSelection(range(5, 11));
    EXPECT_EQ(core.cutToClipboard(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hellohello");
    core.moveToDocumentStart();
    core.pasteFromClipboard();
    EXPECT_EQ(core.text(), " worldhellohello");
}

TEST_F(TextEditCoreTest, ExternalClipboard) {
    TextEditCore core;
    RecordingClipboard clipboard;
    core.setClipboard(&clipboard);
    core.insertText("abc");
    core.selectAll();

    clipboard.accept = false;
    EXPECT_EQ(core.cutToClipboard(), TextOutcome::Unchanged);
    EXPECT_EQ(core.text(), "abc");

    clipboard.accept = true;
    EXPECT_EQ(core.cutToClipboard(), TextOutcome::TextChanged);
    EXPECT_EQ(clipboard.value, "abc");
    EXPECT_EQ(clipboard.writes, 2);

    core.setClipboard(nullptr);
    EXPECT_EQ(core.pasteFromClipboard(), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::EmptyOperation);
}

// =============================================================================
// Styles
// =============================================================================

TEST_F(TextEditCoreTest, StylesFollowEdits) {
    TextEditCore core;
    core.insertText("hello world");
    EXPECT_EQ(core.addStyle(text::ByteRange{6, 11}, 1), TextOutcome::Changed);
    EXPECT_EQ(core.addStyle(text::ByteRange{6, 11}, 1), TextOutcome::Unchanged);

    core.moveToDocumentStart();
    core.insertText(">> ");
    EXPECT_EQ(core.stylesAt(9), (std::vector<std::uint32_t>{1}));
    EXPECT_TRUE(core.stylesAt(8).empty());

    core.setSelection(range(9, 14));
    core.deleteSelection();
    EXPECT_TRUE(core.styles().empty());

    core.undo();
    const std::vector<style::StyleSpan> restored = core.styles();
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored[0].range, (text::ByteRange{9, 14}));
    EXPECT_EQ(restored[0].tag, 1u);
}

TEST_F(TextEditCoreTest, StyleArgumentsAreValidated) {
    TextEditCore core;
    core.insertText("hello");
    EXPECT_EQ(core.addStyle(text::ByteRange{4, 2}, 1), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::InvalidRange);
    EXPECT_EQ(core.addStyle(text::ByteRange{0, 9}, 1), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::InvalidBoundary);
    EXPECT_EQ(core.addStyle(text::ByteRange{2, 2}, 1), TextOutcome::Unchanged);
    EXPECT_EQ(core.lastError(), TextError::EmptyOperation);

    EXPECT_EQ(core.addStyle(range(1, 3), 7), TextOutcome::Changed);
    EXPECT_EQ(core.stylesIn(text::ByteRange{0, 5}).size(), 1u);
    EXPECT_EQ(core.removeStyle(range(1, 3), 7), TextOutcome::Changed);
    EXPECT_EQ(core.removeStyle(range(1, 3), 7), TextOutcome::Unchanged);
}

TEST_F(TextEditCoreTest, StyleChangesAreUndoableWhenEnabled) {
    TextEditCore::Config config;
    config.undoStyles = true;
    TextEditCore core(config);
    core.insertText("hello");
    core.addStyle(text::ByteRange{0, 5}, 3);
    EXPECT_EQ(core.undo(), TextOutcome::Changed);
    EXPECT_TRUE(core.styles().empty());
    EXPECT_EQ(core.text(), "hello");
    EXPECT_EQ(core.redo(), TextOutcome::Changed);
    EXPECT_EQ(core.stylesAt(0), (std::vector<std::uint32_t>{3}));

    core.setStyles({{text::ByteRange{1, 2}, 4}});
    EXPECT_TRUE(core.stylesAt(0).empty());
    core.undo();
    EXPECT_EQ(core.stylesAt(0), (std::vector<std::uint32_t>{3}));
}

// =============================================================================
// Undo history
// =============================================================================

TEST_F(TextEditCoreTest, TypedCharactersMergeIntoOneUndoStep) {
    TextEditCore core;
    for (char c : std::string("hello")) core.insertChar(static_cast<std::uint32_t>(c));
    core.insertText(" world");
    EXPECT_EQ(core.remainingUndo(), 2u);

    core.undo();
    EXPECT_EQ(core.text(), "hello");
    core.undo();
    EXPECT_EQ(core.text(), "");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 0}));
    core.redo();
    EXPECT_EQ(core.text(), "hello");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 5}));
}

TEST_F(TextEditCoreTest, DeletionRunsMergeAroundTheCursor) {
    TextEditCore core;
    core.setText("hello world");
    core.setCursor(TextPosition{0, 5});
    core.deletePrevChar();
    core.deletePrevChar();
    core.deletePrevChar();
    EXPECT_EQ(core.text(), "he world");
    core.deleteNextChar();
    core.deleteNextChar();
    EXPECT_EQ(core.text(), "heorld");
    EXPECT_EQ(core.remainingUndo(), 1u);

    EXPECT_EQ(core.undo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hello world");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 5}));
}

TEST_F(TextEditCoreTest, UndoSequenceRestoresSelectionFromItsStart) {
    TextEditCore core;
    core.insertText("abc");
    ASSERT_EQ(core.cursor(), (TextPosition{0, 3}));

    core.beginUndoSequence();
    core.setCursor(TextPosition{0, 0});
    core.insertText("x");
    core.endUndoSequence();
    EXPECT_EQ(core.text(), "xabc");

    core.undo();
    EXPECT_EQ(core.text(), "abc");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 3}));
}

TEST_F(TextEditCoreTest, CarriageReturnBeforeLineFeedUndoes) {
    TextEditCore::Config config = multiLine();
    config.newline = "\r";
    TextEditCore core(config);
    core.setText("ab\n");
    core.setCursor(TextPosition{0, 2});

    EXPECT_EQ(core.insertNewline(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "ab\r\n");
    EXPECT_EQ(core.cursorByte(), 4u);
    EXPECT_EQ(core.lineCount(), 2u);

    EXPECT_EQ(core.undo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "ab\n");
    EXPECT_EQ(core.cursor(), (TextPosition{0, 2}));
    EXPECT_EQ(core.redo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "ab\r\n");
}

TEST_F(TextEditCoreTest, DeletingBetweenCarriageReturnAndLineFeedUndoes) {
    TextEditCore core(multiLine());
    core.setText("\rx\n");
    core.setCursor(TextPosition{0, 1});

    EXPECT_EQ(core.deleteNextChar(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "\r\n");
    EXPECT_EQ(core.cursorByte(), 0u);

    EXPECT_EQ(core.undo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "\rx\n");
    EXPECT_EQ(core.store().lenBytes(), 3u);
    EXPECT_EQ(core.cursor(), (TextPosition{0, 1}));

    core.setCursor(TextPosition{0, 2});
    EXPECT_EQ(core.deletePrevChar(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "\r\n");
    EXPECT_EQ(core.undo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "\rx\n");
}

TEST_F(TextEditCoreTest, CombiningMarkJoinsPreviousCluster) {
    TextEditCore core;
    core.insertText("e");
    EXPECT_EQ(core.insertChar(0x301), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "e\xCC\x81");
    EXPECT_EQ(core.cursorByte(), 3u);
    EXPECT_EQ(core.remainingUndo(), 2u);

    core.undo();
    EXPECT_EQ(core.text(), "e");
    EXPECT_EQ(core.cursorByte(), 1u);
    core.undo();
    EXPECT_EQ(core.text(), "");
}

TEST_F(TextEditCoreTest, StyleAddedAfterDeletionSurvivesUndo) {
    TextEditCore core;
    core.insertText("hello world");
    core.setSelection(range(5, 11));
    core.deleteSelection();
    EXPECT_EQ(core.addStyle(text::ByteRange{2, 5}, 7), TextOutcome::Changed);

    EXPECT_EQ(core.undo(), TextOutcome::TextChanged);
    EXPECT_EQ(core.text(), "hello world");
    const std::vector<style::StyleSpan> spans = core.styles();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].range, (text::ByteRange{2, 5}));
    EXPECT_EQ(spans[0].tag, 7u);
}

TEST_F(TextEditCoreTest, ClippedSpanComesBackBesideNewerSpan) {
    TextEditCore core;
    core.insertText("hello world");
    core.addStyle(text::ByteRange{3, 8}, 1);
    core.setSelection(range(5, 11));
    core.deleteSelection();
    core.addStyle(text::ByteRange{0, 5}, 2);

    core.undo();
    using Layout = std::vector<std::tuple<std::size_t, std::size_t, std::uint32_t>>;
    EXPECT_EQ(spanLayout(core), (Layout{{0, 5, 2}, {3, 8, 1}}));
}

TEST_F(TextEditCoreTest, SpanAddedBetweenBackspacesKeepsItsText) {
    TextEditCore core;
    core.setText("abcd");
    core.setCursor(TextPosition{0, 3});
    core.deletePrevChar();
    core.addStyle(text::ByteRange{2, 3}, 9);
    core.deletePrevChar();
    EXPECT_EQ(core.text(), "ad");
    EXPECT_EQ(core.remainingUndo(), 1u);

    core.undo();
    EXPECT_EQ(core.text(), "abcd");
    using Layout = std::vector<std::tuple<std::size_t, std::size_t, std::uint32_t>>;
    EXPECT_EQ(spanLayout(core), (Layout{{3, 4, 9}}));
}

TEST_F(TextEditCoreTest, RandomEditsUndoBackToStart) {
    const std::vector<std::string> inputs = {"\r", "\n", "\r\n", "e", "\xCC\x81", "x", "ab", " "};
    const std::vector<std::uint32_t> chars = {'x', 'e', 0x301, '\r', '\n', ' '};

    for (std::uint32_t seed = 1; seed <= 12; ++seed) {
        SCOPED_TRACE(seed);
        std::mt19937 rng(seed);
        auto pick = [&rng](std::size_t n) { return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng); };

        TextEditCore::Config config = multiLine();
        config.undoStyles = true;
        config.undoLimit = 1000;
        TextEditCore core(config);
        core.setText("e\xCC\x81\r\nx\ny");
        const std::string startText = core.text();
        const std::vector<style::StyleSpan> startStyles = core.styles();
        std::optional<std::pair<TextPosition, TextPosition>> startSelection;

        const int steps = 80;
        for (int step = 0; step < steps; ++step) {
            const std::size_t len = core.store().lenBytes();
            core.setCursorByte(pick(len + 1));
            if (pick(4) == 0) core.setCursorByte(pick(len + 1), true);
            const std::pair<TextPosition, TextPosition> before{core.anchor(), core.cursor()};

            TextOutcome outcome = TextOutcome::Unchanged;
            switch (pick(8)) {
                case 0: outcome = core.insertText(inputs[pick(inputs.size())]); break;
                case 1: outcome = core.insertChar(chars[pick(chars.size())]); break;
                case 2: outcome = core.deletePrevChar(); break;
                case 3: outcome = core.deleteNextChar(); break;
                case 4: outcome = core.deletePrevWord(); break;
                case 5: outcome = core.insertNewline(); break;
                case 6: {
                    std::size_t a = pick(len + 1);
                    std::size_t b = pick(len + 1);
                    if (a > b) std::swap(a, b);
                    outcome = core.addStyle(text::ByteRange{a, b}, static_cast<std::uint32_t>(pick(3)));
                    break;
                }
                default: outcome = core.deleteNextWord(); break;
            }
            if (outcome != TextOutcome::Unchanged && !startSelection) startSelection = before;
        }
        const std::string endText = core.text();
        const auto endLayout = spanLayout(core);

        for (int i = 0; i < steps; ++i) core.undo();
        EXPECT_EQ(core.text(), startText);
        EXPECT_EQ(core.styles(), startStyles);
        EXPECT_EQ(core.remainingUndo(), 0u);
        if (startSelection) {
            EXPECT_EQ(core.anchor(), startSelection->first);
            EXPECT_EQ(core.cursor(), startSelection->second);
        }

        for (int i = 0; i < steps; ++i) core.redo();
        EXPECT_EQ(core.text(), endText);
        EXPECT_EQ(spanLayout(core), endLayout);
    }
}

// =============================================================================
// Replay log
// =============================================================================

TEST_F(TextEditCoreTest, ReplayLogMirrorsEditsIntoAnotherCore) {
    TextEditCore source(multiLine());
    TextEditCore mirror(multiLine());
    source.enableReplayLog(true);
    mirror.enableReplayLog(true);
    EXPECT_TRUE(source.hasReplayLog());

    source.setText("ab\n");
    source.setCursor(TextPosition{0, 2});
    source.insertChar('x');
    source.insertChar('y');
    source.insertChar('z');
    source.insertNewline();
    source.addStyle(text::ByteRange{0, 2}, 5);
    source.deletePrevChar();
    source.undo();
    source.setSelection(range(0, 1));
    source.insertText("Q");
    ASSERT_EQ(source.text(), "Qbxyz\n\n");

    EXPECT_EQ(mirror.replayLog(source.recentReplayLog()), TextOutcome::TextChanged);
    EXPECT_EQ(mirror.text(), source.text());
    EXPECT_EQ(spanLayout(mirror), spanLayout(source));
    EXPECT_TRUE(mirror.recentReplayLog().empty());
    EXPECT_TRUE(source.recentReplayLog().empty());

    // Undo steps line up: the typed run is one step on both sides.
    EXPECT_EQ(mirror.remainingUndo(), source.remainingUndo());
    source.undo();
    mirror.undo();
    EXPECT_EQ(mirror.text(), "abxyz\n\n");
    source.undo();
    mirror.undo();
    EXPECT_EQ(mirror.text(), "abxyz\n");
    source.undo();
    mirror.undo();
    EXPECT_EQ(mirror.text(), "ab\n");
    EXPECT_EQ(mirror.text(), source.text());
}

TEST_F(TextEditCoreTest, ReplayLogCarriesUndoAndSetText) {
    TextEditCore source;
    TextEditCore mirror;
    mirror.setText("stale");
    source.enableReplayLog(true);
    source.setText("one");
    source.moveToDocumentEnd();
    source.insertText(" two");
    source.undo();
    source.redo();
    source.undo();

    const std::vector<history::ReplayEntry> log = source.recentReplayLog();
    ASSERT_EQ(log.size(), 5u);
    EXPECT_EQ(log[0].op, history::ReplayOp::SetText);
    EXPECT_EQ(log[0].text, "one");
    EXPECT_EQ(log[1].op, history::ReplayOp::Edit);
    EXPECT_EQ(log[2].op, history::ReplayOp::Undo);
    EXPECT_EQ(log[3].op, history::ReplayOp::Redo);

    EXPECT_EQ(mirror.replayLog(log), TextOutcome::TextChanged);
    EXPECT_EQ(mirror.text(), "one");
    EXPECT_EQ(mirror.redo(), TextOutcome::TextChanged);
    EXPECT_EQ(mirror.text(), "one two");
}

// =============================================================================
// Rendering
// =============================================================================

class TextEditCoreRenderTest : public ::testing::Test {
protected:
    TextEditCore core{config()};
    ScreenRect area{2, 1, 6, 3};

    static TextEditCore::Config config() {
        TextEditCore::Config c;
        c.multiLine = true;
        c.wrapMode = text::WrapMode::Word;
        return c;
    }

    void SetUp() override { core.setText("hello world foo\nsecond line"); }

    std::string rowText(const std::vector<text::Glyph>& glyphs, std::uint32_t y) {
        std::string out;
        for (const text::Glyph& g : glyphs) {
            if (g.screenRow == y) out += g.text;
        }
        return out;
    }
};

TEST_F(TextEditCoreRenderTest, GlyphsUseAbsoluteCells) {
    const std::vector<text::Glyph> glyphs = core.glyphsForRegion(area, ScrollOffset{});
    ASSERT_FALSE(glyphs.empty());
    EXPECT_EQ(glyphs.front().text, "h");
    EXPECT_EQ(glyphs.front().screenCol, 2u);
    EXPECT_EQ(glyphs.front().screenRow, 1u);
    EXPECT_EQ(rowText(glyphs, 1), "hello ");
    EXPECT_EQ(rowText(glyphs, 2), "world ");
    EXPECT_EQ(rowText(glyphs, 3), "foo");
    for (const text::Glyph& g : glyphs) EXPECT_EQ(g.pos.line, 0u);
}

TEST_F(TextEditCoreRenderTest, ScrolledIntoWrapRow) {
    ScrollOffset scroll;
    scroll.subRow = 2;
    const std::vector<text::Glyph> glyphs = core.glyphsForRegion(area, scroll);
    EXPECT_EQ(rowText(glyphs, 1), "foo");
    EXPECT_EQ(rowText(glyphs, 2), "second ");
    EXPECT_EQ(rowText(glyphs, 3), "line");
}

TEST_F(TextEditCoreRenderTest, HorizontalScrollWithoutWrap) {
    core.setWrapMode(text::WrapMode::None);
    ScrollOffset scroll;
    scroll.column = 6;
    const std::vector<text::Glyph> glyphs = core.glyphsForRegion(area, scroll);
    EXPECT_EQ(rowText(glyphs, 1), "world ");
    EXPECT_EQ(rowText(glyphs, 2), " line");
    EXPECT_EQ(glyphs.front().screenCol, 2u);
}

TEST_F(TextEditCoreRenderTest, ScreenToPosition) {
    TextPosition pos;
    ASSERT_EQ(core.screenToPosition(area, ScrollOffset{}, 5, 2, pos), TextError::Ok);
    EXPECT_EQ(pos, (TextPosition{0, 9}));

    ASSERT_EQ(core.screenToPosition(area, ScrollOffset{}, 7, 1, pos), TextError::Ok);
    EXPECT_EQ(pos, (TextPosition{0, 5}));

    ScrollOffset scroll;
    scroll.line = 1;
    ASSERT_EQ(core.screenToPosition(area, scroll, 2, 3, pos), TextError::Ok);
    EXPECT_EQ(pos, (TextPosition{1, 11}));

    EXPECT_EQ(core.screenToPosition(area, ScrollOffset{}, 0, 0, pos), TextError::InvalidBoundary);
}

TEST_F(TextEditCoreRenderTest, PositionToScreen) {
    ScreenCell cell;
    ASSERT_TRUE(core.positionToScreen(area, ScrollOffset{}, TextPosition{0, 9}, cell));
    EXPECT_EQ(cell.x, 5u);
    EXPECT_EQ(cell.y, 2u);

    EXPECT_FALSE(core.positionToScreen(area, ScrollOffset{}, TextPosition{1, 0}, cell));

    ScrollOffset scroll;
    scroll.subRow = 1;
    ASSERT_TRUE(core.positionToScreen(area, scroll, TextPosition{1, 0}, cell));
    EXPECT_EQ(cell.x, 2u);
    EXPECT_EQ(cell.y, 3u);
}

TEST_F(TextEditCoreRenderTest, RowCountAndMotionUseViewport) {
    EXPECT_EQ(core.screenRowCount(6), 5u);
    EXPECT_EQ(core.screenRowCount(0), 2u);

    core.glyphsForRegion(area, ScrollOffset{});
    core.setCursor(TextPosition{0, 2});
    core.moveDown();
    EXPECT_EQ(core.cursor(), (TextPosition{0, 8}));
}
