#ifndef EDITCORE_EDIT_TEXT_EDIT_CORE_H
#define EDITCORE_EDIT_TEXT_EDIT_CORE_H

#include "editcore/text/text_types.h"
#include "editcore/text/text_store.h"
#include "editcore/text/glyph_shaper.h"
#include "editcore/text/line_metrics_cache.h"
#include "editcore/style/style_index.h"
#include "editcore/history/undo_engine.h"
#include "editcore/edit/clipboard.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace editcore::edit {

using text::ByteRange;
using text::Glyph;
using text::TextError;
using text::TextOutcome;
using text::TextPosition;
using text::TextRange;
using text::WrapMode;

// Screen rectangle in cells.
struct ScreenRect {
    std::uint32_t x = 0;
    std::uint32_t y = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

// First visible row (line + wrap row) and, without wrapping, the first
// visible column.
struct ScrollOffset {
    std::size_t line = 0;
    std::size_t subRow = 0;
    std::uint32_t column = 0;
};

struct ScreenCell {
    std::uint32_t x = 0;
    std::uint32_t y = 0;
};

/**
 * TextEditCore: editing state of one text widget.
 *
 * Owns the document store, style index, undo history, glyph shaper and
 * line-metrics cache, and keeps them consistent: every store mutation emits
 * an EditDelta that is pushed to the styles and the cache before any query
 * is answered.
 *
 * Commands return a TextOutcome; failures leave the document unchanged,
 * return TextOutcome::Unchanged and are reported through lastError().
 */
class TextEditCore : private history::UndoTarget {
public:
    struct Config {
        std::size_t expectedSize = 0;   // <= kFlatStoreThreshold selects the flat store
        bool multiLine = false;         // Forces the rope store, enables newlines
        std::uint32_t undoLimit = history::UndoEngine::kDefaultLimit;
        std::uint32_t tabWidth = 8;
        bool expandTabs = false;
        bool showCtrl = false;
        bool wrapCtrl = false;
        WrapMode wrapMode = WrapMode::None;
        std::string newline = "\n";
        bool undoStyles = false;        // Record style changes in the undo history
    };

    TextEditCore();
    explicit TextEditCore(const Config& config);
    ~TextEditCore() override;

    TextEditCore(const TextEditCore&) = delete;
    TextEditCore& operator=(const TextEditCore&) = delete;

    // ==========================================================================
    // Content
    // ==========================================================================

    /** Replace the document. Clears styles, history and selection. */
    TextOutcome setText(std::string_view text);
    TextOutcome clear();

    std::string text() const { return store_->text(); }
    std::string lineText(std::size_t line) const { return store_->lineText(line); }
    std::size_t lineCount() const { return store_->lenLines(); }
    std::size_t lenBytes() const { return store_->lenBytes(); }
    const text::TextStore& store() const { return *store_; }

    // ==========================================================================
    // Editing (at the cursor, replacing the selection)
    // ==========================================================================

    TextOutcome insertText(std::string_view text);
    TextOutcome insertChar(std::uint32_t codepoint);
    TextOutcome insertTab();
    TextOutcome insertNewline();

    TextOutcome deleteSelection();
    TextOutcome deletePrevChar();
    TextOutcome deleteNextChar();
    TextOutcome deletePrevWord();
    TextOutcome deleteNextWord();

    // ==========================================================================
    // Cursor / Selection
    // ==========================================================================

    TextOutcome setCursor(TextPosition pos, bool extendSelection = false);
    TextOutcome setCursorByte(std::size_t offset, bool extendSelection = false);
    /** anchor = range.start, cursor = range.end; maximum() selects all. */
    TextOutcome setSelection(const TextRange& range);
    TextOutcome selectAll();

    TextOutcome moveLeft(bool extendSelection = false);
    TextOutcome moveRight(bool extendSelection = false);
    TextOutcome moveUp(bool extendSelection = false);
    TextOutcome moveDown(bool extendSelection = false);
    TextOutcome moveToLineStart(bool extendSelection = false);
    TextOutcome moveToLineEnd(bool extendSelection = false);
    TextOutcome moveToPrevWord(bool extendSelection = false);
    TextOutcome moveToNextWord(bool extendSelection = false);
    TextOutcome moveToDocumentStart(bool extendSelection = false);
    TextOutcome moveToDocumentEnd(bool extendSelection = false);

    TextPosition cursor() const;
    TextPosition anchor() const;
    /** Ordered selection (start <= end). */
    TextRange selection() const;
    ByteRange selectionBytes() const;
    bool hasSelection() const { return cursor_ != anchor_; }
    std::string selectedText() const;
    std::size_t cursorByte() const { return cursor_; }
    std::size_t anchorByte() const { return anchor_; }

    // ==========================================================================
    // Undo
    // ==========================================================================

    /** Edits until the matching end are undone together, restoring the current selection. */
    void beginUndoSequence() { undo_.beginGroup(currentSelection()); }
    void endUndoSequence() { undo_.endGroup(); }
    TextOutcome undo();
    TextOutcome redo();
    std::size_t remainingUndo() const { return undo_.remainingUndo(); }
    std::size_t remainingRedo() const { return undo_.remainingRedo(); }
    void setUndoLimit(std::uint32_t limit);

    // ==========================================================================
    // Replay log
    // ==========================================================================

    /**
     * Log every edit, style change, undo, redo and setText so another core
     * holding the same text can follow along via replayLog().
     */
    void enableReplayLog(bool enable) { undo_.enableReplayLog(enable); }
    bool hasReplayLog() const { return undo_.hasReplayLog(); }
    std::vector<history::ReplayEntry> recentReplayLog() { return undo_.recentReplayLog(); }
    /** Apply entries taken from another core. The cursor only follows the edits. */
    TextOutcome replayLog(const std::vector<history::ReplayEntry>& entries);

    // ==========================================================================
    // Clipboard
    // ==========================================================================

    /** Non-owning; nullptr restores the built-in local clipboard. */
    void setClipboard(Clipboard* clipboard);
    TextOutcome copyToClipboard();
    TextOutcome cutToClipboard();
    TextOutcome pasteFromClipboard();

    // ==========================================================================
    // Styles
    // ==========================================================================

    TextOutcome addStyle(ByteRange range, std::uint32_t tag);
    TextOutcome addStyle(const TextRange& range, std::uint32_t tag);
    TextOutcome removeStyle(ByteRange range, std::uint32_t tag);
    TextOutcome removeStyle(const TextRange& range, std::uint32_t tag);
    TextOutcome setStyles(const std::vector<std::pair<ByteRange, std::uint32_t>>& spans);

    std::vector<std::uint32_t> stylesAt(std::size_t offset) const { return styles_.stylesAt(offset); }
    std::vector<style::StyleSpan> stylesIn(ByteRange range) const { return styles_.stylesIn(range); }
    std::vector<style::StyleSpan> styles() const { return styles_.spans(); }

    // ==========================================================================
    // Rendering configuration
    // ==========================================================================

    const Config& config() const { return config_; }
    void setWrapMode(WrapMode mode) { config_.wrapMode = mode; }
    WrapMode wrapMode() const { return config_.wrapMode; }
    void setTabWidth(std::uint32_t width);
    void setShowCtrl(bool show);
    void setWrapCtrl(bool show);
    void setExpandTabs(bool expand) { config_.expandTabs = expand; }
    /** Width used by vertical cursor motion; updated by glyphsForRegion. */
    void setViewportWidth(std::uint32_t width) { viewportWidth_ = width; }

    // ==========================================================================
    // Rendering queries
    // ==========================================================================

    /**
     * Glyphs covering area when scrolled to scroll. Glyph screen coordinates
     * are absolute cells. Lines above the scroll position are never shaped.
     */
    std::vector<Glyph> glyphsForRegion(const ScreenRect& area, const ScrollOffset& scroll);

    /**
     * Map a screen cell to a text position. Cells right of a row map to its
     * end; cells below the last line map to the end of the document.
     */
    TextError screenToPosition(const ScreenRect& area, const ScrollOffset& scroll,
                               std::uint32_t x, std::uint32_t y, TextPosition& out);

    /** @return False if pos is invalid or not visible in area */
    bool positionToScreen(const ScreenRect& area, const ScrollOffset& scroll,
                          TextPosition pos, ScreenCell& out);

    /** Total screen rows of the document at a viewport width. */
    std::size_t screenRowCount(std::uint32_t viewportWidth);

    /** Unwrapped display width of a line (cached). */
    std::uint32_t lineWidth(std::size_t line);

    const text::LineMetricsCache& metrics() const { return metrics_; }

    TextError lastError() const { return lastError_; }

private:
    // UndoTarget
    void replayInsert(std::size_t offset, const std::string& text, bool extendStyles) override;
    void replayRemove(ByteRange range) override;
    void replayStyles(ByteRange range, const std::vector<style::StyleSpan>& spans) override;
    void replayAddStyle(ByteRange range, std::uint32_t tag) override;
    void replayRemoveStyle(ByteRange range, std::uint32_t tag) override;
    void replaySetStyles(const std::vector<style::StyleSpan>& spans) override;

    TextOutcome insertWithKind(std::string_view text, history::UndoOpKind kind);
    /**
     * Replace range by text, widened so that neither seam splits a cluster.
     * The cursor ends after the inserted text (at range.start for removals).
     */
    TextOutcome replaceBytes(ByteRange range, std::string_view text,
                             history::UndoOpKind removeKind, history::UndoOpKind insertKind);
    void widenToClusters(ByteRange& range, std::string& text) const;
    /** caret: cursor after the edit; nullopt keeps the shifted selection. */
    TextOutcome applyInsert(std::size_t offset, std::string_view text, history::UndoOpKind kind,
                            std::optional<std::size_t> caret);
    TextOutcome applyRemove(ByteRange range, history::UndoOpKind kind, std::optional<std::size_t> caret);
    void propagate(const text::EditDelta& delta, bool extendStyles = true);
    TextOutcome replayEdit(const history::UndoRecord& record);

    TextOutcome moveCursor(std::size_t offset, bool extendSelection, bool keepColumn = false);
    TextOutcome moveVertical(bool down, bool extendSelection);
    TextOutcome fail(TextError err);

    std::size_t prevWordBoundary(std::size_t offset) const;
    std::size_t nextWordBoundary(std::size_t offset) const;

    history::Selection currentSelection() const;
    void restoreSelection(const history::Selection& selection);
    void syncMetrics(std::uint32_t viewportWidth);
    void syncShaper();
    bool wrapping(std::uint32_t viewportWidth) const;

    Config config_;
    std::unique_ptr<text::TextStore> store_;
    style::StyleIndex styles_;
    history::UndoEngine undo_;
    text::GlyphShaper shaper_;
    text::LineMetricsCache metrics_;
    LocalClipboard localClipboard_;
    Clipboard* clipboard_;

    std::size_t cursor_ = 0;
    std::size_t anchor_ = 0;
    std::optional<std::uint32_t> desiredColumn_;
    std::uint32_t viewportWidth_ = 0;
    bool textReplayed_ = false;
    TextError lastError_ = TextError::Ok;
};

} // namespace editcore::edit

#endif // EDITCORE_EDIT_TEXT_EDIT_CORE_H
