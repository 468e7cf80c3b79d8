#pragma once

#include "editcore/text/text_types.h"
#include "editcore/style/style_index.h"
#include <cstdint>
#include <string>
#include <vector>

namespace editcore::history {

struct Selection {
    text::TextPosition anchor;
    text::TextPosition cursor;

    bool operator==(const Selection& o) const { return anchor == o.anchor && cursor == o.cursor; }
    bool operator!=(const Selection& o) const { return !(*this == o); }
};

enum class UndoOpKind : std::uint8_t {
    InsertText = 0,
    RemoveText = 1,
    AddStyle = 2,
    RemoveStyle = 3,
    SetStyles = 4,
    InsertChar = 5,  // Typed grapheme; merges with an adjacent InsertChar
    RemoveChar = 6,  // Backspace/delete; merges with an adjacent RemoveChar
};

inline bool isStyleOp(UndoOpKind kind) {
    return kind == UndoOpKind::AddStyle || kind == UndoOpKind::RemoveStyle
        || kind == UndoOpKind::SetStyles;
}

// One primitive, invertible edit.
struct UndoRecord {
    UndoOpKind kind = UndoOpKind::InsertText;
    text::ByteRange bytes;   // Inserted / removed / styled range
    std::string text;        // Inserted or removed bytes
    std::uint32_t tag = 0;
    std::vector<style::StyleSpan> stylesBefore;  // RemoveText: spans touching the range; SetStyles: all
    std::vector<style::StyleSpan> stylesAfter;   // SetStyles
    Selection selectionBefore;
    Selection selectionAfter;
};

// Unit of one undo/redo.
struct UndoGroup {
    std::vector<UndoRecord> records;
    Selection selectionBefore;  // Captured when the group was opened
};

enum class ReplayOp : std::uint8_t {
    Edit = 0,     // record holds the edit
    SetText = 1,  // text holds the new document
    Undo = 2,
    Redo = 3,
};

/**
 * One entry of the replay log. Entries sharing a sequence number belong to
 * the same undo group (or to merged typing).
 */
struct ReplayEntry {
    std::uint32_t sequence = 0;
    ReplayOp op = ReplayOp::Edit;
    UndoRecord record;
    std::string text;
};

/**
 * Receiver of replayed edits. Replays must not be recorded again.
 */
class UndoTarget {
public:
    virtual ~UndoTarget() = default;

    /**
     * @param extendStyles False when restoring removed text: spans ending at
     * offset keep their end instead of growing over the text
     */
    virtual void replayInsert(std::size_t offset, const std::string& text, bool extendStyles) = 0;
    virtual void replayRemove(text::ByteRange range) = 0;
    /** Put back the spans a removal of range deleted or clipped. */
    virtual void replayStyles(text::ByteRange range, const std::vector<style::StyleSpan>& spans) = 0;
    virtual void replayAddStyle(text::ByteRange range, std::uint32_t tag) = 0;
    virtual void replayRemoveStyle(text::ByteRange range, std::uint32_t tag) = 0;
    virtual void replaySetStyles(const std::vector<style::StyleSpan>& spans) = 0;
};

} // namespace editcore::history
