#ifndef EDITCORE_TEXT_TYPES_H
#define EDITCORE_TEXT_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace editcore::text {

// =============================================================================
// Error / Outcome
// =============================================================================

enum class TextError : std::uint8_t {
    Ok = 0,
    InvalidBoundary = 1,  // Offset or position off a grapheme boundary, or out of bounds
    InvalidRange = 2,     // end < start
    EmptyOperation = 3,   // Recognized no-op edit; never recorded
};

inline const char* toString(TextError error) {
    switch (error) {
        case TextError::Ok: return "Ok";
        case TextError::InvalidBoundary: return "InvalidBoundary";
        case TextError::InvalidRange: return "InvalidRange";
        case TextError::EmptyOperation: return "EmptyOperation";
    }
    return "Unknown";
}

// Result of a command on TextEditCore.
enum class TextOutcome : std::uint8_t {
    Unchanged = 0,    // Nothing recognized, no repaint
    Changed = 1,      // Cursor/selection/style state changed, repaint
    TextChanged = 2,  // Content differs
};

// =============================================================================
// Coordinates
// =============================================================================

// Half-open byte range [start, end).
struct ByteRange {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    bool contains(std::size_t offset) const { return offset >= start && offset < end; }

    bool operator==(const ByteRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const ByteRange& o) const { return !(*this == o); }
};

// Logical position. column is a grapheme index within the line.
struct TextPosition {
    std::size_t line = 0;
    std::size_t column = 0;

    bool operator==(const TextPosition& o) const { return line == o.line && column == o.column; }
    bool operator!=(const TextPosition& o) const { return !(*this == o); }
    bool operator<(const TextPosition& o) const {
        return line < o.line || (line == o.line && column < o.column);
    }
    bool operator<=(const TextPosition& o) const { return !(o < *this); }
    bool operator>(const TextPosition& o) const { return o < *this; }
    bool operator>=(const TextPosition& o) const { return !(*this < o); }
};

struct TextRange {
    TextPosition start;
    TextPosition end;

    /** Sentinel meaning "whole document"; resolved against the current store. */
    static TextRange maximum() {
        constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
        return TextRange{TextPosition{0, 0}, TextPosition{kMax, kMax}};
    }
    bool isMaximum() const { return *this == maximum(); }
    bool empty() const { return start == end; }

    bool operator==(const TextRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const TextRange& o) const { return !(*this == o); }
};

// Inclusive-exclusive range of line indices.
struct LineRange {
    std::size_t start = 0;
    std::size_t end = 0;
};

// =============================================================================
// Edit Delta
// =============================================================================

/**
 * Emitted by every store mutation and pushed to the style index and the
 * metrics cache. A mutation is either a pure insertion or a pure removal.
 */
struct EditDelta {
    std::size_t offset = 0;
    std::size_t removedBytes = 0;
    std::size_t insertedBytes = 0;
    std::size_t line = 0;           // Line containing offset before the edit
    std::size_t removedBreaks = 0;  // '\n' removed
    std::size_t insertedBreaks = 0; // '\n' inserted

    bool changesLineCount() const { return removedBreaks != 0 || insertedBreaks != 0; }
};

// =============================================================================
// Graphemes / Wrapping
// =============================================================================

struct Grapheme {
    std::string text;
    ByteRange bytes;

    bool isLineBreak() const { return text == "\n" || text == "\r\n"; }
};

enum class WrapMode : std::uint8_t {
    None = 0,  // One row per line, horizontal scroll
    Hard = 1,  // Break at exactly the viewport width
    Word = 2,  // Break at the last opportunity, fall back to Hard
};

} // namespace editcore::text

#endif // EDITCORE_TEXT_TYPES_H
