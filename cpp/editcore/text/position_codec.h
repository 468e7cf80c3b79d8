#ifndef EDITCORE_TEXT_POSITION_CODEC_H
#define EDITCORE_TEXT_POSITION_CODEC_H

#include "editcore/text/text_types.h"
#include "editcore/text/grapheme_iterator.h"
#include <cstdint>
#include <string_view>
#include <vector>

namespace editcore::text {

class TextStore;
class GlyphShaper;
struct WrapSegment;

// Screen cell relative to the first row of a logical line.
struct ScreenPosition {
    std::size_t row = 0;
    std::uint32_t column = 0;

    bool operator==(const ScreenPosition& o) const { return row == o.row && column == o.column; }
    bool operator!=(const ScreenPosition& o) const { return !(*this == o); }
};

namespace codec {

// =============================================================================
// Grapheme index <-> byte offset
// =============================================================================

TextError graphemeIndexToByte(std::string_view text, std::size_t index, std::size_t& out);
TextError byteToGraphemeIndex(std::string_view text, std::size_t offset, std::size_t& out);

/**
 * Column of offset within the clusters produced by line (fresh iterator
 * over one line's content).
 */
TextError columnOfByte(GraphemeIterator& line, std::size_t offset, std::size_t& column);
TextError byteOfColumn(GraphemeIterator& line, std::size_t column, std::size_t& offset);

// =============================================================================
// Byte offset <-> (line, column)
// =============================================================================

TextError byteToPosition(const TextStore& store, std::size_t offset, TextPosition& out);
TextError positionToByte(const TextStore& store, TextPosition pos, std::size_t& out);

/** Resolve a logical range; TextRange::maximum() maps to the whole document. */
TextError rangeToBytes(const TextStore& store, const TextRange& range, ByteRange& out);
TextError bytesToRange(const TextStore& store, ByteRange range, TextRange& out);

/**
 * Neighbouring cluster boundaries. A line terminator counts as one cluster.
 * offset must be a boundary; 0 and lenBytes() are returned unchanged.
 */
std::size_t prevGraphemeBoundary(const TextStore& store, std::size_t offset);
std::size_t nextGraphemeBoundary(const TextStore& store, std::size_t offset);

// =============================================================================
// Byte offset <-> wrapped screen cell
// =============================================================================

/**
 * Screen cell of offset on line, given the line's wrap segments. An offset at
 * the seam of two segments belongs to the later row.
 */
TextError byteToScreen(const TextStore& store, const GlyphShaper& shaper, std::size_t line,
                       const std::vector<WrapSegment>& segments, std::size_t offset,
                       ScreenPosition& out);

/**
 * Cluster boundary for a screen cell. Cells past the end of a row map to the
 * row's last boundary; the second cell of a wide glyph maps to its start.
 * @return InvalidBoundary if row is beyond the line's rows
 */
TextError screenToByte(const TextStore& store, const GlyphShaper& shaper, std::size_t line,
                       const std::vector<WrapSegment>& segments, ScreenPosition pos,
                       std::size_t& out);

} // namespace codec
} // namespace editcore::text

#endif // EDITCORE_TEXT_POSITION_CODEC_H
