#include "editcore/text/position_codec.h"
#include "editcore/text/text_store.h"
#include "editcore/text/glyph_shaper.h"
#include "editcore/text/unicode.h"

#include <algorithm>

namespace editcore::text::codec {

// =============================================================================
// Grapheme index <-> byte offset
// =============================================================================

TextError graphemeIndexToByte(std::string_view text, std::size_t index, std::size_t& out) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < index; ++i) {
        if (pos >= text.size()) return TextError::InvalidBoundary;
        pos = unicode::nextGraphemeBoundary(text, pos);
    }
    out = pos;
    return TextError::Ok;
}

TextError byteToGraphemeIndex(std::string_view text, std::size_t offset, std::size_t& out) {
    if (offset > text.size()) return TextError::InvalidBoundary;
    std::size_t pos = 0;
    std::size_t count = 0;
    while (pos < offset) {
        pos = unicode::nextGraphemeBoundary(text, pos);
        ++count;
    }
    if (pos != offset) return TextError::InvalidBoundary;
    out = count;
    return TextError::Ok;
}

TextError columnOfByte(GraphemeIterator& line, std::size_t offset, std::size_t& column) {
    const ByteRange range = line.range();
    if (offset < range.start || offset > range.end) return TextError::InvalidBoundary;
    std::size_t count = 0;
    Grapheme g;
    while (line.offset() < offset && line.next(g)) {
        ++count;
        if (g.bytes.end > offset) return TextError::InvalidBoundary;
    }
    if (line.offset() != offset) return TextError::InvalidBoundary;
    column = count;
    return TextError::Ok;
}

TextError byteOfColumn(GraphemeIterator& line, std::size_t column, std::size_t& offset) {
    std::size_t pos = line.range().start;
    Grapheme g;
    for (std::size_t i = 0; i < column; ++i) {
        if (!line.next(g)) return TextError::InvalidBoundary;
        pos = g.bytes.end;
    }
    offset = pos;
    return TextError::Ok;
}

// =============================================================================
// Store-level conversions
// =============================================================================

TextError byteToPosition(const TextStore& store, std::size_t offset, TextPosition& out) {
    return store.byteToPosition(offset, out);
}

TextError positionToByte(const TextStore& store, TextPosition pos, std::size_t& out) {
    return store.positionToByte(pos, out);
}

TextError rangeToBytes(const TextStore& store, const TextRange& range, ByteRange& out) {
    if (range.isMaximum()) {
        out = ByteRange{0, store.lenBytes()};
        return TextError::Ok;
    }
    if (range.end < range.start) return TextError::InvalidRange;
    std::size_t start = 0;
    std::size_t end = 0;
    TextError err = store.positionToByte(range.start, start);
    if (err != TextError::Ok) return err;
    err = store.positionToByte(range.end, end);
    if (err != TextError::Ok) return err;
    out = ByteRange{start, end};
    return TextError::Ok;
}

TextError bytesToRange(const TextStore& store, ByteRange range, TextRange& out) {
    if (range.end < range.start) return TextError::InvalidRange;
    TextRange result;
    TextError err = store.byteToPosition(range.start, result.start);
    if (err != TextError::Ok) return err;
    err = store.byteToPosition(range.end, result.end);
    if (err != TextError::Ok) return err;
    out = result;
    return TextError::Ok;
}

std::size_t prevGraphemeBoundary(const TextStore& store, std::size_t offset) {
    if (offset == 0 || offset > store.lenBytes()) return offset == 0 ? 0 : store.lenBytes();
    const std::size_t line = store.lineOfOffset(offset);
    ByteRange full;
    ByteRange content;
    if (store.lineBytesWithTerminator(line, full) != TextError::Ok) return offset;
    if (store.lineBytes(line, content) != TextError::Ok) return offset;

    if (offset == full.start) {
        // Step over the previous line's terminator.
        ByteRange previous;
        if (line > 0 && store.lineBytes(line - 1, previous) == TextError::Ok) return previous.end;
        return offset;
    }
    if (offset > content.end) return content.end;

    GraphemeIterator it;
    if (store.graphemes(ByteRange{content.start, offset}, it) != TextError::Ok) return offset;
    std::size_t last = content.start;
    Grapheme g;
    while (it.next(g)) last = g.bytes.start;
    return last;
}

std::size_t nextGraphemeBoundary(const TextStore& store, std::size_t offset) {
    const std::size_t len = store.lenBytes();
    if (offset >= len) return len;
    const std::size_t line = store.lineOfOffset(offset);
    ByteRange full;
    ByteRange content;
    if (store.lineBytesWithTerminator(line, full) != TextError::Ok) return offset;
    if (store.lineBytes(line, content) != TextError::Ok) return offset;
    if (offset >= content.end) return full.end;

    GraphemeIterator it;
    if (store.graphemes(ByteRange{offset, content.end}, it) != TextError::Ok) return offset;
    Grapheme g;
    return it.next(g) ? g.bytes.end : content.end;
}

// =============================================================================
// Screen forms
// =============================================================================

TextError byteToScreen(const TextStore& store, const GlyphShaper& shaper, std::size_t line,
                       const std::vector<WrapSegment>& segments, std::size_t offset,
                       ScreenPosition& out) {
    GlyphIterator it;
    TextError err = shaper.glyphsForLine(store, line, segments, 0, it);
    if (err != TextError::Ok) return err;
    err = it.skipTo(offset);
    if (err != TextError::Ok) return err;
    out = ScreenPosition{it.row(), it.column()};
    return TextError::Ok;
}

TextError screenToByte(const TextStore& store, const GlyphShaper& shaper, std::size_t line,
                       const std::vector<WrapSegment>& segments, ScreenPosition pos,
                       std::size_t& out) {
    GlyphIterator it;
    TextError err = shaper.glyphsForLine(store, line, segments, 0, it);
    if (err != TextError::Ok) return err;
    const std::vector<WrapSegment>& rows = it.segments();
    if (pos.row >= rows.size() || !it.seekSegment(pos.row)) return TextError::InvalidBoundary;

    const WrapSegment& row = rows[pos.row];
    const bool lastRow = pos.row + 1 == rows.size();
    std::size_t lastStart = row.bytes.start;
    Glyph g;
    while (it.next(g)) {
        if (g.screenRow != pos.row) break;
        if (g.lineBreak && !g.softBreak) break;
        if (g.sourceBytes.empty()) continue;
        if (pos.column < g.screenCol + g.screenWidth) {
            out = g.sourceBytes.start;
            return TextError::Ok;
        }
        lastStart = g.sourceBytes.start;
        if (g.softBreak) break;
    }
    out = lastRow ? row.bytes.end : lastStart;
    return TextError::Ok;
}

} // namespace editcore::text::codec
