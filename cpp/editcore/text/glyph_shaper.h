#ifndef EDITCORE_TEXT_GLYPH_SHAPER_H
#define EDITCORE_TEXT_GLYPH_SHAPER_H

#include "editcore/text/text_types.h"
#include "editcore/text/text_store.h"
#include "editcore/text/grapheme_iterator.h"
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace editcore::text {

struct ShaperOptions {
    std::uint32_t tabWidth = 8;
    bool showCtrl = false;  // Control chars, tabs and line breaks as placeholders
    bool wrapCtrl = false;  // Soft hyphen / ZWSP visible, soft breaks marked

    bool operator==(const ShaperOptions& o) const {
        return tabWidth == o.tabWidth && showCtrl == o.showCtrl && wrapCtrl == o.wrapCtrl;
    }
    bool operator!=(const ShaperOptions& o) const { return !(*this == o); }
};

// One screen row of a logical line.
struct WrapSegment {
    ByteRange bytes;
    std::size_t firstColumn = 0;  // Grapheme column of bytes.start
    std::uint32_t width = 0;      // Screen columns used

    bool operator==(const WrapSegment& o) const {
        return bytes == o.bytes && firstColumn == o.firstColumn && width == o.width;
    }
};

struct Glyph {
    std::string text;              // Display text (may differ from the source)
    std::uint32_t screenWidth = 0;
    ByteRange sourceBytes;         // Empty for synthesized glyphs
    TextPosition pos;
    std::uint32_t screenCol = 0;   // Column within the row
    std::size_t screenRow = 0;     // Row within the line (wrap segment index)
    bool lineBreak = false;        // Hard or soft end of row
    bool softBreak = false;        // Row ends because of wrapping
};

class GlyphShaper;

/**
 * GlyphIterator: lazy, finite, restartable glyph sequence for one line.
 * Produced by GlyphShaper::glyphsForLine.
 */
class GlyphIterator {
public:
    GlyphIterator() = default;

    bool next(Glyph& out);
    void reset();

    /** Continue at the first glyph of a wrap row; O(log n) in the store. */
    bool seekSegment(std::size_t index);

    /**
     * Continue at byte offset, measuring the clusters in between without
     * producing glyphs.
     */
    TextError skipTo(std::size_t offset);

    /** Skip glyphs that end at or before a screen column of the current row. */
    void skipToColumn(std::uint32_t column);

    /** Drop the rest of the line. */
    void skipLine();

    const std::vector<WrapSegment>& segments() const { return segments_; }
    /** Row and column where the next glyph will be placed. */
    std::size_t row() const { return segment_; }
    std::uint32_t column() const { return column_; }

private:
    friend class GlyphShaper;

    bool atSoftBreak(const Grapheme& g) const;
    /** Lay out g at the current column and advance; may queue a break marker. */
    void emit(const Grapheme& g, Glyph& out);

    const GlyphShaper* shaper_ = nullptr;
    GraphemeIterator graphemes_;
    std::vector<WrapSegment> segments_;
    std::size_t line_ = 0;
    ByteRange terminator_;
    bool hasTerminator_ = false;
    bool wrapping_ = false;
    std::uint32_t viewportWidth_ = 0;

    std::size_t segment_ = 0;
    std::uint32_t column_ = 0;
    std::size_t graphemeColumn_ = 0;
    std::deque<Glyph> pending_;
    bool finished_ = false;
};

/**
 * GlyphShaper: turns clusters into display glyphs and splits lines into wrap
 * rows.
 *
 * Remapping:
 * - Tab: advances to the next tab stop; U+2409 with showCtrl
 * - Line break: U+240A with showCtrl, zero width otherwise
 * - C0 controls / DEL: U+2400 + n with showCtrl, U+FFFD otherwise
 * - Soft hyphen: hidden unless showCtrl/wrapCtrl (U+2E1A); "-" at a wrap
 * - Zero width space: hidden unless showCtrl/wrapCtrl (U+00A8)
 * - wrapCtrl marks introduced breaks with U+21B5
 */
class GlyphShaper {
public:
    GlyphShaper() = default;
    explicit GlyphShaper(const ShaperOptions& options) : options_(options) {}

    const ShaperOptions& options() const { return options_; }
    void setOptions(const ShaperOptions& options) { options_ = options; }

    /**
     * Wrap rows of a line. Always at least one segment; the segments are
     * contiguous and cover the line content exactly.
     * A viewport width of 0 disables wrapping.
     */
    TextError wrapSegments(const TextStore& store, std::size_t line, WrapMode mode,
                           std::uint32_t viewportWidth, std::vector<WrapSegment>& out) const;

    /** Glyphs of a line laid out on precomputed segments. */
    TextError glyphsForLine(const TextStore& store, std::size_t line,
                            const std::vector<WrapSegment>& segments, std::uint32_t viewportWidth,
                            GlyphIterator& out) const;

    /** Convenience overload computing the segments first. */
    TextError glyphsForLine(const TextStore& store, std::size_t line, WrapMode mode,
                            std::uint32_t viewportWidth, GlyphIterator& out) const;

    /** Unwrapped display width of a line. */
    TextError lineWidth(const TextStore& store, std::size_t line, std::uint32_t& out) const;

    /** Screen columns of a cluster placed at column. */
    std::uint32_t measure(const Grapheme& g, std::uint32_t column) const;

    /** Display glyph for a cluster placed at column (text and width only). */
    void shape(const Grapheme& g, std::uint32_t column, Glyph& out) const;

    /** Glyph for a line terminator. */
    void shapeLineBreak(Glyph& out) const;

private:
    std::uint32_t tabAdvance(std::uint32_t column) const;

    ShaperOptions options_;
};

} // namespace editcore::text

#endif // EDITCORE_TEXT_GLYPH_SHAPER_H
