#include "editcore/text/glyph_shaper.h"
#include "editcore/text/unicode.h"
#include "editcore/core/utf8.h"

#include <algorithm>

namespace editcore::text {

namespace {

constexpr const char* kSoftHyphen = "\xC2\xAD";
constexpr const char* kZeroWidthSpace = "\xE2\x80\x8B";
constexpr std::uint32_t kControlPictures = 0x2400;
constexpr std::uint32_t kSymbolForDelete = 0x2421;
constexpr std::uint32_t kSymbolForTab = 0x2409;
constexpr std::uint32_t kSymbolForLineFeed = 0x240A;
constexpr std::uint32_t kSoftHyphenMarker = 0x2E1A;
constexpr std::uint32_t kZeroWidthSpaceMarker = 0x00A8;
constexpr std::uint32_t kSoftBreakMarker = 0x21B5;
constexpr std::uint32_t kReplacement = 0xFFFD;

bool isSoftHyphen(const Grapheme& g) { return g.text == kSoftHyphen; }
bool isZeroWidthSpace(const Grapheme& g) { return g.text == kZeroWidthSpace; }
bool isTab(const Grapheme& g) { return g.text == "\t"; }
bool isSpace(const Grapheme& g) { return g.text == " "; }

bool isControlGrapheme(const Grapheme& g) {
    return g.text.size() == 1 && unicode::isControl(static_cast<unsigned char>(g.text[0]));
}

bool isBreakOpportunity(const Grapheme& g) {
    return isSpace(g) || g.text == "-" || isSoftHyphen(g) || isZeroWidthSpace(g);
}

} // namespace

// =============================================================================
// Per-cluster shaping
// =============================================================================

std::uint32_t GlyphShaper::tabAdvance(std::uint32_t column) const {
    if (options_.tabWidth == 0) return 1;
    return options_.tabWidth - (column % options_.tabWidth);
}

std::uint32_t GlyphShaper::measure(const Grapheme& g, std::uint32_t column) const {
    if (isTab(g)) return tabAdvance(column);
    if (g.isLineBreak()) return 1;
    if (isSoftHyphen(g) || isZeroWidthSpace(g)) {
        return (options_.showCtrl || options_.wrapCtrl) ? 1 : 0;
    }
    if (isControlGrapheme(g)) return 1;
    return unicode::graphemeWidth(g.text);
}

void GlyphShaper::shape(const Grapheme& g, std::uint32_t column, Glyph& out) const {
    out.text.clear();
    out.screenWidth = measure(g, column);
    out.lineBreak = false;
    out.softBreak = false;

    if (isTab(g)) {
        if (options_.showCtrl) {
            appendUtf8(out.text, kSymbolForTab);
        } else {
            out.text = " ";
        }
    } else if (g.isLineBreak()) {
        // Only reached for stores where '\n' does not end a line.
        appendUtf8(out.text, kSymbolForLineFeed);
    } else if (isSoftHyphen(g)) {
        if (out.screenWidth > 0) appendUtf8(out.text, kSoftHyphenMarker);
    } else if (isZeroWidthSpace(g)) {
        if (out.screenWidth > 0) appendUtf8(out.text, kZeroWidthSpaceMarker);
    } else if (isControlGrapheme(g)) {
        const std::uint32_t c = static_cast<unsigned char>(g.text[0]);
        if (options_.showCtrl) {
            appendUtf8(out.text, c == 0x7F ? kSymbolForDelete : kControlPictures + c);
        } else {
            appendUtf8(out.text, kReplacement);
        }
    } else {
        out.text = g.text;
    }
}

void GlyphShaper::shapeLineBreak(Glyph& out) const {
    out.text.clear();
    if (options_.showCtrl) {
        appendUtf8(out.text, kSymbolForLineFeed);
        out.screenWidth = 1;
    } else {
        out.screenWidth = 0;
    }
    out.lineBreak = true;
    out.softBreak = false;
}

// =============================================================================
// Wrapping
// =============================================================================

TextError GlyphShaper::wrapSegments(const TextStore& store, std::size_t line, WrapMode mode,
                                    std::uint32_t viewportWidth, std::vector<WrapSegment>& out) const {
    out.clear();
    ByteRange content;
    TextError err = store.lineBytes(line, content);
    if (err != TextError::Ok) return err;
    GraphemeIterator it;
    err = store.graphemes(content, it);
    if (err != TextError::Ok) return err;

    const bool wrap = mode != WrapMode::None && viewportWidth > 0;

    // Clusters placed since the last break opportunity. Their widths are
    // re-measured when they move to a new row (tab stops shift).
    struct Placed {
        bool tab;
        std::uint32_t width;
    };
    std::vector<Placed> sinceOpportunity;

    struct Opportunity {
        std::size_t byteEnd = 0;
        std::size_t columnAfter = 0;
        std::uint32_t width = 0;
    };
    Opportunity opportunity;
    bool hasOpportunity = false;

    WrapSegment segment;
    segment.bytes = ByteRange{content.start, content.start};
    std::uint32_t col = 0;
    std::size_t graphemeColumn = 0;

    auto startRow = [&](std::size_t byte, std::size_t firstColumn) {
        out.push_back(segment);
        segment = WrapSegment{};
        segment.bytes = ByteRange{byte, byte};
        segment.firstColumn = firstColumn;
    };

    Grapheme g;
    while (it.next(g)) {
        bool placed = false;
        while (!placed) {
            const std::uint32_t w = measure(g, col);
            if (wrap && col > 0 && col + w > viewportWidth) {
                if (mode == WrapMode::Word && isSpace(g)) {
                    // Overflowing space hangs at the end of the row.
                    segment.bytes.end = g.bytes.end;
                    segment.width = col;
                    ++graphemeColumn;
                    startRow(g.bytes.end, graphemeColumn);
                    col = 0;
                    hasOpportunity = false;
                    sinceOpportunity.clear();
                    placed = true;
                    continue;
                }
                if (mode == WrapMode::Word && hasOpportunity) {
                    segment.bytes.end = opportunity.byteEnd;
                    segment.width = opportunity.width;
                    startRow(opportunity.byteEnd, opportunity.columnAfter);
                    col = 0;
                    for (Placed& p : sinceOpportunity) {
                        if (p.tab) p.width = tabAdvance(col);
                        col += p.width;
                    }
                    hasOpportunity = false;
                    continue;
                }
                segment.bytes.end = g.bytes.start;
                segment.width = col;
                startRow(g.bytes.start, graphemeColumn);
                col = 0;
                hasOpportunity = false;
                sinceOpportunity.clear();
                continue;
            }

            const std::uint32_t before = col;
            col += w;
            ++graphemeColumn;
            if (isBreakOpportunity(g)) {
                // A soft hyphen chosen as the break point renders as '-'.
                const std::uint32_t widthAt = isSoftHyphen(g) ? before + 1 : col;
                if (!wrap || widthAt <= viewportWidth) {
                    opportunity = Opportunity{g.bytes.end, graphemeColumn, widthAt};
                    hasOpportunity = true;
                }
                sinceOpportunity.clear();
            } else {
                sinceOpportunity.push_back(Placed{isTab(g), w});
            }
            placed = true;
        }
    }

    segment.bytes.end = content.end;
    segment.width = col;
    if (out.empty() || !segment.bytes.empty()) out.push_back(segment);
    return TextError::Ok;
}

TextError GlyphShaper::lineWidth(const TextStore& store, std::size_t line, std::uint32_t& out) const {
    std::vector<WrapSegment> segments;
    const TextError err = wrapSegments(store, line, WrapMode::None, 0, segments);
    if (err != TextError::Ok) return err;
    out = segments.front().width;
    return TextError::Ok;
}

// =============================================================================
// Glyph iteration
// =============================================================================

TextError GlyphShaper::glyphsForLine(const TextStore& store, std::size_t line,
                                     const std::vector<WrapSegment>& segments,
                                     std::uint32_t viewportWidth, GlyphIterator& out) const {
    ByteRange content;
    ByteRange full;
    TextError err = store.lineBytes(line, content);
    if (err != TextError::Ok) return err;
    err = store.lineBytesWithTerminator(line, full);
    if (err != TextError::Ok) return err;

    out = GlyphIterator{};
    err = store.graphemes(content, out.graphemes_);
    if (err != TextError::Ok) return err;

    out.shaper_ = this;
    out.segments_ = segments;
    if (out.segments_.empty()) {
        WrapSegment whole;
        whole.bytes = content;
        out.segments_.push_back(whole);
    }
    out.line_ = line;
    out.terminator_ = ByteRange{content.end, full.end};
    out.hasTerminator_ = full.end > content.end;
    out.wrapping_ = viewportWidth > 0;
    out.viewportWidth_ = viewportWidth;
    out.reset();
    return TextError::Ok;
}

TextError GlyphShaper::glyphsForLine(const TextStore& store, std::size_t line, WrapMode mode,
                                     std::uint32_t viewportWidth, GlyphIterator& out) const {
    std::vector<WrapSegment> segments;
    const TextError err = wrapSegments(store, line, mode, viewportWidth, segments);
    if (err != TextError::Ok) return err;
    const std::uint32_t width = (mode == WrapMode::None) ? 0 : viewportWidth;
    return glyphsForLine(store, line, segments, width, out);
}

void GlyphIterator::reset() {
    graphemes_.reset();
    segment_ = 0;
    column_ = 0;
    graphemeColumn_ = 0;
    pending_.clear();
    finished_ = shaper_ == nullptr;
}

bool GlyphIterator::atSoftBreak(const Grapheme& g) const {
    return segment_ + 1 < segments_.size() && g.bytes.end == segments_[segment_].bytes.end;
}

void GlyphIterator::emit(const Grapheme& g, Glyph& out) {
    shaper_->shape(g, column_, out);
    out.sourceBytes = g.bytes;
    out.pos = TextPosition{line_, graphemeColumn_};
    out.screenCol = column_;
    out.screenRow = segment_;
    if (wrapping_ && column_ + out.screenWidth > viewportWidth_) {
        out.screenWidth = viewportWidth_ > column_ ? viewportWidth_ - column_ : 0;
    }
    ++graphemeColumn_;

    if (atSoftBreak(g)) {
        if (g.text == kSoftHyphen) {
            out.text = "-";
            out.screenWidth = 1;
        }
        column_ += out.screenWidth;
        out.softBreak = true;
        if (shaper_->options().wrapCtrl) {
            Glyph marker;
            appendUtf8(marker.text, kSoftBreakMarker);
            marker.screenWidth = 1;
            marker.sourceBytes = ByteRange{g.bytes.end, g.bytes.end};
            marker.pos = TextPosition{line_, graphemeColumn_};
            marker.screenCol = column_;
            marker.screenRow = segment_;
            marker.lineBreak = true;
            marker.softBreak = true;
            pending_.push_back(marker);
        } else {
            out.lineBreak = true;
        }
        ++segment_;
        column_ = 0;
        return;
    }
    column_ += out.screenWidth;
}

bool GlyphIterator::next(Glyph& out) {
    if (!pending_.empty()) {
        out = std::move(pending_.front());
        pending_.pop_front();
        return true;
    }
    if (finished_) return false;

    Grapheme g;
    if (graphemes_.next(g)) {
        emit(g, out);
        return true;
    }

    finished_ = true;
    if (!hasTerminator_) return false;
    shaper_->shapeLineBreak(out);
    out.sourceBytes = terminator_;
    out.pos = TextPosition{line_, graphemeColumn_};
    out.screenCol = column_;
    out.screenRow = segment_;
    return true;
}

bool GlyphIterator::seekSegment(std::size_t index) {
    pending_.clear();
    if (shaper_ == nullptr || index >= segments_.size()) {
        finished_ = true;
        return false;
    }
    const WrapSegment& seg = segments_[index];
    graphemes_.skipTo(seg.bytes.start);
    segment_ = index;
    column_ = 0;
    graphemeColumn_ = seg.firstColumn;
    finished_ = false;
    return true;
}

TextError GlyphIterator::skipTo(std::size_t offset) {
    if (shaper_ == nullptr) return TextError::InvalidBoundary;
    const ByteRange& content = graphemes_.range();
    if (offset < content.start || offset > content.end) return TextError::InvalidBoundary;

    std::size_t index = 0;
    while (index + 1 < segments_.size() && segments_[index + 1].bytes.start <= offset) ++index;
    seekSegment(index);

    Grapheme g;
    while (graphemes_.offset() < offset && graphemes_.next(g)) {
        if (g.bytes.end > offset) {
            seekSegment(index);
            return TextError::InvalidBoundary;
        }
        column_ += shaper_->measure(g, column_);
        ++graphemeColumn_;
    }
    return TextError::Ok;
}

void GlyphIterator::skipToColumn(std::uint32_t column) {
    if (finished_) return;
    Grapheme g;
    while (pending_.empty() && graphemes_.next(g)) {
        const std::uint32_t w = shaper_->measure(g, column_);
        if (column_ + w <= column && !atSoftBreak(g)) {
            column_ += w;
            ++graphemeColumn_;
            continue;
        }
        Glyph glyph;
        emit(g, glyph);
        pending_.push_front(std::move(glyph));
    }
}

void GlyphIterator::skipLine() {
    pending_.clear();
    graphemes_.skipTo(graphemes_.range().end);
    finished_ = true;
}

} // namespace editcore::text
