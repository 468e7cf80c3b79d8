#ifndef EDITCORE_TEXT_LINE_METRICS_CACHE_H
#define EDITCORE_TEXT_LINE_METRICS_CACHE_H

#include "editcore/text/text_types.h"
#include "editcore/text/glyph_shaper.h"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace editcore::text {

class TextStore;

/**
 * LineMetricsCache: memoized per-line width and wrap rows.
 *
 * Entries are keyed by line index and remember the rendering key they were
 * computed under; a mismatching entry is stale and recomputed on access.
 * Edits arrive as EditDelta values: an edit without line breaks drops one
 * entry, an edit that adds or removes breaks drops every entry from the edit
 * line on. The cache never references the store; callers pass it per query.
 */
class LineMetricsCache {
public:
    struct Stats {
        std::uint64_t widthComputations = 0;
        std::uint64_t segmentComputations = 0;
        std::uint64_t hits = 0;
        std::uint64_t invalidatedLines = 0;
    };

    /** Starts keyed on the shaper's options; later changes go through configure(). */
    explicit LineMetricsCache(const GlyphShaper& shaper) : shaper_(shaper.options()) {
        key_.options = shaper.options();
    }

    /** Set the current rendering key. Existing entries become stale lazily. */
    void configure(WrapMode mode, std::uint32_t viewportWidth, const ShaperOptions& options);

    WrapMode wrapMode() const { return key_.mode; }
    std::uint32_t viewportWidth() const { return key_.viewportWidth; }

    /** Unwrapped display width. */
    TextError lineWidth(const TextStore& store, std::size_t line, std::uint32_t& out);

    /**
     * Wrap rows under the current key.
     * @return Pointer valid until the next cache mutation, or nullptr for an
     *         invalid line
     */
    const std::vector<WrapSegment>* wrapSegments(const TextStore& store, std::size_t line);

    std::size_t lineCount(const TextStore& store);

    void invalidate(LineRange lines);
    void applyDelta(const EditDelta& delta);
    void clear();

    std::size_t entryCount() const { return entries_.size(); }
    const Stats& getStats() const { return stats_; }

private:
    struct Key {
        WrapMode mode = WrapMode::None;
        std::uint32_t viewportWidth = 0;
        ShaperOptions options;

        bool operator==(const Key& o) const {
            return mode == o.mode && viewportWidth == o.viewportWidth && options == o.options;
        }
        bool operator!=(const Key& o) const { return !(*this == o); }
    };

    struct Entry {
        std::optional<std::uint32_t> width;
        ShaperOptions widthOptions;
        std::optional<std::vector<WrapSegment>> segments;
        Key segmentsKey;
    };

    GlyphShaper shaper_;  // Shapes with key_.options
    Key key_;
    std::map<std::size_t, Entry> entries_;
    std::optional<std::size_t> lineCount_;
    Stats stats_;
};

} // namespace editcore::text

#endif // EDITCORE_TEXT_LINE_METRICS_CACHE_H
