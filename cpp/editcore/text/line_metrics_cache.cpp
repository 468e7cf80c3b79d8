#include "editcore/text/line_metrics_cache.h"
#include "editcore/text/text_store.h"

namespace editcore::text {

void LineMetricsCache::configure(WrapMode mode, std::uint32_t viewportWidth, const ShaperOptions& options) {
    key_.mode = mode;
    key_.viewportWidth = (mode == WrapMode::None) ? 0 : viewportWidth;
    key_.options = options;
    shaper_.setOptions(options);
}

TextError LineMetricsCache::lineWidth(const TextStore& store, std::size_t line, std::uint32_t& out) {
    if (line >= store.lenLines()) return TextError::InvalidBoundary;
    Entry& entry = entries_[line];
    if (entry.width && entry.widthOptions == key_.options) {
        ++stats_.hits;
        out = *entry.width;
        return TextError::Ok;
    }

    std::uint32_t width = 0;
    const TextError err = shaper_.lineWidth(store, line, width);
    if (err != TextError::Ok) return err;
    ++stats_.widthComputations;
    entry.width = width;
    entry.widthOptions = key_.options;
    out = width;
    return TextError::Ok;
}

const std::vector<WrapSegment>* LineMetricsCache::wrapSegments(const TextStore& store, std::size_t line) {
    if (line >= store.lenLines()) return nullptr;
    Entry& entry = entries_[line];
    if (entry.segments && entry.segmentsKey == key_) {
        ++stats_.hits;
        return &*entry.segments;
    }

    std::vector<WrapSegment> segments;
    if (shaper_.wrapSegments(store, line, key_.mode, key_.viewportWidth, segments) != TextError::Ok) {
        return nullptr;
    }
    ++stats_.segmentComputations;
    entry.segments = std::move(segments);
    entry.segmentsKey = key_;
    return &*entry.segments;
}

std::size_t LineMetricsCache::lineCount(const TextStore& store) {
    if (!lineCount_) lineCount_ = store.lenLines();
    return *lineCount_;
}

void LineMetricsCache::invalidate(LineRange lines) {
    if (lines.end <= lines.start) return;
    auto first = entries_.lower_bound(lines.start);
    auto last = entries_.lower_bound(lines.end);
    for (auto it = first; it != last; ++it) ++stats_.invalidatedLines;
    entries_.erase(first, last);
}

void LineMetricsCache::applyDelta(const EditDelta& delta) {
    if (!delta.changesLineCount()) {
        invalidate(LineRange{delta.line, delta.line + 1});
        return;
    }
    // Line indices after the edit line shift; drop the tail.
    auto first = entries_.lower_bound(delta.line);
    for (auto it = first; it != entries_.end(); ++it) ++stats_.invalidatedLines;
    entries_.erase(first, entries_.end());
    lineCount_.reset();
}

void LineMetricsCache::clear() {
    entries_.clear();
    lineCount_.reset();
}

} // namespace editcore::text
