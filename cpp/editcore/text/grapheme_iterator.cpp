#include "editcore/text/grapheme_iterator.h"
#include "editcore/core/utf8.h"

#include <algorithm>
#include <cstring>

namespace editcore::text {

namespace {
constexpr std::size_t kWindowStep = 256;
}

GraphemeIterator::GraphemeIterator(std::unique_ptr<ChunkSource> source, ByteRange range)
    : source_(std::move(source)), range_(range) {
    reset();
}

GraphemeIterator::GraphemeIterator(const GraphemeIterator& other)
    : source_(other.source_ ? other.source_->clone() : nullptr),
      range_(other.range_) {
    if (source_) {
        skipTo(other.pos_);
    } else {
        pos_ = other.pos_;
    }
}

GraphemeIterator& GraphemeIterator::operator=(const GraphemeIterator& other) {
    if (this != &other) {
        GraphemeIterator copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void GraphemeIterator::reset() {
    skipTo(range_.start);
}

bool GraphemeIterator::skipTo(std::size_t offset) {
    if (offset < range_.start || offset > range_.end) return false;
    pos_ = offset;
    bufferStart_ = offset;
    fetchedEnd_ = offset;
    buffer_.clear();
    pending_ = std::string_view();
    sourceDone_ = !source_ || offset >= range_.end;
    if (!sourceDone_) source_->seek(offset);
    breaker_.reset();
    return true;
}

bool GraphemeIterator::fill(std::size_t need) {
    while (buffered() < need) {
        if (pending_.empty()) {
            if (sourceDone_) return false;
            std::string_view view = source_->next();
            if (view.empty()) {
                sourceDone_ = true;
                return false;
            }
            if (fetchedEnd_ + view.size() >= range_.end) {
                view = view.substr(0, range_.end - fetchedEnd_);
                sourceDone_ = true;
            }
            fetchedEnd_ += view.size();
            pending_ = view;
            if (pending_.empty()) return false;
        }
        if (pos_ > bufferStart_) {
            buffer_.erase(0, pos_ - bufferStart_);
            bufferStart_ = pos_;
        }
        const std::size_t take = std::min(pending_.size(), kWindowStep);
        buffer_.append(pending_.data(), take);
        pending_.remove_prefix(take);
    }
    return true;
}

bool GraphemeIterator::next(Grapheme& out) {
    if (pos_ >= range_.end) return false;

    out.text.clear();
    out.bytes.start = pos_;
    breaker_.reset();

    bool first = true;
    while (pos_ < range_.end) {
        fill(4);
        const std::string_view window(buffer_.data() + (pos_ - bufferStart_), buffered());
        std::uint32_t len = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(window, 0, len);
        if (len == 0) break;
        const bool boundary = breaker_.isBoundaryBefore(cp);
        if (!first && boundary) break;
        out.text.append(window.data(), len);
        pos_ += len;
        first = false;
    }

    out.bytes.end = pos_;
    return !first;
}

void GraphemeIterator::skipLine() {
    // Scan what is already buffered, then pull raw chunks.
    const char* base = buffer_.data() + (pos_ - bufferStart_);
    std::size_t avail = buffered();
    if (const void* hit = std::memchr(base, '\n', avail)) {
        skipTo(pos_ + (static_cast<const char*>(hit) - base) + 1);
        return;
    }
    std::size_t scanned = pos_ + avail;
    if (!pending_.empty()) {
        if (const void* hit = std::memchr(pending_.data(), '\n', pending_.size())) {
            skipTo(scanned + (static_cast<const char*>(hit) - pending_.data()) + 1);
            return;
        }
        scanned += pending_.size();
    }
    while (!sourceDone_) {
        std::string_view view = source_->next();
        if (view.empty()) break;
        if (scanned + view.size() >= range_.end) {
            view = view.substr(0, range_.end - scanned);
            sourceDone_ = true;
        }
        if (const void* hit = std::memchr(view.data(), '\n', view.size())) {
            skipTo(scanned + (static_cast<const char*>(hit) - view.data()) + 1);
            return;
        }
        scanned += view.size();
    }
    skipTo(range_.end);
}

} // namespace editcore::text
