#include "editcore/text/rope.h"
#include "editcore/core/utf8.h"

#include <algorithm>
#include <utility>

namespace editcore::text {

namespace {

std::uint32_t countBreaks(std::string_view text) {
    return static_cast<std::uint32_t>(std::count(text.begin(), text.end(), '\n'));
}

} // namespace

Rope::Rope() = default;

Rope::Rope(std::string_view text) {
    assign(text);
}

void Rope::assign(std::string_view text) {
    clear();
    root_ = build(text);
}

void Rope::clear() {
    nodes_.clear();
    free_.clear();
    root_ = kNil;
}

// =============================================================================
// Node pool
// =============================================================================

std::uint32_t Rope::nextPriority() {
    seed_ ^= seed_ << 13;
    seed_ ^= seed_ >> 17;
    seed_ ^= seed_ << 5;
    return seed_;
}

std::uint32_t Rope::allocate(std::string text) {
    std::uint32_t id;
    if (!free_.empty()) {
        id = free_.back();
        free_.pop_back();
        nodes_[id] = Node{};
    } else {
        id = static_cast<std::uint32_t>(nodes_.size());
        nodes_.emplace_back();
    }
    Node& node = nodes_[id];
    node.text = std::move(text);
    node.priority = nextPriority();
    node.ownBreaks = countBreaks(node.text);
    update(id);
    return id;
}

void Rope::release(std::uint32_t node) {
    nodes_[node].text = std::string();
    nodes_[node].left = kNil;
    nodes_[node].right = kNil;
    free_.push_back(node);
}

void Rope::releaseTree(std::uint32_t t) {
    if (t == kNil) return;
    releaseTree(nodes_[t].left);
    releaseTree(nodes_[t].right);
    release(t);
}

void Rope::update(std::uint32_t n) {
    Node& node = nodes_[n];
    node.bytes = node.text.size() + bytesOf(node.left) + bytesOf(node.right);
    node.breaks = node.ownBreaks + breaksOf(node.left) + breaksOf(node.right);
    node.count = 1 + countOf(node.left) + countOf(node.right);
}

// =============================================================================
// Treap primitives
// =============================================================================

std::uint32_t Rope::merge(std::uint32_t a, std::uint32_t b) {
    if (a == kNil) return b;
    if (b == kNil) return a;
    if (nodes_[a].priority > nodes_[b].priority) {
        const std::uint32_t merged = merge(nodes_[a].right, b);
        nodes_[a].right = merged;
        update(a);
        return a;
    }
    const std::uint32_t merged = merge(a, nodes_[b].left);
    nodes_[b].left = merged;
    update(b);
    return b;
}

void Rope::split(std::uint32_t t, std::uint32_t k, std::uint32_t& left, std::uint32_t& right) {
    if (t == kNil) {
        left = kNil;
        right = kNil;
        return;
    }
    const std::uint32_t leftCount = countOf(nodes_[t].left);
    if (k <= leftCount) {
        std::uint32_t l = kNil;
        std::uint32_t r = kNil;
        split(nodes_[t].left, k, l, r);
        nodes_[t].left = r;
        update(t);
        left = l;
        right = t;
    } else {
        std::uint32_t l = kNil;
        std::uint32_t r = kNil;
        split(nodes_[t].right, k - leftCount - 1, l, r);
        nodes_[t].right = l;
        update(t);
        left = t;
        right = r;
    }
}

std::uint32_t Rope::locate(std::size_t offset, std::size_t& inChunk) const {
    std::uint32_t n = root_;
    std::uint32_t rank = 0;
    while (n != kNil) {
        const Node& node = nodes_[n];
        const std::size_t leftBytes = bytesOf(node.left);
        if (node.left != kNil && offset <= leftBytes) {
            n = node.left;
            continue;
        }
        if (offset <= leftBytes + node.text.size()) {
            inChunk = offset - leftBytes;
            return rank + countOf(node.left);
        }
        offset -= leftBytes + node.text.size();
        rank += countOf(node.left) + 1;
        n = node.right;
    }
    inChunk = 0;
    return rank;
}

void Rope::siftDown(std::uint32_t n) {
    for (;;) {
        std::uint32_t best = n;
        const std::uint32_t l = nodes_[n].left;
        const std::uint32_t r = nodes_[n].right;
        if (l != kNil && nodes_[l].priority > nodes_[best].priority) best = l;
        if (r != kNil && nodes_[r].priority > nodes_[best].priority) best = r;
        if (best == n) return;
        std::swap(nodes_[n].priority, nodes_[best].priority);
        n = best;
    }
}

std::uint32_t Rope::buildRange(const std::vector<std::uint32_t>& chunks, std::size_t lo, std::size_t hi) {
    if (lo >= hi) return kNil;
    const std::size_t mid = lo + (hi - lo) / 2;
    const std::uint32_t n = chunks[mid];
    const std::uint32_t l = buildRange(chunks, lo, mid);
    const std::uint32_t r = buildRange(chunks, mid + 1, hi);
    nodes_[n].left = l;
    nodes_[n].right = r;
    update(n);
    siftDown(n);
    return n;
}

std::uint32_t Rope::build(std::string_view text) {
    if (text.empty()) return kNil;
    std::vector<std::uint32_t> chunks;
    chunks.reserve(text.size() / kMaxChunkBytes + 1);
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = std::min(text.size(), pos + kMaxChunkBytes);
        // Keep codepoints whole when a chunk is cut.
        while (end < text.size() && end > pos + 1 && isUtf8Continuation(text[end])) --end;
        chunks.push_back(allocate(std::string(text.substr(pos, end - pos))));
        pos = end;
    }
    return buildRange(chunks, 0, chunks.size());
}

std::uint32_t Rope::join(std::uint32_t left, std::string text, std::uint32_t right) {
    if (!text.empty() && text.size() < kMinChunkBytes && left != kNil) {
        std::uint32_t rest = kNil;
        std::uint32_t last = kNil;
        split(left, countOf(left) - 1, rest, last);
        if (nodes_[last].text.size() + text.size() <= kMaxChunkBytes) {
            text.insert(0, nodes_[last].text);
            release(last);
            left = rest;
        } else {
            left = merge(rest, last);
        }
    }
    if (!text.empty() && text.size() < kMinChunkBytes && right != kNil) {
        std::uint32_t first = kNil;
        std::uint32_t rest = kNil;
        split(right, 1, first, rest);
        if (nodes_[first].text.size() + text.size() <= kMaxChunkBytes) {
            text.append(nodes_[first].text);
            release(first);
            right = rest;
        } else {
            right = merge(first, rest);
        }
    }
    const std::uint32_t middle = build(text);
    return merge(merge(left, middle), right);
}

void Rope::collect(std::uint32_t t, std::string& out) const {
    if (t == kNil) return;
    collect(nodes_[t].left, out);
    out.append(nodes_[t].text);
    collect(nodes_[t].right, out);
}

// =============================================================================
// Queries
// =============================================================================

char Rope::byteAt(std::size_t offset) const {
    std::uint32_t n = root_;
    while (n != kNil) {
        const Node& node = nodes_[n];
        const std::size_t leftBytes = bytesOf(node.left);
        if (offset < leftBytes) {
            n = node.left;
            continue;
        }
        offset -= leftBytes;
        if (offset < node.text.size()) return node.text[offset];
        offset -= node.text.size();
        n = node.right;
    }
    return '\0';
}

std::size_t Rope::breaksBefore(std::size_t offset) const {
    std::size_t count = 0;
    std::uint32_t n = root_;
    while (n != kNil) {
        const Node& node = nodes_[n];
        const std::size_t leftBytes = bytesOf(node.left);
        if (offset <= leftBytes) {
            n = node.left;
            continue;
        }
        count += breaksOf(node.left);
        offset -= leftBytes;
        if (offset <= node.text.size()) {
            return count + countBreaks(std::string_view(node.text).substr(0, offset));
        }
        count += node.ownBreaks;
        offset -= node.text.size();
        n = node.right;
    }
    return count;
}

std::size_t Rope::lineStart(std::size_t line) const {
    if (line == 0) return 0;
    std::size_t remaining = line;
    std::size_t base = 0;
    std::uint32_t n = root_;
    while (n != kNil) {
        const Node& node = nodes_[n];
        if (remaining <= breaksOf(node.left)) {
            n = node.left;
            continue;
        }
        remaining -= breaksOf(node.left);
        base += bytesOf(node.left);
        if (remaining <= node.ownBreaks) {
            std::size_t idx = 0;
            for (;; ++idx) {
                if (node.text[idx] == '\n' && --remaining == 0) break;
            }
            return base + idx + 1;
        }
        remaining -= node.ownBreaks;
        base += node.text.size();
        n = node.right;
    }
    return size();
}

std::string Rope::slice(std::size_t offset, std::size_t len) const {
    std::string out;
    out.reserve(len);
    Cursor cursor(*this);
    cursor.seek(offset);
    while (out.size() < len) {
        const std::string_view view = cursor.next();
        if (view.empty()) break;
        out.append(view.substr(0, len - out.size()));
    }
    return out;
}

std::string Rope::toString() const {
    std::string out;
    out.reserve(size());
    collect(root_, out);
    return out;
}

// =============================================================================
// Mutation
// =============================================================================

void Rope::insert(std::size_t offset, std::string_view text) {
    if (text.empty()) return;
    if (root_ == kNil) {
        root_ = build(text);
        return;
    }
    std::size_t inChunk = 0;
    const std::uint32_t rank = locate(offset, inChunk);
    std::uint32_t before = kNil;
    std::uint32_t rest = kNil;
    std::uint32_t chunk = kNil;
    std::uint32_t after = kNil;
    split(root_, rank, before, rest);
    split(rest, 1, chunk, after);

    std::string merged = std::move(nodes_[chunk].text);
    release(chunk);
    merged.insert(inChunk, text.data(), text.size());
    root_ = join(before, std::move(merged), after);
}

void Rope::erase(std::size_t offset, std::size_t len, std::string* removed) {
    if (len == 0 || root_ == kNil) return;
    std::size_t startIn = 0;
    std::size_t endIn = 0;
    const std::uint32_t first = locate(offset, startIn);
    const std::uint32_t last = locate(offset + len, endIn);

    std::uint32_t before = kNil;
    std::uint32_t rest = kNil;
    std::uint32_t middle = kNil;
    std::uint32_t after = kNil;
    split(root_, first, before, rest);
    split(rest, last - first + 1, middle, after);

    std::string joined;
    collect(middle, joined);
    releaseTree(middle);

    if (removed) removed->assign(joined, startIn, len);
    joined.erase(startIn, len);
    root_ = join(before, std::move(joined), after);
}

// =============================================================================
// Cursor
// =============================================================================

void Rope::Cursor::seek(std::size_t offset) {
    stack_.clear();
    node_ = kNil;
    inChunk_ = 0;
    std::uint32_t n = rope_->root_;
    while (n != kNil) {
        const Node& node = rope_->nodes_[n];
        const std::size_t leftBytes = rope_->bytesOf(node.left);
        if (offset < leftBytes) {
            stack_.push_back(n);
            n = node.left;
            continue;
        }
        offset -= leftBytes;
        if (offset < node.text.size()) {
            node_ = n;
            inChunk_ = offset;
            return;
        }
        offset -= node.text.size();
        n = node.right;
    }
}

void Rope::Cursor::descendLeft(std::uint32_t node) {
    while (node != kNil) {
        stack_.push_back(node);
        node = rope_->nodes_[node].left;
    }
}

std::string_view Rope::Cursor::next() {
    if (node_ == kNil) return std::string_view();
    const Node& node = rope_->nodes_[node_];
    const std::string_view view = std::string_view(node.text).substr(inChunk_);
    inChunk_ = 0;
    descendLeft(node.right);
    if (stack_.empty()) {
        node_ = kNil;
    } else {
        node_ = stack_.back();
        stack_.pop_back();
    }
    return view;
}

} // namespace editcore::text
