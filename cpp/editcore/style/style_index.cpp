#include "editcore/style/style_index.h"

#include <algorithm>

namespace editcore::style {

namespace {

std::size_t offsetBy(std::size_t value, std::int64_t delta) {
    return static_cast<std::size_t>(static_cast<std::int64_t>(value) + delta);
}

bool bySequence(const StyleSpan& a, const StyleSpan& b) {
    return a.sequence < b.sequence;
}

bool byStartThenSequence(const StyleSpan& a, const StyleSpan& b) {
    if (a.range.start != b.range.start) return a.range.start < b.range.start;
    return a.sequence < b.sequence;
}

} // namespace

StyleIndex::StyleIndex() = default;

// =============================================================================
// Node pool / treap primitives
// =============================================================================

std::uint32_t StyleIndex::nextPriority() {
    seed_ ^= seed_ << 13;
    seed_ ^= seed_ >> 17;
    seed_ ^= seed_ << 5;
    return seed_;
}

std::uint32_t StyleIndex::allocate(const StyleSpan& span) {
    std::uint32_t id;
    if (!free_.empty()) {
        id = free_.back();
        free_.pop_back();
    } else {
        id = static_cast<std::uint32_t>(nodes_.size());
        nodes_.emplace_back();
    }
    Node& node = nodes_[id];
    node = Node{};
    node.start = span.range.start;
    node.end = span.range.end;
    node.maxEnd = span.range.end;
    node.tag = span.tag;
    node.sequence = span.sequence;
    node.priority = nextPriority();
    ++size_;
    return id;
}

void StyleIndex::release(std::uint32_t n) {
    nodes_[n].left = kNil;
    nodes_[n].right = kNil;
    free_.push_back(n);
    --size_;
}

void StyleIndex::shift(std::uint32_t n, std::int64_t delta) {
    if (n == kNil || delta == 0) return;
    Node& node = nodes_[n];
    node.start = offsetBy(node.start, delta);
    node.end = offsetBy(node.end, delta);
    node.maxEnd = offsetBy(node.maxEnd, delta);
    node.lazy += delta;
}

void StyleIndex::push(std::uint32_t n) {
    Node& node = nodes_[n];
    if (node.lazy == 0) return;
    const std::int64_t delta = node.lazy;
    node.lazy = 0;
    shift(node.left, delta);
    shift(node.right, delta);
}

void StyleIndex::pull(std::uint32_t n) {
    Node& node = nodes_[n];
    node.maxEnd = node.end;
    if (node.left != kNil) node.maxEnd = std::max(node.maxEnd, nodes_[node.left].maxEnd);
    if (node.right != kNil) node.maxEnd = std::max(node.maxEnd, nodes_[node.right].maxEnd);
}

std::uint32_t StyleIndex::merge(std::uint32_t a, std::uint32_t b) {
    if (a == kNil) return b;
    if (b == kNil) return a;
    if (nodes_[a].priority > nodes_[b].priority) {
        push(a);
        const std::uint32_t merged = merge(nodes_[a].right, b);
        nodes_[a].right = merged;
        pull(a);
        return a;
    }
    push(b);
    const std::uint32_t merged = merge(a, nodes_[b].left);
    nodes_[b].left = merged;
    pull(b);
    return b;
}

void StyleIndex::split(std::uint32_t t, std::size_t key, std::uint32_t& left, std::uint32_t& right) {
    if (t == kNil) {
        left = kNil;
        right = kNil;
        return;
    }
    push(t);
    std::uint32_t l = kNil;
    std::uint32_t r = kNil;
    if (nodes_[t].start < key) {
        split(nodes_[t].right, key, l, r);
        nodes_[t].right = l;
        pull(t);
        left = t;
        right = r;
    } else {
        split(nodes_[t].left, key, l, r);
        nodes_[t].left = r;
        pull(t);
        left = l;
        right = t;
    }
}

void StyleIndex::insertNode(std::uint32_t n) {
    std::uint32_t left = kNil;
    std::uint32_t right = kNil;
    split(root_, nodes_[n].start + 1, left, right);
    root_ = merge(merge(left, n), right);
}

void StyleIndex::collect(std::uint32_t t, std::vector<std::uint32_t>& out) {
    if (t == kNil) return;
    push(t);
    collect(nodes_[t].left, out);
    out.push_back(t);
    collect(nodes_[t].right, out);
}

std::uint32_t StyleIndex::rebuild(const std::vector<std::uint32_t>& ordered) {
    std::uint32_t tree = kNil;
    for (std::uint32_t n : ordered) {
        nodes_[n].left = kNil;
        nodes_[n].right = kNil;
        nodes_[n].lazy = 0;
        nodes_[n].maxEnd = nodes_[n].end;
        tree = merge(tree, n);
    }
    return tree;
}

// =============================================================================
// Add / Remove
// =============================================================================

bool StyleIndex::add(ByteRange range, std::uint32_t tag) {
    if (range.empty()) return false;
    if (findExact(root_, 0, range, tag)) return false;
    StyleSpan span{range, tag, nextSequence_++};
    insertNode(allocate(span));
    return true;
}

bool StyleIndex::remove(ByteRange range, std::uint32_t tag) {
    return removeWhere(range, tag, 0);
}

bool StyleIndex::erase(const StyleSpan& span) {
    return removeWhere(span.range, span.tag, span.sequence);
}

void StyleIndex::restore(const StyleSpan& span) {
    if (span.range.empty()) return;
    insertNode(allocate(span));
    nextSequence_ = std::max(nextSequence_, span.sequence + 1);
}

bool StyleIndex::removeWhere(ByteRange range, std::uint32_t tag, std::uint64_t sequence) {
    std::uint32_t left = kNil;
    std::uint32_t rest = kNil;
    std::uint32_t middle = kNil;
    std::uint32_t right = kNil;
    split(root_, range.start, left, rest);
    split(rest, range.start + 1, middle, right);

    std::vector<std::uint32_t> group;
    collect(middle, group);
    bool found = false;
    std::vector<std::uint32_t> kept;
    kept.reserve(group.size());
    for (std::uint32_t n : group) {
        const Node& node = nodes_[n];
        if (!found && node.end == range.end && node.tag == tag &&
            (sequence == 0 || node.sequence == sequence)) {
            found = true;
            release(n);
            continue;
        }
        kept.push_back(n);
    }
    middle = rebuild(kept);
    root_ = merge(merge(left, middle), right);
    return found;
}

void StyleIndex::set(const std::vector<std::pair<ByteRange, std::uint32_t>>& spans) {
    clear();
    for (const auto& span : spans) add(span.first, span.second);
}

void StyleIndex::clear() {
    nodes_.clear();
    free_.clear();
    root_ = kNil;
    size_ = 0;
}

// =============================================================================
// Edits
// =============================================================================

void StyleIndex::extendEnds(std::uint32_t t, std::size_t offset, std::size_t len, bool inclusive) {
    if (t == kNil || nodes_[t].maxEnd < offset) return;
    if (!inclusive && nodes_[t].maxEnd == offset) return;
    push(t);
    Node& node = nodes_[t];
    if (node.end > offset || (inclusive && node.end == offset)) node.end += len;
    extendEnds(node.left, offset, len, inclusive);
    extendEnds(nodes_[t].right, offset, len, inclusive);
    pull(t);
}

void StyleIndex::clipEnds(std::uint32_t t, std::size_t a, std::size_t b) {
    if (t == kNil || nodes_[t].maxEnd <= a) return;
    push(t);
    Node& node = nodes_[t];
    if (node.end > a) node.end = (node.end <= b) ? a : node.end - (b - a);
    clipEnds(node.left, a, b);
    clipEnds(nodes_[t].right, a, b);
    pull(t);
}

void StyleIndex::applyInsert(std::size_t offset, std::size_t len, bool extendAtEdit) {
    std::uint32_t left = kNil;
    std::uint32_t right = kNil;
    split(root_, offset, left, right);
    shift(right, static_cast<std::int64_t>(len));
    extendEnds(left, offset, len, extendAtEdit);
    root_ = merge(left, right);
}

void StyleIndex::applyRemove(std::size_t a, std::size_t b) {
    const std::size_t len = b - a;
    std::uint32_t left = kNil;
    std::uint32_t rest = kNil;
    std::uint32_t middle = kNil;
    std::uint32_t right = kNil;
    split(root_, a, left, rest);
    split(rest, b, middle, right);

    shift(right, -static_cast<std::int64_t>(len));

    // Spans starting inside the removed range collapse onto a.
    std::vector<std::uint32_t> inside;
    collect(middle, inside);
    std::vector<std::uint32_t> kept;
    for (std::uint32_t n : inside) {
        Node& node = nodes_[n];
        const std::size_t end = (node.end <= b) ? a : node.end - len;
        if (end <= a) {
            release(n);
            continue;
        }
        node.start = a;
        node.end = end;
        kept.push_back(n);
    }
    std::sort(kept.begin(), kept.end(), [this](std::uint32_t x, std::uint32_t y) {
        return nodes_[x].sequence < nodes_[y].sequence;
    });
    middle = rebuild(kept);

    clipEnds(left, a, b);
    root_ = merge(merge(left, middle), right);
}

void StyleIndex::applyDelta(const EditDelta& delta, bool extendAtEdit) {
    if (root_ == kNil) return;
    if (delta.removedBytes > 0) applyRemove(delta.offset, delta.offset + delta.removedBytes);
    if (delta.insertedBytes > 0) applyInsert(delta.offset, delta.insertedBytes, extendAtEdit);
}

// =============================================================================
// Queries
// =============================================================================

bool StyleIndex::findExact(std::uint32_t t, std::int64_t acc, ByteRange range, std::uint32_t tag) const {
    if (t == kNil) return false;
    const Node& node = nodes_[t];
    const std::int64_t childAcc = acc + node.lazy;
    const std::size_t start = offsetBy(node.start, acc);
    if (start < range.start) return findExact(node.right, childAcc, range, tag);
    if (start > range.start) return findExact(node.left, childAcc, range, tag);
    if (offsetBy(node.end, acc) == range.end && node.tag == tag) return true;
    return findExact(node.left, childAcc, range, tag) || findExact(node.right, childAcc, range, tag);
}

void StyleIndex::queryOverlap(std::uint32_t t, std::int64_t acc, std::size_t a, std::size_t b,
                              bool touching, std::vector<StyleSpan>& out) const {
    if (t == kNil) return;
    const Node& node = nodes_[t];
    const std::size_t maxEnd = offsetBy(node.maxEnd, acc);
    if (touching ? maxEnd < a : maxEnd <= a) return;

    const std::int64_t childAcc = acc + node.lazy;
    queryOverlap(node.left, childAcc, a, b, touching, out);

    const std::size_t start = offsetBy(node.start, acc);
    const std::size_t end = offsetBy(node.end, acc);
    if (touching ? start > b : start >= b) return;
    if (touching ? end >= a : end > a) {
        out.push_back(StyleSpan{ByteRange{start, end}, node.tag, node.sequence});
    }
    queryOverlap(node.right, childAcc, a, b, touching, out);
}

void StyleIndex::queryAll(std::uint32_t t, std::int64_t acc, std::vector<StyleSpan>& out) const {
    if (t == kNil) return;
    const Node& node = nodes_[t];
    const std::int64_t childAcc = acc + node.lazy;
    queryAll(node.left, childAcc, out);
    out.push_back(StyleSpan{ByteRange{offsetBy(node.start, acc), offsetBy(node.end, acc)}, node.tag, node.sequence});
    queryAll(node.right, childAcc, out);
}

std::vector<StyleSpan> StyleIndex::stylesIn(ByteRange range) const {
    std::vector<StyleSpan> out;
    if (range.empty()) return out;
    queryOverlap(root_, 0, range.start, range.end, false, out);
    std::stable_sort(out.begin(), out.end(), byStartThenSequence);
    return out;
}

std::vector<StyleSpan> StyleIndex::stylesTouching(ByteRange range) const {
    std::vector<StyleSpan> out;
    queryOverlap(root_, 0, range.start, range.end, true, out);
    std::stable_sort(out.begin(), out.end(), byStartThenSequence);
    return out;
}

std::vector<std::uint32_t> StyleIndex::stylesAt(std::size_t offset) const {
    std::vector<StyleSpan> spans;
    queryOverlap(root_, 0, offset, offset + 1, false, spans);
    std::sort(spans.begin(), spans.end(), bySequence);
    std::vector<std::uint32_t> tags;
    tags.reserve(spans.size());
    for (const StyleSpan& span : spans) tags.push_back(span.tag);
    return tags;
}

std::vector<StyleSpan> StyleIndex::spans() const {
    std::vector<StyleSpan> out;
    out.reserve(size_);
    queryAll(root_, 0, out);
    std::stable_sort(out.begin(), out.end(), byStartThenSequence);
    return out;
}

} // namespace editcore::style
