#include "editcore/history/undo_engine.h"
#include "editcore/core/logging.h"

namespace editcore::history {

namespace {

bool containsSequence(const std::vector<style::StyleSpan>& spans, std::uint64_t sequence) {
    for (const style::StyleSpan& span : spans) {
        if (span.sequence == sequence) return true;
    }
    return false;
}

// Character edits at the same seam: typing on, backspacing, deleting forward.
bool canMerge(const UndoRecord& last, const UndoRecord& curr) {
    if (last.kind != curr.kind) return false;
    if (curr.kind == UndoOpKind::InsertChar) return last.bytes.end == curr.bytes.start;
    if (curr.kind == UndoOpKind::RemoveChar) {
        return curr.bytes.end == last.bytes.start || curr.bytes.start == last.bytes.start;
    }
    return false;
}

// Fold curr into last; requires canMerge(last, curr).
void mergeRecords(UndoRecord& last, const UndoRecord& curr) {
    if (curr.kind == UndoOpKind::InsertChar) {
        last.bytes.end = curr.bytes.end;
        last.text += curr.text;
        last.selectionAfter = curr.selectionAfter;
        return;
    }

    // curr's spans are in offsets after last's removal; those at or past a
    // sat after last's text, so they move right by its length.
    const std::size_t a = last.bytes.start;
    const std::size_t shift = last.bytes.size();
    for (style::StyleSpan span : curr.stylesBefore) {
        if (containsSequence(last.stylesBefore, span.sequence)) continue;
        if (span.range.start >= a) span.range.start += shift;
        if (span.range.end > a) span.range.end += shift;
        last.stylesBefore.push_back(span);
    }
    if (curr.bytes.end == a) {
        // Backspace
        last.bytes.start = curr.bytes.start;
        last.text.insert(0, curr.text);
    } else {
        // Forward delete
        last.bytes.end += curr.bytes.size();
        last.text += curr.text;
    }
    last.selectionAfter = curr.selectionAfter;
}

} // namespace

void UndoEngine::beginGroup() {
    if (depth_ == 0) {
        groupOpen_ = false;
        groupSelection_.reset();
        ++sequence_;
    }
    ++depth_;
}

void UndoEngine::beginGroup(const Selection& selectionBefore) {
    const bool outermost = depth_ == 0;
    beginGroup();
    if (outermost) groupSelection_ = selectionBefore;
}

void UndoEngine::endGroup() {
    if (depth_ == 0) {
        EDITCORE_LOG_WARN("UndoEngine::endGroup without matching beginGroup");
        return;
    }
    --depth_;
    if (depth_ == 0) groupOpen_ = false;
}

UndoRecord* UndoEngine::mergeTarget() {
    if (history_.empty() || cursor_ != history_.size()) return nullptr;
    // The first record of an explicit group starts fresh.
    if (depth_ > 0 && !groupOpen_) return nullptr;
    UndoGroup& group = history_.back();
    return group.records.empty() ? nullptr : &group.records.back();
}

void UndoEngine::record(UndoRecord&& record) {
    if (suppressed_) return;

    UndoRecord* last = mergeTarget();
    const bool merge = last && canMerge(*last, record);
    // A merged record continues the sequence of the record it joins.
    if (!merge && depth_ == 0) ++sequence_;
    if (logging()) replay_.push_back(ReplayEntry{sequence_, ReplayOp::Edit, record, {}});

    if (merge) {
        mergeRecords(*last, record);
        ++generation_;
        return;
    }
    if (isStyleOp(record.kind) && !undoStyles_) return;

    if (depth_ > 0 && groupOpen_ && cursor_ == history_.size() && !history_.empty()) {
        history_.back().records.push_back(std::move(record));
        ++generation_;
        return;
    }

    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    UndoGroup group;
    group.selectionBefore = (depth_ > 0 && groupSelection_) ? *groupSelection_ : record.selectionBefore;
    group.records.push_back(std::move(record));
    history_.push_back(std::move(group));
    cursor_ = history_.size();
    groupOpen_ = depth_ > 0;
    ++generation_;
    trim();
}

void UndoEngine::trim() {
    while (history_.size() > limit_) {
        // The open group is still being filled; never evict it.
        if (groupOpen_ && history_.size() == 1) break;
        history_.erase(history_.begin());
        if (cursor_ > 0) --cursor_;
        EDITCORE_LOG_DEBUG("UndoEngine evicted oldest group (limit %u)", limit_);
    }
}

void UndoEngine::setLimit(std::uint32_t limit) {
    limit_ = limit;
    trim();
}

void UndoEngine::clear() {
    history_.clear();
    cursor_ = 0;
    groupOpen_ = false;
    ++generation_;
}

// =============================================================================
// Replay log
// =============================================================================

void UndoEngine::enableReplayLog(bool enable) {
    if (replayLog_ != enable) replay_.clear();
    replayLog_ = enable;
}

void UndoEngine::logReplay(ReplayOp op, std::string text) {
    if (!logging() || suppressed_) return;
    if (depth_ == 0) ++sequence_;
    replay_.push_back(ReplayEntry{sequence_, op, {}, std::move(text)});
}

std::vector<ReplayEntry> UndoEngine::recentReplayLog() {
    std::vector<ReplayEntry> out;
    out.swap(replay_);
    return out;
}

void UndoEngine::applyGroup(const UndoGroup& group, bool forward, UndoTarget& target) {
    const bool wasSuppressed = suppressed_;
    suppressed_ = true;

    auto apply = [&](const UndoRecord& r) {
        switch (r.kind) {
            case UndoOpKind::InsertText:
            case UndoOpKind::InsertChar:
                if (forward) {
                    target.replayInsert(r.bytes.start, r.text, true);
                } else {
                    target.replayRemove(text::ByteRange{r.bytes.start, r.bytes.start + r.text.size()});
                }
                break;
            case UndoOpKind::RemoveText:
            case UndoOpKind::RemoveChar:
                if (forward) {
                    target.replayRemove(r.bytes);
                } else {
                    target.replayInsert(r.bytes.start, r.text, false);
                    target.replayStyles(r.bytes, r.stylesBefore);
                }
                break;
            case UndoOpKind::AddStyle:
                if (forward) {
                    target.replayAddStyle(r.bytes, r.tag);
                } else {
                    target.replayRemoveStyle(r.bytes, r.tag);
                }
                break;
            case UndoOpKind::RemoveStyle:
                if (forward) {
                    target.replayRemoveStyle(r.bytes, r.tag);
                } else {
                    target.replayAddStyle(r.bytes, r.tag);
                }
                break;
            case UndoOpKind::SetStyles:
                target.replaySetStyles(forward ? r.stylesAfter : r.stylesBefore);
                break;
        }
    };

    if (forward) {
        for (const UndoRecord& r : group.records) apply(r);
    } else {
        for (auto it = group.records.rbegin(); it != group.records.rend(); ++it) apply(*it);
    }

    suppressed_ = wasSuppressed;
}

std::optional<Selection> UndoEngine::undo(UndoTarget& target) {
    if (cursor_ == 0) return std::nullopt;
    const UndoGroup& group = history_[cursor_ - 1];
    if (group.records.empty()) return std::nullopt;
    --cursor_;
    groupOpen_ = false;
    applyGroup(group, false, target);
    ++generation_;
    return group.selectionBefore;
}

std::optional<Selection> UndoEngine::redo(UndoTarget& target) {
    if (cursor_ >= history_.size()) return std::nullopt;
    const UndoGroup& group = history_[cursor_];
    if (group.records.empty()) return std::nullopt;
    ++cursor_;
    groupOpen_ = false;
    applyGroup(group, true, target);
    ++generation_;
    return group.records.back().selectionAfter;
}

} // namespace editcore::history
