#ifndef EDITCORE_HISTORY_UNDO_ENGINE_H
#define EDITCORE_HISTORY_UNDO_ENGINE_H

#include "editcore/history/undo_types.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace editcore::history {

/**
 * UndoEngine: grouped, capped undo/redo history.
 *
 * Idle -> beginGroup -> Grouping -> endGroup -> Idle. Nested pairs are
 * allowed; only the outermost pair delimits a group. record() while Idle
 * forms a single-record group. Groups before cursor_ are undoable, the rest
 * redoable; recording after an undo drops the redoable groups.
 *
 * Adjacent InsertChar records (and adjacent RemoveChar records) are merged
 * into the newest record, so a typed word or a run of backspaces is undone
 * in one step. Merging never crosses the start of an explicit group.
 */
class UndoEngine {
public:
    static constexpr std::uint32_t kDefaultLimit = 99;

    explicit UndoEngine(std::uint32_t limit = kDefaultLimit) : limit_(limit) {}

    void beginGroup();
    /** Open a group whose undo restores selectionBefore. */
    void beginGroup(const Selection& selectionBefore);
    void endGroup();
    bool isGrouping() const noexcept { return depth_ > 0; }

    void record(UndoRecord&& record);

    /**
     * Replay the inverse of the newest group.
     * @return Selection before the group, or nullopt when there is nothing to undo
     */
    std::optional<Selection> undo(UndoTarget& target);

    /** @return Selection after the group, or nullopt when there is nothing to redo */
    std::optional<Selection> redo(UndoTarget& target);

    std::size_t remainingUndo() const noexcept { return cursor_; }
    std::size_t remainingRedo() const noexcept { return history_.size() - cursor_; }
    bool canUndo() const noexcept { return cursor_ > 0; }
    bool canRedo() const noexcept { return cursor_ < history_.size(); }

    void clear();
    void setLimit(std::uint32_t limit);
    std::uint32_t limit() const noexcept { return limit_; }

    void setSuppressed(bool suppressed) { suppressed_ = suppressed; }
    bool isSuppressed() const { return suppressed_; }

    /** When false, style records are logged for replay but not kept for undo. */
    void setUndoStyles(bool undoStyles) { undoStyles_ = undoStyles; }
    bool undoStyles() const noexcept { return undoStyles_; }

    // ==========================================================================
    // Replay log
    // ==========================================================================

    /** Start or stop logging; toggling drops the pending entries. */
    void enableReplayLog(bool enable);
    bool hasReplayLog() const noexcept { return replayLog_; }
    /** Log a non-edit operation (SetText, Undo, Redo). */
    void logReplay(ReplayOp op, std::string text = {});
    /** Take the entries logged since the last call. */
    std::vector<ReplayEntry> recentReplayLog();
    /** While paused, records are kept for undo but not logged. */
    void pauseReplayLog(bool paused) { replayPaused_ = paused; }

    std::uint32_t getGeneration() const noexcept { return generation_; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }

private:
    void trim();
    void applyGroup(const UndoGroup& group, bool forward, UndoTarget& target);
    UndoRecord* mergeTarget();
    bool logging() const noexcept { return replayLog_ && !replayPaused_; }

    std::vector<UndoGroup> history_;
    std::size_t cursor_ = 0;
    std::uint32_t limit_;
    std::uint32_t depth_ = 0;
    bool groupOpen_ = false;  // history_.back() belongs to the open group
    bool suppressed_ = false;
    bool undoStyles_ = true;
    std::optional<Selection> groupSelection_;
    std::uint32_t generation_ = 0;

    bool replayLog_ = false;
    bool replayPaused_ = false;
    std::uint32_t sequence_ = 0;
    std::vector<ReplayEntry> replay_;
};

} // namespace editcore::history

#endif // EDITCORE_HISTORY_UNDO_ENGINE_H
