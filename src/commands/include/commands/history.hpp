#pragma once
#include "timeline/model.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace nle::commands {

/**
 * @brief Snapshot based undo/redo stacks
 *
 * The top of the past stack is always the current project state. undo() moves it
 * onto the future stack and exposes the entry below; redo() moves it back. Both
 * stacks are bounded; the oldest snapshots are dropped first.
 */
class CommandHistory {
public:
    explicit CommandHistory(size_t max_history = 50);

    /**
     * @brief Clear both stacks and seed the past with @p initial
     */
    void reset(timeline::ProjectState initial);

    /**
     * @brief Record a new current state and clear the redo stack
     * @param merge_key Non-empty key lets a save inside the merge window replace the
     *        previous one instead of adding a step
     * @return true when a new step was added, false when it was merged
     */
    bool save(timeline::ProjectState state, std::string description = {}, std::string merge_key = {});

    /**
     * @brief Step back
     * @return The state to restore, or nullopt when nothing can be undone
     */
    std::optional<timeline::ProjectState> undo();

    /**
     * @brief Step forward
     * @return The state to restore, or nullopt when nothing can be redone
     */
    std::optional<timeline::ProjectState> redo();

    bool can_undo() const { return past_.size() > 1; }
    bool can_redo() const { return !future_.empty(); }

    std::string undo_description() const;
    std::string redo_description() const;

    // Current state, or nullptr before the first reset/save
    const timeline::ProjectState* current() const;

    // Applies fn to every stored snapshot (derived asset metadata survives undo)
    void patch_all(const std::function<void(timeline::ProjectState&)>& fn);

    size_t undo_depth() const { return past_.empty() ? 0 : past_.size() - 1; }
    size_t redo_depth() const { return future_.size(); }

    void set_max_history(size_t max_history);
    size_t max_history() const { return max_history_; }

    // 0 disables merging
    void set_merge_window(std::chrono::milliseconds window) { merge_window_ = window; }

private:
    struct Entry {
        timeline::ProjectState state;
        std::string description;
        std::string merge_key;
        std::chrono::steady_clock::time_point at;
    };

    void trim_history();

    std::deque<Entry> past_;
    std::deque<Entry> future_;
    size_t max_history_;
    std::chrono::milliseconds merge_window_{0};
};

} // namespace nle::commands
