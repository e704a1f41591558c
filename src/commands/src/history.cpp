#include "commands/history.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace nle::commands {

CommandHistory::CommandHistory(size_t max_history)
    : max_history_(std::max<size_t>(1, max_history)) {
    nle::log::debug("Created command history with max size: " + std::to_string(max_history_));
}

void CommandHistory::reset(timeline::ProjectState initial) {
    past_.clear();
    future_.clear();
    past_.push_back(Entry{std::move(initial), "Load project", {}, std::chrono::steady_clock::now()});
    nle::log::debug("Command history reset");
}

bool CommandHistory::save(timeline::ProjectState state, std::string description, std::string merge_key) {
    auto now = std::chrono::steady_clock::now();
    future_.clear();

    // Coalesce with the previous step when the same target is edited again inside the window
    if(merge_window_.count() > 0 && !merge_key.empty() && past_.size() > 1) {
        auto& top = past_.back();
        if(top.merge_key == merge_key && now - top.at <= merge_window_) {
            top.state = std::move(state);
            top.at = now;
            nle::log::debug("History step coalesced: " + top.description);
            return false;
        }
    }

    past_.push_back(Entry{std::move(state), std::move(description), std::move(merge_key), now});
    trim_history();
    nle::log::debug("History step saved. Depth: " + std::to_string(undo_depth()));
    return true;
}

std::optional<timeline::ProjectState> CommandHistory::undo() {
    if(!can_undo()) {
        nle::log::debug("Cannot undo: no steps in history");
        return std::nullopt;
    }
    future_.push_back(std::move(past_.back()));
    past_.pop_back();
    while(future_.size() > max_history_) future_.pop_front();
    nle::log::info("Undid: " + future_.back().description);
    return past_.back().state;
}

std::optional<timeline::ProjectState> CommandHistory::redo() {
    if(!can_redo()) {
        nle::log::debug("Cannot redo: at end of history");
        return std::nullopt;
    }
    past_.push_back(std::move(future_.back()));
    future_.pop_back();
    trim_history();
    nle::log::info("Redid: " + past_.back().description);
    return past_.back().state;
}

std::string CommandHistory::undo_description() const {
    if(!can_undo()) return "";
    return past_.back().description;
}

std::string CommandHistory::redo_description() const {
    if(!can_redo()) return "";
    return future_.back().description;
}

const timeline::ProjectState* CommandHistory::current() const {
    return past_.empty() ? nullptr : &past_.back().state;
}

void CommandHistory::patch_all(const std::function<void(timeline::ProjectState&)>& fn) {
    if(!fn) return;
    for(auto& e : past_) fn(e.state);
    for(auto& e : future_) fn(e.state);
}

void CommandHistory::set_max_history(size_t max_history) {
    max_history_ = std::max<size_t>(1, max_history);
    trim_history();
    while(future_.size() > max_history_) future_.pop_front();
}

void CommandHistory::trim_history() {
    if(past_.size() <= max_history_) return;
    size_t excess = past_.size() - max_history_;
    past_.erase(past_.begin(), past_.begin() + static_cast<std::ptrdiff_t>(excess));
    nle::log::debug("Trimmed command history. Removed " + std::to_string(excess) + " old snapshots");
}

} // namespace nle::commands
