#pragma once
#include "timeline/model.hpp"
#include "core/config.hpp"
#include <memory>
#include <string>

namespace nle::commands {

/**
 * @brief Base class for all project edits
 *
 * A command is a pure transformation: it maps the current project state to the
 * next one and never touches the editor directly. The editor commits the result
 * as one history snapshot, so undo never needs a hand-written inverse.
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * @brief Compute the state after this edit
     * @return The new state, or a copy of @p state when the edit does not apply
     */
    virtual timeline::ProjectState apply(const timeline::ProjectState& state,
                                         const core::EditorConfig& cfg) const = 0;

    /**
     * @brief Human-readable description for undo/redo menus
     */
    virtual std::string description() const = 0;

    /**
     * @brief Key used to coalesce rapid repeats (drag updates of the same clip)
     * @return Empty when the command never merges
     */
    virtual std::string merge_key() const { return {}; }
};

using CommandPtr = std::unique_ptr<Command>;

} // namespace nle::commands
