#pragma once

#include <optional>

#include "actions.h"
#include "app_state.h"

namespace sn {

// Pure reducers. `now` is sampled once by the caller so that the same
// (state, action, now) always yields the same result.

// Subject, Note, Page and per-entity Template actions. Also maintains the
// selection in UIState, which points into content.
std::optional<AppState> reduceContent(const AppState& state, const Action& action, Timestamp now);

// Navigation actions plus the Settings actions that live in UIState
// (search text, debug mode).
std::optional<UIState> reduceUI(const UIState& state, const Action& action);

// Settings actions and the default template.
std::optional<SettingsState> reduceSettings(const SettingsState& state, const Action& action);

// Fans out to the slice reducers by action category. Returns nothing when
// the action is inapplicable (e.g. it references a missing entity).
std::optional<AppState> applyAction(const AppState& state, const Action& action, Timestamp now);

// Total form of applyAction: inapplicable actions return `state` unchanged.
AppState reduce(const AppState& state, const Action& action, Timestamp now);

} // namespace sn
