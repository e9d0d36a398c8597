#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ids.h"

namespace splittab {

// Horizontal = side by side (first is left), Vertical = stacked (first is top)
enum class Orientation { Horizontal, Vertical };

// Navigation direction
enum class Direction { Left, Right, Up, Down };

// Divider limits and default
constexpr double kMinDividerPosition = 0.1;
constexpr double kMaxDividerPosition = 0.9;
constexpr double kDefaultDividerPosition = 0.5;

// Tab metadata. Owned by exactly one pane; consumers only ever see copies.
struct Tab {
  TabId id;
  std::string title;
  std::optional<std::string> icon;
  bool is_dirty = false;
  bool is_closable = true;
  bool is_pinned = false;
};

// Leaf payload: an ordered tab list plus selection
struct PaneState {
  PaneId id;
  std::vector<Tab> tabs;
  std::optional<TabId> selected_tab_id;
};

// Branch payload. Children are the tree structure of the node holding it.
struct SplitState {
  SplitId id;
  Orientation orientation = Orientation::Horizontal;
  double divider_position = kDefaultDividerPosition;
};

// Payload of every tree node: a pane leaf or a split branch
using NodeData = std::variant<PaneState, SplitState>;

[[nodiscard]] PaneState make_pane(std::vector<Tab> tabs = {});
[[nodiscard]] SplitState make_split(Orientation orientation,
                                    double divider_position = kDefaultDividerPosition);

[[nodiscard]] double clamp_divider_position(double position);

// ============================================================================
// Pane Queries
// ============================================================================

[[nodiscard]] std::optional<size_t> find_tab_index(const PaneState& pane, TabId tab_id);

// Index of the first pinned tab, or tabs.size() if none is pinned
[[nodiscard]] size_t first_pinned_index(const PaneState& pane);

// Index of the first non-closable pinned tab, or tabs.size() if none
[[nodiscard]] size_t first_anchored_index(const PaneState& pane);

// Position the pinned ordering allows for tab when the requested index is index
// (nullopt = natural position at the end of its run)
[[nodiscard]] size_t clamp_insert_index(const PaneState& pane, const Tab& tab,
                                        std::optional<size_t> index);

// True when the pinned ordering and selection invariants hold
[[nodiscard]] bool is_pane_consistent(const PaneState& pane);

// ============================================================================
// Pane Mutation
// ============================================================================

// Insert tab at index (clamped to the list) and optionally select it
void insert_tab(PaneState& pane, Tab tab, size_t index, bool select = true);

// Remove a tab and return it. If it was selected, the previous neighbor is
// selected, else the new first tab, else nothing.
std::optional<Tab> remove_tab(PaneState& pane, TabId tab_id);

// Move a tab from one position to another, destination expressed in terms of
// the list before removal. Returns false for out-of-range or no-op moves.
bool move_tab_within(PaneState& pane, size_t from, size_t to);

// Select a tab of this pane. Returns false if the tab is not in the pane.
bool select_tab(PaneState& pane, TabId tab_id);

} // namespace splittab
