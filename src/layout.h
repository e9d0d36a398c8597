#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "binary_tree.h"
#include "model.h"

namespace splittab::layout {

// Axis-aligned rectangle, normalized [0,1] or pixels depending on context
struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  bool operator==(const Rect& other) const = default;
};

constexpr Rect kUnitRect{0.0, 0.0, 1.0, 1.0};

// A pane with its bounds
struct PaneBounds {
  PaneId pane_id;
  Rect bounds;
};

// Where a tab lives: tree node of its pane and position in the pane's list
struct TabLocation {
  int node_index = 0;
  size_t tab_index = 0;
};

// The whole split tree. Node 0 is the root; leaves hold PaneState, branches
// hold SplitState.
struct Layout {
  BinaryTree<NodeData> tree;
};

// ============================================================================
// Initialization
// ============================================================================

// Create a layout whose root is the given pane
[[nodiscard]] Layout create_layout(PaneState root_pane);

// ============================================================================
// Query Functions
// ============================================================================

[[nodiscard]] bool is_pane_node(const Layout& layout, int node_index);

[[nodiscard]] std::optional<int> find_pane_index(const Layout& layout, PaneId pane_id);

[[nodiscard]] std::optional<int> find_split_index(const Layout& layout, SplitId split_id);

// Linear scan over all panes
[[nodiscard]] std::optional<TabLocation> find_tab(const Layout& layout, TabId tab_id);

// Pointer into the tree, valid until the next structural mutation. Never hand
// these out of the engine.
[[nodiscard]] PaneState* pane_at(Layout& layout, int node_index);
[[nodiscard]] const PaneState* pane_at(const Layout& layout, int node_index);
[[nodiscard]] PaneState* find_pane(Layout& layout, PaneId pane_id);
[[nodiscard]] const PaneState* find_pane(const Layout& layout, PaneId pane_id);
[[nodiscard]] SplitState* find_split(Layout& layout, SplitId split_id);
[[nodiscard]] const SplitState* find_split(const Layout& layout, SplitId split_id);

// Pane ids in tree order (first subtree before second)
[[nodiscard]] std::vector<PaneId> all_pane_ids(const Layout& layout);

// Split ids in pre-order
[[nodiscard]] std::vector<SplitId> all_split_ids(const Layout& layout);

// Tab ids of all panes in tree order
[[nodiscard]] std::vector<TabId> all_tab_ids(const Layout& layout);

[[nodiscard]] size_t pane_count(const Layout& layout);

// ============================================================================
// Structure Operations
// ============================================================================

// Replace the target pane by a split holding the target and new_pane.
// new_pane goes second unless new_pane_first is set.
// Returns the new split's id, or nullopt if the target does not exist.
std::optional<SplitId> split_pane(Layout& layout, PaneId target, Orientation orientation,
                                  PaneState new_pane, bool new_pane_first = false);

// Remove a pane; its sibling subtree takes the parent split's place.
// Returns the first pane (tree order) of that sibling subtree, or nullopt if the
// pane does not exist or is the root.
std::optional<PaneId> close_pane(Layout& layout, PaneId pane_id);

// Set a split's divider, clamped to [0.1, 0.9]. Returns false if not found.
bool set_divider_position(Layout& layout, SplitId split_id, double position);

// ============================================================================
// Geometry
// ============================================================================

// Bounds of every node, indexed by node index, for the given root region
[[nodiscard]] std::vector<Rect> compute_node_bounds(const Layout& layout,
                                                    const Rect& region = kUnitRect);

// Bounds of every pane in tree order
[[nodiscard]] std::vector<PaneBounds> compute_pane_bounds(const Layout& layout,
                                                          const Rect& region = kUnitRect);

// Split a region into the first and second child regions of a split
[[nodiscard]] std::pair<Rect, Rect> split_region(const Rect& region, Orientation orientation,
                                                 double divider_position);

// Map a normalized rect into the container's pixel space
[[nodiscard]] Rect to_pixel_rect(const Rect& normalized, const Rect& container);

// ============================================================================
// Navigation
// ============================================================================

// Find the pane adjacent to current in the given direction. Prefers the largest
// overlap on the perpendicular axis, then the smallest gap. Returns nullopt at
// the edge of the layout.
[[nodiscard]] std::optional<PaneId> find_neighbor(const std::vector<PaneBounds>& bounds,
                                                  PaneId current, Direction dir);

// ============================================================================
// Utilities
// ============================================================================

// Validate structural invariants; anomalies are logged
[[nodiscard]] bool validate_layout(const Layout& layout);

// Debug: log the whole tree
void debug_print_layout(const Layout& layout);

} // namespace splittab::layout
