#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "layout.h"

namespace splittab {

// Pixel geometry of one pane
struct PaneGeometry {
  std::string pane_id;
  layout::Rect frame;
  std::optional<std::string> selected_tab_id;
  std::vector<std::string> tab_ids;
};

// Flat, pixel-mapped picture of the layout handed to did_change_geometry
struct LayoutSnapshot {
  layout::Rect container_frame;
  std::vector<PaneGeometry> panes; // Tree order
  std::optional<std::string> focused_pane_id;
  double timestamp = 0.0; // Seconds since the Unix epoch
};

struct ExternalTab {
  std::string id;
  std::string title;
};

struct ExternalTreeNode;

struct ExternalPaneNode {
  std::string id;
  layout::Rect frame;
  std::vector<ExternalTab> tabs;
  std::optional<std::string> selected_tab_id;
};

struct ExternalSplitNode {
  std::string id;
  Orientation orientation = Orientation::Horizontal;
  double divider_position = kDefaultDividerPosition;
  std::unique_ptr<ExternalTreeNode> first;
  std::unique_ptr<ExternalTreeNode> second;
};

// Recursive projection of the whole tree with pixel frames
struct ExternalTreeNode {
  std::variant<ExternalPaneNode, ExternalSplitNode> node;
};

// ============================================================================
// Builders
// ============================================================================

[[nodiscard]] LayoutSnapshot build_layout_snapshot(const layout::Layout& layout,
                                                   const layout::Rect& container_frame,
                                                   std::optional<PaneId> focused_pane_id);

[[nodiscard]] ExternalTreeNode build_tree_snapshot(const layout::Layout& layout,
                                                   const layout::Rect& container_frame);

// Number of pane leaves below node
[[nodiscard]] size_t count_panes(const ExternalTreeNode& node);

// ============================================================================
// JSON
// ============================================================================

[[nodiscard]] std::string orientation_to_string(Orientation orientation);
[[nodiscard]] std::optional<Orientation> orientation_from_string(const std::string& str);

[[nodiscard]] nlohmann::json to_json(const LayoutSnapshot& snapshot);
[[nodiscard]] nlohmann::json to_json(const ExternalTreeNode& node);

struct SnapshotParseResult {
  bool success;
  std::string error;       // Set if success == false
  LayoutSnapshot snapshot; // Valid if success == true
};

struct TreeParseResult {
  bool success;
  std::string error;                  // Set if success == false
  std::optional<ExternalTreeNode> tree; // Set if success == true
};

// Decode a snapshot. Missing or mistyped required fields fail the parse.
[[nodiscard]] SnapshotParseResult parse_layout_snapshot(const std::string& text);

// Decode a tree. Node types other than "pane" and "split" fail the parse.
[[nodiscard]] TreeParseResult parse_tree_snapshot(const std::string& text);

} // namespace splittab
