#include "snapshot.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace splittab {

namespace {

using nlohmann::json;

json rect_to_json(const layout::Rect& r) {
  return json{{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

layout::Rect rect_from_json(const json& j) {
  return layout::Rect{j.at("x").get<double>(), j.at("y").get<double>(),
                      j.at("width").get<double>(), j.at("height").get<double>()};
}

json optional_string_to_json(const std::optional<std::string>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_string_from_json(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

double seconds_since_epoch() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

ExternalTreeNode build_node(const layout::Layout& layout, int index,
                            const std::vector<layout::Rect>& bounds,
                            const layout::Rect& container_frame) {
  if (const auto* pane = layout::pane_at(layout, index)) {
    ExternalPaneNode pane_node;
    pane_node.id = pane->id.to_string();
    pane_node.frame = layout::to_pixel_rect(bounds[static_cast<size_t>(index)], container_frame);
    for (const auto& tab : pane->tabs) {
      pane_node.tabs.push_back(ExternalTab{tab.id.to_string(), tab.title});
    }
    if (pane->selected_tab_id.has_value()) {
      pane_node.selected_tab_id = pane->selected_tab_id->to_string();
    }
    return ExternalTreeNode{std::move(pane_node)};
  }

  const auto& split = std::get<SplitState>(layout.tree[index]);
  ExternalSplitNode split_node;
  split_node.id = split.id.to_string();
  split_node.orientation = split.orientation;
  split_node.divider_position = split.divider_position;
  split_node.first = std::make_unique<ExternalTreeNode>(
      build_node(layout, *layout.tree.get_first_child(index), bounds, container_frame));
  split_node.second = std::make_unique<ExternalTreeNode>(
      build_node(layout, *layout.tree.get_second_child(index), bounds, container_frame));
  return ExternalTreeNode{std::move(split_node)};
}

ExternalTreeNode tree_from_json(const json& j) {
  std::string type = j.at("type").get<std::string>();

  if (type == "pane") {
    const json& p = j.at("pane");
    ExternalPaneNode pane;
    pane.id = p.at("id").get<std::string>();
    pane.frame = rect_from_json(p.at("frame"));
    for (const auto& t : p.at("tabs")) {
      pane.tabs.push_back(ExternalTab{t.at("id").get<std::string>(), t.value("title", "")});
    }
    pane.selected_tab_id = optional_string_from_json(p, "selectedTabId");
    return ExternalTreeNode{std::move(pane)};
  }

  if (type == "split") {
    const json& s = j.at("split");
    ExternalSplitNode split;
    split.id = s.at("id").get<std::string>();
    auto orientation = orientation_from_string(s.at("orientation").get<std::string>());
    if (!orientation.has_value()) {
      throw std::invalid_argument("unknown orientation: " + s.at("orientation").get<std::string>());
    }
    split.orientation = *orientation;
    split.divider_position = s.at("dividerPosition").get<double>();
    split.first = std::make_unique<ExternalTreeNode>(tree_from_json(s.at("first")));
    split.second = std::make_unique<ExternalTreeNode>(tree_from_json(s.at("second")));
    return ExternalTreeNode{std::move(split)};
  }

  throw std::invalid_argument("unknown node type: " + type);
}

} // anonymous namespace

// ============================================================================
// Builders
// ============================================================================

LayoutSnapshot build_layout_snapshot(const layout::Layout& layout,
                                     const layout::Rect& container_frame,
                                     std::optional<PaneId> focused_pane_id) {
  LayoutSnapshot snapshot;
  snapshot.container_frame = container_frame;

  for (const auto& pb : layout::compute_pane_bounds(layout)) {
    const auto* pane = layout::find_pane(layout, pb.pane_id);
    if (pane == nullptr) {
      continue;
    }

    PaneGeometry geometry;
    geometry.pane_id = pb.pane_id.to_string();
    geometry.frame = layout::to_pixel_rect(pb.bounds, container_frame);
    if (pane->selected_tab_id.has_value()) {
      geometry.selected_tab_id = pane->selected_tab_id->to_string();
    }
    for (const auto& tab : pane->tabs) {
      geometry.tab_ids.push_back(tab.id.to_string());
    }
    snapshot.panes.push_back(std::move(geometry));
  }

  if (focused_pane_id.has_value()) {
    snapshot.focused_pane_id = focused_pane_id->to_string();
  }
  snapshot.timestamp = seconds_since_epoch();
  return snapshot;
}

ExternalTreeNode build_tree_snapshot(const layout::Layout& layout,
                                     const layout::Rect& container_frame) {
  auto bounds = layout::compute_node_bounds(layout);
  return build_node(layout, 0, bounds, container_frame);
}

size_t count_panes(const ExternalTreeNode& node) {
  if (const auto* split = std::get_if<ExternalSplitNode>(&node.node)) {
    return (split->first ? count_panes(*split->first) : 0) +
           (split->second ? count_panes(*split->second) : 0);
  }
  return 1;
}

// ============================================================================
// JSON
// ============================================================================

std::string orientation_to_string(Orientation orientation) {
  return orientation == Orientation::Horizontal ? "horizontal" : "vertical";
}

std::optional<Orientation> orientation_from_string(const std::string& str) {
  if (str == "horizontal") {
    return Orientation::Horizontal;
  }
  if (str == "vertical") {
    return Orientation::Vertical;
  }
  return std::nullopt;
}

nlohmann::json to_json(const LayoutSnapshot& snapshot) {
  json panes = json::array();
  for (const auto& pane : snapshot.panes) {
    panes.push_back(json{{"paneId", pane.pane_id},
                         {"frame", rect_to_json(pane.frame)},
                         {"selectedTabId", optional_string_to_json(pane.selected_tab_id)},
                         {"tabIds", pane.tab_ids}});
  }

  json j;
  j["containerFrame"] = rect_to_json(snapshot.container_frame);
  j["panes"] = panes;
  j["focusedPaneId"] = optional_string_to_json(snapshot.focused_pane_id);
  j["timestamp"] = snapshot.timestamp;
  return j;
}

nlohmann::json to_json(const ExternalTreeNode& node) {
  json j;

  if (const auto* pane = std::get_if<ExternalPaneNode>(&node.node)) {
    json tabs = json::array();
    for (const auto& tab : pane->tabs) {
      tabs.push_back(json{{"id", tab.id}, {"title", tab.title}});
    }
    j["type"] = "pane";
    j["pane"] = json{{"id", pane->id},
                     {"frame", rect_to_json(pane->frame)},
                     {"tabs", tabs},
                     {"selectedTabId", optional_string_to_json(pane->selected_tab_id)}};
    return j;
  }

  const auto& split = std::get<ExternalSplitNode>(node.node);
  j["type"] = "split";
  j["split"] = json{{"id", split.id},
                    {"orientation", orientation_to_string(split.orientation)},
                    {"dividerPosition", split.divider_position},
                    {"first", split.first ? to_json(*split.first) : json(nullptr)},
                    {"second", split.second ? to_json(*split.second) : json(nullptr)}};
  return j;
}

SnapshotParseResult parse_layout_snapshot(const std::string& text) {
  try {
    json j = json::parse(text);
    LayoutSnapshot snapshot;
    snapshot.container_frame = rect_from_json(j.at("containerFrame"));
    for (const auto& p : j.at("panes")) {
      PaneGeometry geometry;
      geometry.pane_id = p.at("paneId").get<std::string>();
      geometry.frame = rect_from_json(p.at("frame"));
      geometry.selected_tab_id = optional_string_from_json(p, "selectedTabId");
      geometry.tab_ids = p.at("tabIds").get<std::vector<std::string>>();
      snapshot.panes.push_back(std::move(geometry));
    }
    snapshot.focused_pane_id = optional_string_from_json(j, "focusedPaneId");
    snapshot.timestamp = j.at("timestamp").get<double>();
    return SnapshotParseResult{true, "", std::move(snapshot)};
  } catch (const json::exception& e) {
    return SnapshotParseResult{false, std::string("JSON error: ") + e.what(), {}};
  }
}

TreeParseResult parse_tree_snapshot(const std::string& text) {
  try {
    json j = json::parse(text);
    return TreeParseResult{true, "", tree_from_json(j)};
  } catch (const json::exception& e) {
    return TreeParseResult{false, std::string("JSON error: ") + e.what(), std::nullopt};
  } catch (const std::invalid_argument& e) {
    spdlog::debug("rejected tree snapshot: {}", e.what());
    return TreeParseResult{false, e.what(), std::nullopt};
  }
}

} // namespace splittab
