#include "layout.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <magic_enum/magic_enum.hpp>
#include <unordered_set>

namespace splittab::layout {

namespace {

constexpr double kNavigationEpsilon = 0.001;

void compute_children_bounds(const Layout& layout, int node_index, std::vector<Rect>& rects) {
  auto first_opt = layout.tree.get_first_child(node_index);
  auto second_opt = layout.tree.get_second_child(node_index);
  if (!first_opt.has_value() || !second_opt.has_value()) {
    return;
  }

  const auto* split = std::get_if<SplitState>(&layout.tree[node_index]);
  if (split == nullptr) {
    return;
  }

  auto [first, second] = split_region(rects[static_cast<size_t>(node_index)], split->orientation,
                                      split->divider_position);
  rects[static_cast<size_t>(*first_opt)] = first;
  rects[static_cast<size_t>(*second_opt)] = second;

  compute_children_bounds(layout, *first_opt, rects);
  compute_children_bounds(layout, *second_opt, rects);
}

// Check if 'to' lies entirely on the dir side of 'from'
bool is_in_direction(const Rect& from, const Rect& to, Direction dir) {
  switch (dir) {
  case Direction::Left:
    return to.x + to.width <= from.x + kNavigationEpsilon;
  case Direction::Right:
    return to.x >= from.x + from.width - kNavigationEpsilon;
  case Direction::Up:
    return to.y + to.height <= from.y + kNavigationEpsilon;
  case Direction::Down:
    return to.y >= from.y + from.height - kNavigationEpsilon;
  }
  return false;
}

// Shared extent on the axis perpendicular to dir
double perpendicular_overlap(const Rect& from, const Rect& to, Direction dir) {
  if (dir == Direction::Left || dir == Direction::Right) {
    return std::max(0.0, std::min(from.y + from.height, to.y + to.height) - std::max(from.y, to.y));
  }
  return std::max(0.0, std::min(from.x + from.width, to.x + to.width) - std::max(from.x, to.x));
}

// Gap along dir between the facing edges
double primary_gap(const Rect& from, const Rect& to, Direction dir) {
  switch (dir) {
  case Direction::Left:
    return from.x - (to.x + to.width);
  case Direction::Right:
    return to.x - (from.x + from.width);
  case Direction::Up:
    return from.y - (to.y + to.height);
  case Direction::Down:
    return to.y - (from.y + from.height);
  }
  return std::numeric_limits<double>::max();
}

} // namespace

// ============================================================================
// Initialization
// ============================================================================

Layout create_layout(PaneState root_pane) {
  Layout layout;
  layout.tree.add_node(NodeData{std::move(root_pane)});
  return layout;
}

// ============================================================================
// Query Functions
// ============================================================================

bool is_pane_node(const Layout& layout, int node_index) {
  return layout.tree.is_leaf(node_index) &&
         std::holds_alternative<PaneState>(layout.tree[node_index]);
}

std::optional<int> find_pane_index(const Layout& layout, PaneId pane_id) {
  for (int i = 0; i < static_cast<int>(layout.tree.size()); ++i) {
    const auto* pane = std::get_if<PaneState>(&layout.tree[i]);
    if (pane != nullptr && pane->id == pane_id) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<int> find_split_index(const Layout& layout, SplitId split_id) {
  for (int i = 0; i < static_cast<int>(layout.tree.size()); ++i) {
    const auto* split = std::get_if<SplitState>(&layout.tree[i]);
    if (split != nullptr && split->id == split_id) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<TabLocation> find_tab(const Layout& layout, TabId tab_id) {
  for (int i = 0; i < static_cast<int>(layout.tree.size()); ++i) {
    const auto* pane = std::get_if<PaneState>(&layout.tree[i]);
    if (pane == nullptr) {
      continue;
    }
    if (auto tab_index = find_tab_index(*pane, tab_id)) {
      return TabLocation{i, *tab_index};
    }
  }
  return std::nullopt;
}

PaneState* pane_at(Layout& layout, int node_index) {
  if (!layout.tree.is_valid_index(node_index)) {
    return nullptr;
  }
  return std::get_if<PaneState>(&layout.tree[node_index]);
}

const PaneState* pane_at(const Layout& layout, int node_index) {
  if (!layout.tree.is_valid_index(node_index)) {
    return nullptr;
  }
  return std::get_if<PaneState>(&layout.tree[node_index]);
}

PaneState* find_pane(Layout& layout, PaneId pane_id) {
  auto index = find_pane_index(layout, pane_id);
  return index.has_value() ? pane_at(layout, *index) : nullptr;
}

const PaneState* find_pane(const Layout& layout, PaneId pane_id) {
  auto index = find_pane_index(layout, pane_id);
  return index.has_value() ? pane_at(layout, *index) : nullptr;
}

SplitState* find_split(Layout& layout, SplitId split_id) {
  auto index = find_split_index(layout, split_id);
  return index.has_value() ? std::get_if<SplitState>(&layout.tree[*index]) : nullptr;
}

const SplitState* find_split(const Layout& layout, SplitId split_id) {
  auto index = find_split_index(layout, split_id);
  return index.has_value() ? std::get_if<SplitState>(&layout.tree[*index]) : nullptr;
}

std::vector<PaneId> all_pane_ids(const Layout& layout) {
  std::vector<PaneId> ids;
  for (int index : layout.tree.leaves_in_order()) {
    if (const auto* pane = pane_at(layout, index)) {
      ids.push_back(pane->id);
    }
  }
  return ids;
}

std::vector<SplitId> all_split_ids(const Layout& layout) {
  std::vector<SplitId> ids;
  for (int index : layout.tree.preorder()) {
    if (const auto* split = std::get_if<SplitState>(&layout.tree[index])) {
      ids.push_back(split->id);
    }
  }
  return ids;
}

std::vector<TabId> all_tab_ids(const Layout& layout) {
  std::vector<TabId> ids;
  for (int index : layout.tree.leaves_in_order()) {
    if (const auto* pane = pane_at(layout, index)) {
      for (const auto& tab : pane->tabs) {
        ids.push_back(tab.id);
      }
    }
  }
  return ids;
}

size_t pane_count(const Layout& layout) {
  return layout.tree.leaves_in_order().size();
}

// ============================================================================
// Structure Operations
// ============================================================================

std::optional<SplitId> split_pane(Layout& layout, PaneId target, Orientation orientation,
                                  PaneState new_pane, bool new_pane_first) {
  auto index = find_pane_index(layout, target);
  if (!index.has_value()) {
    return std::nullopt;
  }

  SplitState split = make_split(orientation);
  SplitId split_id = split.id;

  auto children = layout.tree.split_leaf(*index, NodeData{split}, NodeData{std::move(new_pane)},
                                         new_pane_first);
  if (!children.has_value()) {
    return std::nullopt;
  }

  spdlog::debug("split {} into {} ({})", target.to_string(), split_id.to_string(),
                magic_enum::enum_name(orientation));
  return split_id;
}

std::optional<PaneId> close_pane(Layout& layout, PaneId pane_id) {
  auto index = find_pane_index(layout, pane_id);
  if (!index.has_value()) {
    return std::nullopt;
  }

  auto parent_opt = layout.tree.get_parent(*index);
  if (!parent_opt.has_value()) {
    return std::nullopt; // Root pane has no sibling to promote
  }

  auto remap = layout.tree.collapse_leaf(*index);
  if (!remap.has_value()) {
    return std::nullopt;
  }

  // The sibling subtree now lives at the parent's (remapped) slot
  int promoted = (*remap)[static_cast<size_t>(*parent_opt)];
  auto leaves = layout.tree.leaves_in_order(promoted);
  if (leaves.empty()) {
    return std::nullopt;
  }

  const auto* focus_pane = pane_at(layout, leaves.front());
  if (focus_pane == nullptr) {
    return std::nullopt;
  }
  return focus_pane->id;
}

bool set_divider_position(Layout& layout, SplitId split_id, double position) {
  auto* split = find_split(layout, split_id);
  if (split == nullptr) {
    return false;
  }
  split->divider_position = clamp_divider_position(position);
  return true;
}

// ============================================================================
// Geometry
// ============================================================================

std::pair<Rect, Rect> split_region(const Rect& region, Orientation orientation,
                                   double divider_position) {
  if (orientation == Orientation::Horizontal) {
    double first_w = region.width * divider_position;
    return {Rect{region.x, region.y, first_w, region.height},
            Rect{region.x + first_w, region.y, region.width * (1.0 - divider_position),
                 region.height}};
  }

  double first_h = region.height * divider_position;
  return {Rect{region.x, region.y, region.width, first_h},
          Rect{region.x, region.y + first_h, region.width,
               region.height * (1.0 - divider_position)}};
}

std::vector<Rect> compute_node_bounds(const Layout& layout, const Rect& region) {
  std::vector<Rect> rects(layout.tree.size(), Rect{});
  if (layout.tree.empty()) {
    return rects;
  }

  rects[0] = region;
  compute_children_bounds(layout, 0, rects);
  return rects;
}

std::vector<PaneBounds> compute_pane_bounds(const Layout& layout, const Rect& region) {
  std::vector<Rect> rects = compute_node_bounds(layout, region);

  std::vector<PaneBounds> result;
  for (int index : layout.tree.leaves_in_order()) {
    if (const auto* pane = pane_at(layout, index)) {
      result.push_back(PaneBounds{pane->id, rects[static_cast<size_t>(index)]});
    }
  }
  return result;
}

Rect to_pixel_rect(const Rect& normalized, const Rect& container) {
  return Rect{normalized.x * container.width + container.x,
              normalized.y * container.height + container.y, normalized.width * container.width,
              normalized.height * container.height};
}

// ============================================================================
// Navigation
// ============================================================================

std::optional<PaneId> find_neighbor(const std::vector<PaneBounds>& bounds, PaneId current,
                                    Direction dir) {
  auto current_it = std::find_if(bounds.begin(), bounds.end(),
                                 [&](const PaneBounds& pb) { return pb.pane_id == current; });
  if (current_it == bounds.end()) {
    return std::nullopt;
  }
  const Rect& from = current_it->bounds;

  std::optional<PaneId> best;
  double best_overlap = -1.0;
  double best_gap = std::numeric_limits<double>::max();

  for (const auto& candidate : bounds) {
    if (candidate.pane_id == current || !is_in_direction(from, candidate.bounds, dir)) {
      continue;
    }

    double overlap = perpendicular_overlap(from, candidate.bounds, dir);
    double gap = primary_gap(from, candidate.bounds, dir);

    bool better = false;
    if (std::abs(overlap - best_overlap) > kNavigationEpsilon) {
      better = overlap > best_overlap;
    } else {
      better = gap < best_gap;
    }

    if (better) {
      best = candidate.pane_id;
      best_overlap = overlap;
      best_gap = gap;
    }
  }

  return best;
}

// ============================================================================
// Utilities
// ============================================================================

bool validate_layout(const Layout& layout) {
  bool ok = true;

  if (layout.tree.empty()) {
    spdlog::error("[validate_layout] tree is empty");
    return false;
  }
  if (layout.tree.node(0).parent.has_value()) {
    spdlog::error("[validate_layout] root node has a parent");
    ok = false;
  }

  std::unordered_set<PaneId> pane_ids;
  std::unordered_set<SplitId> split_ids;
  std::unordered_set<TabId> tab_ids;

  auto reachable = layout.tree.preorder();
  if (reachable.size() != layout.tree.size()) {
    spdlog::error("[validate_layout] {} of {} nodes are unreachable from the root",
                  layout.tree.size() - reachable.size(), layout.tree.size());
    ok = false;
  }

  for (int i : reachable) {
    const auto& node = layout.tree.node(i);
    bool leaf = layout.tree.is_leaf(i);

    for (auto child : {node.first_child, node.second_child}) {
      if (child.has_value() && layout.tree.get_parent(*child) != i) {
        spdlog::error("[validate_layout] node {} does not point back to parent {}", *child, i);
        ok = false;
      }
    }

    if (const auto* pane = std::get_if<PaneState>(&node.data)) {
      if (!leaf) {
        spdlog::error("[validate_layout] pane {} has children", pane->id.to_string());
        ok = false;
      }
      if (!pane_ids.insert(pane->id).second) {
        spdlog::error("[validate_layout] duplicate pane id {}", pane->id.to_string());
        ok = false;
      }
      if (!is_pane_consistent(*pane)) {
        spdlog::error("[validate_layout] pane {} has an invalid selection or tab order",
                      pane->id.to_string());
        ok = false;
      }
      for (const auto& tab : pane->tabs) {
        if (!tab_ids.insert(tab.id).second) {
          spdlog::error("[validate_layout] tab {} is owned twice", tab.id.to_string());
          ok = false;
        }
      }
    } else {
      const auto& split = std::get<SplitState>(node.data);
      if (leaf || !node.first_child.has_value() || !node.second_child.has_value()) {
        spdlog::error("[validate_layout] split {} is missing children", split.id.to_string());
        ok = false;
      }
      if (!split_ids.insert(split.id).second) {
        spdlog::error("[validate_layout] duplicate split id {}", split.id.to_string());
        ok = false;
      }
      if (split.divider_position < kMinDividerPosition ||
          split.divider_position > kMaxDividerPosition) {
        spdlog::error("[validate_layout] split {} divider {} out of range", split.id.to_string(),
                      split.divider_position);
        ok = false;
      }
    }
  }

  if (!ok) {
    spdlog::warn("[validate_layout] layout has anomalies");
  }
  return ok;
}

void debug_print_layout(const Layout& layout) {
  spdlog::debug("===== Layout =====");
  spdlog::debug("tree.size = {}", layout.tree.size());

  for (int i = 0; i < static_cast<int>(layout.tree.size()); ++i) {
    const auto& node = layout.tree.node(i);
    auto fmt_index = [](const std::optional<int>& v) { return v.has_value() ? *v : -1; };

    if (const auto* pane = std::get_if<PaneState>(&node.data)) {
      spdlog::debug("  [{}] parent={} pane={} tabs={} selected={}", i, fmt_index(node.parent),
                    pane->id.to_string(), pane->tabs.size(),
                    pane->selected_tab_id ? pane->selected_tab_id->to_string() : "null");
    } else {
      const auto& split = std::get<SplitState>(node.data);
      spdlog::debug("  [{}] parent={} first={} second={} split={} orientation={} divider={:.2f}",
                    i, fmt_index(node.parent), fmt_index(node.first_child),
                    fmt_index(node.second_child), split.id.to_string(),
                    magic_enum::enum_name(split.orientation), split.divider_position);
    }
  }

  spdlog::debug("===== End Layout =====");
}

} // namespace splittab::layout
