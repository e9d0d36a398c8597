#include "controller.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>

#include "utility.h"

namespace splittab {

namespace {

const Clock& default_clock() {
  static const SteadyClock clock;
  return clock;
}

} // namespace

Controller::Controller(Configuration configuration, std::shared_ptr<EventQueue> queue)
    : configuration_(std::move(configuration)), queue_(std::move(queue)),
      alive_(std::make_shared<bool>(true)) {
  if (!queue_) {
    queue_ = std::make_shared<EventQueue>(default_clock());
  }
  PaneState root = make_pane();
  focused_pane_id_ = root.id;
  layout_ = layout::create_layout(std::move(root));
}

void Controller::set_delegate(Delegate* delegate) {
  delegate_ = delegate;
}

void Controller::set_configuration(const Configuration& configuration) {
  configuration_ = configuration;
  spdlog::debug("configuration replaced");
}

// ============================================================================
// Tab Operations
// ============================================================================

size_t Controller::new_tab_index(const PaneState& pane, const Tab& tab) const {
  if (tab.is_pinned) {
    return clamp_insert_index(pane, tab, std::nullopt);
  }

  size_t pinned = first_pinned_index(pane);
  if (configuration_.new_tab_position == NewTabPosition::Current &&
      pane.selected_tab_id.has_value()) {
    auto selected = find_tab_index(pane, *pane.selected_tab_id);
    if (selected.has_value() && !pane.tabs[*selected].is_pinned) {
      return std::min(*selected + 1, pinned);
    }
  }
  return pinned;
}

std::optional<TabId> Controller::create_tab(const std::string& title,
                                            std::optional<std::string> icon, bool is_dirty,
                                            bool is_closable, bool is_pinned,
                                            std::optional<PaneId> pane) {
  PaneId target = pane.value_or(focused_pane_id_);
  if (layout::find_pane(layout_, target) == nullptr) {
    spdlog::debug("create_tab: unknown pane {}", target.to_string());
    return std::nullopt;
  }

  Tab tab;
  tab.id = TabId::generate();
  tab.title = title;
  tab.icon = std::move(icon);
  tab.is_dirty = is_dirty;
  tab.is_closable = is_closable;
  tab.is_pinned = is_pinned;

  if (delegate_ != nullptr && !delegate_->should_create_tab(tab, target)) {
    spdlog::debug("create_tab: vetoed in {}", target.to_string());
    return std::nullopt;
  }

  // The delegate may have restructured the tree
  PaneState* owner = layout::find_pane(layout_, target);
  if (owner == nullptr) {
    return std::nullopt;
  }

  size_t index = new_tab_index(*owner, tab);
  insert_tab(*owner, tab, index);
  mark_mutated();
  spdlog::debug("created {} in {} at {}", tab.id.to_string(), target.to_string(), index);

  if (delegate_ != nullptr) {
    delegate_->did_create_tab(tab, target);
  }
  return tab.id;
}

bool Controller::update_tab(TabId tab_id, const TabUpdate& update) {
  auto location = layout::find_tab(layout_, tab_id);
  if (!location.has_value()) {
    return false;
  }

  PaneState* owner = layout::pane_at(layout_, location->node_index);
  Tab& tab = owner->tabs[location->tab_index];
  bool changed = false;

  if (update.title.has_value() && tab.title != *update.title) {
    tab.title = *update.title;
    changed = true;
  }
  if (update.icon.has_value() && tab.icon != *update.icon) {
    tab.icon = *update.icon;
    changed = true;
  }
  if (update.is_dirty.has_value() && tab.is_dirty != *update.is_dirty) {
    tab.is_dirty = *update.is_dirty;
    changed = true;
  }
  if (update.is_pinned.has_value() && tab.is_pinned != *update.is_pinned) {
    Tab moved = std::move(tab);
    moved.is_pinned = *update.is_pinned;
    owner->tabs.erase(owner->tabs.begin() + static_cast<std::ptrdiff_t>(location->tab_index));

    // Pinning lands before non-closable pinned tabs, unpinning just before the
    // first pinned tab
    size_t index = clamp_insert_index(*owner, moved, std::nullopt);
    owner->tabs.insert(owner->tabs.begin() + static_cast<std::ptrdiff_t>(index),
                       std::move(moved));
    changed = true;
  }

  if (changed) {
    mark_mutated();
  }
  return changed;
}

bool Controller::close_tab(TabId tab_id, std::optional<PaneId> pane) {
  std::optional<layout::TabLocation> location;
  if (pane.has_value()) {
    auto node_index = layout::find_pane_index(layout_, *pane);
    if (!node_index.has_value()) {
      return false;
    }
    auto tab_index = find_tab_index(*layout::pane_at(layout_, *node_index), tab_id);
    if (!tab_index.has_value()) {
      return false;
    }
    location = layout::TabLocation{*node_index, *tab_index};
  } else {
    location = layout::find_tab(layout_, tab_id);
  }
  if (!location.has_value()) {
    return false;
  }

  const PaneState* owner = layout::pane_at(layout_, location->node_index);
  Tab tab = owner->tabs[location->tab_index];
  PaneId pane_id = owner->id;

  if (delegate_ != nullptr && !delegate_->should_close_tab(tab, pane_id)) {
    spdlog::debug("close_tab: {} vetoed", tab_id.to_string());
    return false;
  }

  PaneState* current = layout::find_pane(layout_, pane_id);
  if (current == nullptr || !remove_tab(*current, tab_id).has_value()) {
    return false;
  }
  mark_mutated();
  spdlog::debug("closed {} in {}", tab_id.to_string(), pane_id.to_string());

  if (delegate_ != nullptr) {
    delegate_->did_close_tab(tab_id, pane_id);
  }
  collapse_if_empty(pane_id);
  return true;
}

bool Controller::move_tab(TabId tab_id, PaneId target, std::optional<size_t> index) {
  auto location = layout::find_tab(layout_, tab_id);
  if (!location.has_value() || layout::find_pane(layout_, target) == nullptr) {
    return false;
  }

  PaneState* source_pane = layout::pane_at(layout_, location->node_index);
  PaneId source = source_pane->id;
  bool same_pane = source == target;

  if (same_pane && !configuration_.allow_tab_reordering) {
    spdlog::debug("move_tab: reordering disabled");
    return false;
  }
  if (!same_pane && !configuration_.allow_cross_pane_tab_move) {
    spdlog::debug("move_tab: cross-pane moves disabled");
    return false;
  }

  std::optional<Tab> moved = remove_tab(*source_pane, tab_id);
  if (!moved.has_value()) {
    return false;
  }

  // Same-pane destinations are given in terms of the list before removal
  if (same_pane && index.has_value() && *index > location->tab_index) {
    index = *index - 1;
  }

  PaneState* target_pane = layout::find_pane(layout_, target);
  size_t at = clamp_insert_index(*target_pane, *moved, index);
  Tab notified = *moved;
  insert_tab(*target_pane, std::move(*moved), at);
  focused_pane_id_ = target;
  mark_mutated();
  spdlog::debug("moved {} from {} to {} at {}", tab_id.to_string(), source.to_string(),
                target.to_string(), at);

  if (delegate_ != nullptr) {
    delegate_->did_move_tab(notified, source, target);
  }
  if (!same_pane) {
    collapse_if_empty(source);
  }
  return true;
}

bool Controller::select_tab(TabId tab_id) {
  auto location = layout::find_tab(layout_, tab_id);
  if (!location.has_value()) {
    return false;
  }

  PaneState* owner = layout::pane_at(layout_, location->node_index);
  splittab::select_tab(*owner, tab_id);
  focused_pane_id_ = owner->id;
  mark_mutated();

  if (delegate_ != nullptr) {
    delegate_->did_select_tab(owner->tabs[location->tab_index], owner->id);
  }
  return true;
}

bool Controller::select_next_tab() {
  PaneState* pane = layout::find_pane(layout_, focused_pane_id_);
  if (pane == nullptr || pane->tabs.empty() || !pane->selected_tab_id.has_value()) {
    return false;
  }
  auto current = find_tab_index(*pane, *pane->selected_tab_id);
  if (!current.has_value()) {
    return false;
  }

  size_t next = *current + 1 < pane->tabs.size() ? *current + 1 : 0;
  pane->selected_tab_id = pane->tabs[next].id;
  mark_mutated();

  if (delegate_ != nullptr) {
    delegate_->did_select_tab(pane->tabs[next], pane->id);
  }
  return true;
}

bool Controller::select_previous_tab() {
  PaneState* pane = layout::find_pane(layout_, focused_pane_id_);
  if (pane == nullptr || pane->tabs.empty() || !pane->selected_tab_id.has_value()) {
    return false;
  }
  auto current = find_tab_index(*pane, *pane->selected_tab_id);
  if (!current.has_value()) {
    return false;
  }

  size_t previous = *current > 0 ? *current - 1 : pane->tabs.size() - 1;
  pane->selected_tab_id = pane->tabs[previous].id;
  mark_mutated();

  if (delegate_ != nullptr) {
    delegate_->did_select_tab(pane->tabs[previous], pane->id);
  }
  return true;
}

// ============================================================================
// Pane Operations
// ============================================================================

std::optional<PaneId> Controller::split_pane(std::optional<PaneId> pane, Orientation orientation,
                                             std::optional<Tab> with_tab) {
  if (!configuration_.allow_splits) {
    spdlog::debug("split_pane: splits disabled");
    return std::nullopt;
  }

  PaneId target = pane.value_or(focused_pane_id_);
  if (layout::find_pane(layout_, target) == nullptr) {
    return std::nullopt;
  }
  if (with_tab.has_value() && layout::find_tab(layout_, with_tab->id).has_value()) {
    spdlog::debug("split_pane: {} already belongs to a pane", with_tab->id.to_string());
    return std::nullopt;
  }

  if (delegate_ != nullptr && !delegate_->should_split_pane(target, orientation)) {
    spdlog::debug("split_pane: {} vetoed", target.to_string());
    return std::nullopt;
  }

  std::vector<Tab> tabs;
  if (with_tab.has_value()) {
    Tab tab = std::move(*with_tab);
    if (tab.id.value == 0) {
      tab.id = TabId::generate();
    }
    tabs.push_back(std::move(tab));
  }
  PaneState new_pane = make_pane(std::move(tabs));
  PaneId new_pane_id = new_pane.id;

  if (!layout::split_pane(layout_, target, orientation, std::move(new_pane)).has_value()) {
    return std::nullopt;
  }
  focused_pane_id_ = new_pane_id;
  mark_mutated();

  if (delegate_ != nullptr) {
    delegate_->did_split_pane(target, new_pane_id, orientation);
  }
  schedule_geometry_notification();
  return new_pane_id;
}

std::optional<PaneId> Controller::split_pane_moving_tab(TabId tab_id, PaneId target,
                                                        Orientation orientation,
                                                        bool insert_first) {
  if (!configuration_.allow_splits) {
    spdlog::debug("split_pane_moving_tab: splits disabled");
    return std::nullopt;
  }

  auto location = layout::find_tab(layout_, tab_id);
  const PaneState* target_pane = layout::find_pane(layout_, target);
  if (!location.has_value() || target_pane == nullptr) {
    return std::nullopt;
  }

  PaneId source = layout::pane_at(layout_, location->node_index)->id;
  if (source != target && !configuration_.allow_cross_pane_tab_move) {
    spdlog::debug("split_pane_moving_tab: cross-pane moves disabled");
    return std::nullopt;
  }
  if (source == target && target_pane->tabs.size() <= 1) {
    spdlog::debug("split_pane_moving_tab: {} is the only tab of {}", tab_id.to_string(),
                  target.to_string());
    return std::nullopt;
  }

  if (delegate_ != nullptr && !delegate_->should_split_pane(target, orientation)) {
    spdlog::debug("split_pane_moving_tab: {} vetoed", target.to_string());
    return std::nullopt;
  }

  PaneState* source_pane = layout::find_pane(layout_, source);
  if (source_pane == nullptr || layout::find_pane(layout_, target) == nullptr) {
    return std::nullopt;
  }
  std::optional<Tab> moved = remove_tab(*source_pane, tab_id);
  if (!moved.has_value()) {
    return std::nullopt;
  }

  Tab notified = *moved;
  PaneState new_pane = make_pane({std::move(*moved)});
  PaneId new_pane_id = new_pane.id;
  if (!layout::split_pane(layout_, target, orientation, std::move(new_pane), insert_first)
           .has_value()) {
    return std::nullopt;
  }
  focused_pane_id_ = new_pane_id;
  mark_mutated();

  if (delegate_ != nullptr) {
    delegate_->did_move_tab(notified, source, new_pane_id);
    delegate_->did_split_pane(target, new_pane_id, orientation);
  }
  if (source != target) {
    collapse_if_empty(source);
  }
  schedule_geometry_notification();
  return new_pane_id;
}

bool Controller::close_pane(PaneId pane_id) {
  if (layout::find_pane(layout_, pane_id) == nullptr) {
    return false;
  }
  if (layout::pane_count(layout_) <= 1 && !configuration_.allow_close_last_pane) {
    spdlog::debug("close_pane: refusing to close the last pane");
    return false;
  }

  if (delegate_ != nullptr && !delegate_->should_close_pane(pane_id)) {
    spdlog::debug("close_pane: {} vetoed", pane_id.to_string());
    return false;
  }
  if (layout::find_pane(layout_, pane_id) == nullptr) {
    return false;
  }

  if (layout::pane_count(layout_) <= 1) {
    // The tree is never empty: the last pane gives way to a fresh one
    PaneState fresh = make_pane();
    focused_pane_id_ = fresh.id;
    layout_ = layout::create_layout(std::move(fresh));
    mark_mutated();
  } else if (!collapse_pane(pane_id)) {
    return false;
  }

  if (delegate_ != nullptr) {
    delegate_->did_close_pane(pane_id);
  }
  schedule_geometry_notification();
  return true;
}

bool Controller::collapse_pane(PaneId pane_id) {
  auto sibling_focus = layout::close_pane(layout_, pane_id);
  if (!sibling_focus.has_value()) {
    return false;
  }
  mark_mutated();

  if (layout::find_pane(layout_, focused_pane_id_) == nullptr) {
    focused_pane_id_ = *sibling_focus;
  }
  spdlog::debug("collapsed {}, focus on {}", pane_id.to_string(), focused_pane_id_.to_string());
  return true;
}

void Controller::collapse_if_empty(PaneId pane_id) {
  if (!configuration_.auto_close_empty_panes) {
    return;
  }
  const PaneState* pane = layout::find_pane(layout_, pane_id);
  if (pane == nullptr || !pane->tabs.empty() || layout::pane_count(layout_) <= 1) {
    return;
  }

  if (!collapse_pane(pane_id)) {
    return;
  }
  if (delegate_ != nullptr) {
    delegate_->did_close_pane(pane_id);
  }
  schedule_geometry_notification();
}

bool Controller::focus_pane(PaneId pane_id) {
  if (layout::find_pane(layout_, pane_id) == nullptr) {
    return false;
  }
  focused_pane_id_ = pane_id;
  if (delegate_ != nullptr) {
    delegate_->did_focus_pane(pane_id);
  }
  return true;
}

bool Controller::navigate_focus(Direction dir) {
  auto bounds = layout::compute_pane_bounds(layout_);
  auto neighbor = layout::find_neighbor(bounds, focused_pane_id_, dir);
  if (!neighbor.has_value() || *neighbor == focused_pane_id_) {
    spdlog::trace("navigate_focus: nothing {} of {}", magic_enum::enum_name(dir),
                  focused_pane_id_.to_string());
    return false;
  }

  focused_pane_id_ = *neighbor;
  if (delegate_ != nullptr) {
    delegate_->did_focus_pane(focused_pane_id_);
  }
  return true;
}

void Controller::double_click_tab_bar(PaneId pane_id) {
  if (delegate_ != nullptr && layout::find_pane(layout_, pane_id) != nullptr) {
    delegate_->did_double_click_tab_bar_in_pane(pane_id);
  }
}

// ============================================================================
// Geometry
// ============================================================================

bool Controller::set_divider_position(double position, SplitId split_id, bool from_external) {
  if (layout::find_split(layout_, split_id) == nullptr) {
    return false;
  }

  if (from_external) {
    external_update_in_progress_ = true;
    std::uint64_t generation = ++external_update_generation_;
    std::weak_ptr<bool> token = alive_;
    queue_->post_after(kExternalUpdateWindow, [this, token, generation] {
      if (token.expired()) {
        return;
      }
      // A newer external update extends the window
      if (external_update_generation_ == generation) {
        external_update_in_progress_ = false;
      }
    });
  }

  if (!layout::set_divider_position(layout_, split_id, position)) {
    return false;
  }
  mark_mutated();
  return true;
}

void Controller::set_container_frame(const layout::Rect& frame) {
  container_frame_ = frame;
}

void Controller::notify_geometry_change(bool is_dragging) {
  if (external_update_in_progress_) {
    spdlog::trace("geometry notification suppressed: external update in progress");
    return;
  }
  if (is_dragging && (delegate_ == nullptr || !delegate_->should_notify_during_drag())) {
    spdlog::trace("geometry notification suppressed: drag");
    return;
  }

  TimePoint now = queue_->clock().now();
  if (last_geometry_notification_.has_value() &&
      now - *last_geometry_notification_ < kGeometryDebounceInterval) {
    spdlog::trace("geometry notification debounced");
    return;
  }
  last_geometry_notification_ = now;

  if (delegate_ != nullptr) {
    auto snapshot = timed("layout_snapshot", [this] { return layout_snapshot(); });
    delegate_->did_change_geometry(snapshot);
  }
}

void Controller::schedule_geometry_notification() {
  std::weak_ptr<bool> token = alive_;
  queue_->post_after(kStructureNotifyDelay, [this, token] {
    if (token.expired()) {
      return;
    }
    notify_geometry_change();
  });
}

LayoutSnapshot Controller::layout_snapshot() const {
  return build_layout_snapshot(layout_, container_frame_, focused_pane_id_);
}

ExternalTreeNode Controller::tree_snapshot() const {
  return timed("tree_snapshot", [this] { return build_tree_snapshot(layout_, container_frame_); });
}

bool Controller::find_split(SplitId split_id) const {
  return layout::find_split(layout_, split_id) != nullptr;
}

std::optional<double> Controller::divider_position(SplitId split_id) const {
  const SplitState* split = layout::find_split(layout_, split_id);
  if (split == nullptr) {
    return std::nullopt;
  }
  return split->divider_position;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<TabId> Controller::all_tab_ids() const {
  return layout::all_tab_ids(layout_);
}

std::vector<PaneId> Controller::all_pane_ids() const {
  return layout::all_pane_ids(layout_);
}

std::vector<SplitId> Controller::all_split_ids() const {
  return layout::all_split_ids(layout_);
}

std::optional<Tab> Controller::tab(TabId tab_id) const {
  auto location = layout::find_tab(layout_, tab_id);
  if (!location.has_value()) {
    return std::nullopt;
  }
  return layout::pane_at(layout_, location->node_index)->tabs[location->tab_index];
}

std::vector<Tab> Controller::tabs(PaneId pane_id) const {
  const PaneState* pane = layout::find_pane(layout_, pane_id);
  if (pane == nullptr) {
    return {};
  }
  return pane->tabs;
}

std::optional<Tab> Controller::selected_tab(PaneId pane_id) const {
  const PaneState* pane = layout::find_pane(layout_, pane_id);
  if (pane == nullptr || !pane->selected_tab_id.has_value()) {
    return std::nullopt;
  }
  auto index = find_tab_index(*pane, *pane->selected_tab_id);
  if (!index.has_value()) {
    return std::nullopt;
  }
  return pane->tabs[*index];
}

std::optional<PaneId> Controller::pane_of_tab(TabId tab_id) const {
  auto location = layout::find_tab(layout_, tab_id);
  if (!location.has_value()) {
    return std::nullopt;
  }
  return layout::pane_at(layout_, location->node_index)->id;
}

bool Controller::can_close_tab(TabId tab_id) const {
  auto found = tab(tab_id);
  return found.has_value() && configuration_.allow_close_tabs && found->is_closable;
}

std::vector<ContextMenuItem> Controller::context_menu_items_for_tab(TabId tab_id) {
  auto found = tab(tab_id);
  auto pane = pane_of_tab(tab_id);
  if (delegate_ == nullptr || !found.has_value() || !pane.has_value()) {
    return {};
  }
  return delegate_->context_menu_items_for_tab(*found, *pane);
}

bool Controller::validate() const {
  bool ok = layout::validate_layout(layout_);
  if (layout::find_pane(layout_, focused_pane_id_) == nullptr) {
    spdlog::error("[validate] focused pane {} does not exist", focused_pane_id_.to_string());
    ok = false;
  }
  return ok;
}

void Controller::debug_print() const {
  layout::debug_print_layout(layout_);
  spdlog::debug("focused = {}, revision = {}", focused_pane_id_.to_string(), revision_);
}

void Controller::mark_mutated() {
  ++revision_;
}

} // namespace splittab
