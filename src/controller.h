#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "delegate.h"
#include "event_queue.h"
#include "layout.h"
#include "model.h"
#include "options.h"
#include "snapshot.h"

namespace splittab {

// Minimum spacing between two delivered geometry notifications
constexpr Duration kGeometryDebounceInterval{50};

// How long notifications stay suppressed after an external divider update
constexpr Duration kExternalUpdateWindow{50};

// Delay of the geometry notification that follows a split or a pane close
constexpr Duration kStructureNotifyDelay{100};

// Partial tab update. Only fields that are set are applied.
struct TabUpdate {
  std::optional<std::string> title;
  std::optional<std::optional<std::string>> icon; // Inner nullopt clears the icon
  std::optional<bool> is_dirty;
  std::optional<bool> is_pinned;
};

// Owns the split tree and is the only thing that mutates it. All calls are
// expected on one thread; deferred work goes through the event queue, which
// the host pumps on that same thread.
class Controller {
public:
  // A null queue gets a private queue on the steady clock
  explicit Controller(Configuration configuration = default_configuration(),
                      std::shared_ptr<EventQueue> queue = nullptr);

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;
  Controller(Controller&&) = delete;
  Controller& operator=(Controller&&) = delete;

  // Non-owning. Pass nullptr to detach.
  void set_delegate(Delegate* delegate);
  [[nodiscard]] Delegate* delegate() const {
    return delegate_;
  }

  [[nodiscard]] const Configuration& configuration() const {
    return configuration_;
  }
  void set_configuration(const Configuration& configuration);

  [[nodiscard]] EventQueue& event_queue() {
    return *queue_;
  }

  // ==========================================================================
  // Tab Operations
  // ==========================================================================

  // Create a tab in pane (default: the focused pane). The new tab is selected.
  std::optional<TabId> create_tab(const std::string& title,
                                  std::optional<std::string> icon = std::nullopt,
                                  bool is_dirty = false, bool is_closable = true,
                                  bool is_pinned = false, std::optional<PaneId> pane = std::nullopt);

  // Returns true if any field changed. A pin change relocates the tab.
  bool update_tab(TabId tab_id, const TabUpdate& update);

  bool close_tab(TabId tab_id, std::optional<PaneId> pane = std::nullopt);

  // Move a tab to target at index (default: end of its pinned run). The index is
  // clamped so the pinned ordering holds. The target pane gets focus.
  bool move_tab(TabId tab_id, PaneId target, std::optional<size_t> index = std::nullopt);

  bool select_tab(TabId tab_id);

  // Cycle the selection of the focused pane, wrapping around
  bool select_next_tab();
  bool select_previous_tab();

  // ==========================================================================
  // Pane Operations
  // ==========================================================================

  // Split pane (default: the focused pane). The original pane stays first; the
  // new pane holds only with_tab, or nothing. Returns the new pane, which gets
  // focus.
  std::optional<PaneId> split_pane(std::optional<PaneId> pane, Orientation orientation,
                                   std::optional<Tab> with_tab = std::nullopt);

  // Take a tab out of its pane and split target with a new pane holding it.
  // insert_first places the new pane before target.
  std::optional<PaneId> split_pane_moving_tab(TabId tab_id, PaneId target,
                                              Orientation orientation, bool insert_first);

  bool close_pane(PaneId pane_id);

  bool focus_pane(PaneId pane_id);

  // Move focus to the nearest pane in dir. Returns false at the layout edge.
  bool navigate_focus(Direction dir);

  void double_click_tab_bar(PaneId pane_id);

  // ==========================================================================
  // Geometry
  // ==========================================================================

  // Clamped to [0.1, 0.9]. from_external suppresses geometry notifications
  // for a short window so a host echoing its own update does not loop.
  bool set_divider_position(double position, SplitId split_id, bool from_external = false);

  void set_container_frame(const layout::Rect& frame);
  [[nodiscard]] const layout::Rect& container_frame() const {
    return container_frame_;
  }

  // Deliver a LayoutSnapshot to the delegate unless suppressed or debounced
  void notify_geometry_change(bool is_dragging = false);

  [[nodiscard]] bool is_external_update_in_progress() const {
    return external_update_in_progress_;
  }

  [[nodiscard]] LayoutSnapshot layout_snapshot() const;
  [[nodiscard]] ExternalTreeNode tree_snapshot() const;

  [[nodiscard]] bool find_split(SplitId split_id) const;
  [[nodiscard]] std::optional<double> divider_position(SplitId split_id) const;

  // ==========================================================================
  // Queries
  // ==========================================================================

  [[nodiscard]] PaneId focused_pane_id() const {
    return focused_pane_id_;
  }

  [[nodiscard]] std::vector<TabId> all_tab_ids() const;
  [[nodiscard]] std::vector<PaneId> all_pane_ids() const;
  [[nodiscard]] std::vector<SplitId> all_split_ids() const;

  [[nodiscard]] std::optional<Tab> tab(TabId tab_id) const;
  [[nodiscard]] std::vector<Tab> tabs(PaneId pane_id) const;
  [[nodiscard]] std::optional<Tab> selected_tab(PaneId pane_id) const;
  [[nodiscard]] std::optional<PaneId> pane_of_tab(TabId tab_id) const;

  [[nodiscard]] bool can_close_tab(TabId tab_id) const;

  [[nodiscard]] std::vector<ContextMenuItem> context_menu_items_for_tab(TabId tab_id);

  // Incremented by every tree mutation
  [[nodiscard]] std::uint64_t revision() const {
    return revision_;
  }

  // Check structural invariants, logging anomalies
  [[nodiscard]] bool validate() const;

  void debug_print() const;

private:
  // Index a new tab takes in pane under the configured insertion policy
  [[nodiscard]] size_t new_tab_index(const PaneState& pane, const Tab& tab) const;

  // Remove a non-root pane without asking the delegate and repair focus
  bool collapse_pane(PaneId pane_id);

  // Collapse pane if it is empty, auto-close is on and other panes exist
  void collapse_if_empty(PaneId pane_id);

  void schedule_geometry_notification();

  void mark_mutated();

  Configuration configuration_;
  layout::Layout layout_;
  PaneId focused_pane_id_;
  Delegate* delegate_ = nullptr;
  std::shared_ptr<EventQueue> queue_;

  // Deferred continuations hold a weak reference and bail out once this is gone
  std::shared_ptr<bool> alive_;

  layout::Rect container_frame_{};
  std::optional<TimePoint> last_geometry_notification_;
  bool external_update_in_progress_ = false;
  std::uint64_t external_update_generation_ = 0;
  std::uint64_t revision_ = 0;
};

} // namespace splittab
