#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "model.h"
#include "snapshot.h"

namespace splittab {

// Entry of a tab's context menu, built by the host
struct ContextMenuItem {
  std::string title;
  std::optional<std::string> icon;
  bool is_enabled = true;
  std::function<void()> action;
};

// Receives veto requests and notifications from a Controller. Every method has
// a default, so hosts override only what they need. should_* run before a
// mutation and may cancel it; did_* run after it.
class Delegate {
public:
  virtual ~Delegate() = default;

  // Tab lifecycle
  virtual bool should_create_tab(const Tab& /*tab*/, PaneId /*pane*/) {
    return true;
  }
  virtual bool should_close_tab(const Tab& /*tab*/, PaneId /*pane*/) {
    return true;
  }
  virtual void did_create_tab(const Tab& /*tab*/, PaneId /*pane*/) {
  }
  virtual void did_close_tab(TabId /*tab_id*/, PaneId /*pane*/) {
  }
  virtual void did_select_tab(const Tab& /*tab*/, PaneId /*pane*/) {
  }
  virtual void did_move_tab(const Tab& /*tab*/, PaneId /*source*/, PaneId /*destination*/) {
  }

  // Split lifecycle
  virtual bool should_split_pane(PaneId /*pane*/, Orientation /*orientation*/) {
    return true;
  }
  virtual bool should_close_pane(PaneId /*pane*/) {
    return true;
  }
  virtual void did_split_pane(PaneId /*original*/, PaneId /*new_pane*/,
                              Orientation /*orientation*/) {
  }
  virtual void did_close_pane(PaneId /*pane*/) {
  }

  // Focus and tab bar
  virtual void did_focus_pane(PaneId /*pane*/) {
  }
  virtual void did_double_click_tab_bar_in_pane(PaneId /*pane*/) {
  }

  // Geometry. Drag-time notifications are opt-in.
  virtual void did_change_geometry(const LayoutSnapshot& /*snapshot*/) {
  }
  virtual bool should_notify_during_drag() {
    return false;
  }

  virtual std::vector<ContextMenuItem> context_menu_items_for_tab(const Tab& /*tab*/,
                                                                  PaneId /*pane*/) {
    return {};
  }
};

} // namespace splittab
