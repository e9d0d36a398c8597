#include "model.h"

#include <algorithm>

namespace splittab {

namespace {

// Display rank: unpinned tabs first, then pinned, then pinned non-closable
int tab_rank(const Tab& tab) {
  if (!tab.is_pinned) {
    return 0;
  }
  return tab.is_closable ? 1 : 2;
}

} // namespace

PaneState make_pane(std::vector<Tab> tabs) {
  PaneState pane;
  pane.id = PaneId::generate();
  pane.tabs = std::move(tabs);
  if (!pane.tabs.empty()) {
    pane.selected_tab_id = pane.tabs.front().id;
  }
  return pane;
}

SplitState make_split(Orientation orientation, double divider_position) {
  return SplitState{SplitId::generate(), orientation, clamp_divider_position(divider_position)};
}

double clamp_divider_position(double position) {
  return std::clamp(position, kMinDividerPosition, kMaxDividerPosition);
}

// ============================================================================
// Pane Queries
// ============================================================================

std::optional<size_t> find_tab_index(const PaneState& pane, TabId tab_id) {
  for (size_t i = 0; i < pane.tabs.size(); ++i) {
    if (pane.tabs[i].id == tab_id) {
      return i;
    }
  }
  return std::nullopt;
}

size_t first_pinned_index(const PaneState& pane) {
  auto it = std::find_if(pane.tabs.begin(), pane.tabs.end(),
                         [](const Tab& t) { return t.is_pinned; });
  return static_cast<size_t>(it - pane.tabs.begin());
}

size_t first_anchored_index(const PaneState& pane) {
  auto it = std::find_if(pane.tabs.begin(), pane.tabs.end(),
                         [](const Tab& t) { return t.is_pinned && !t.is_closable; });
  return static_cast<size_t>(it - pane.tabs.begin());
}

size_t clamp_insert_index(const PaneState& pane, const Tab& tab, std::optional<size_t> index) {
  size_t pinned = first_pinned_index(pane);
  size_t anchored = first_anchored_index(pane);

  switch (tab_rank(tab)) {
  case 0:
    return std::min(index.value_or(pinned), pinned);
  case 1:
    // Non-closable pinned tabs stay anchored last, even ahead of newer pinned tabs
    return std::clamp(index.value_or(anchored), std::min(pinned, anchored), anchored);
  default:
    return std::clamp(index.value_or(pane.tabs.size()), anchored, pane.tabs.size());
  }
}

bool is_pane_consistent(const PaneState& pane) {
  if (pane.tabs.empty()) {
    return !pane.selected_tab_id.has_value();
  }
  if (!pane.selected_tab_id.has_value() || !find_tab_index(pane, *pane.selected_tab_id)) {
    return false;
  }
  return std::is_sorted(pane.tabs.begin(), pane.tabs.end(), [](const Tab& a, const Tab& b) {
    return tab_rank(a) < tab_rank(b);
  });
}

// ============================================================================
// Pane Mutation
// ============================================================================

void insert_tab(PaneState& pane, Tab tab, size_t index, bool select) {
  size_t safe_index = std::min(index, pane.tabs.size());
  TabId id = tab.id;
  pane.tabs.insert(pane.tabs.begin() + static_cast<std::ptrdiff_t>(safe_index), std::move(tab));
  if (select || !pane.selected_tab_id.has_value()) {
    pane.selected_tab_id = id;
  }
}

std::optional<Tab> remove_tab(PaneState& pane, TabId tab_id) {
  auto index_opt = find_tab_index(pane, tab_id);
  if (!index_opt.has_value()) {
    return std::nullopt;
  }
  size_t index = *index_opt;

  Tab removed = std::move(pane.tabs[index]);
  pane.tabs.erase(pane.tabs.begin() + static_cast<std::ptrdiff_t>(index));

  if (pane.selected_tab_id == tab_id) {
    if (index > 0) {
      pane.selected_tab_id = pane.tabs[index - 1].id;
    } else if (!pane.tabs.empty()) {
      pane.selected_tab_id = pane.tabs.front().id;
    } else {
      pane.selected_tab_id = std::nullopt;
    }
  }

  return removed;
}

bool move_tab_within(PaneState& pane, size_t from, size_t to) {
  if (from == to || from >= pane.tabs.size() || to > pane.tabs.size()) {
    return false;
  }

  Tab tab = std::move(pane.tabs[from]);
  pane.tabs.erase(pane.tabs.begin() + static_cast<std::ptrdiff_t>(from));
  size_t adjusted = to > from ? to - 1 : to;
  pane.tabs.insert(pane.tabs.begin() + static_cast<std::ptrdiff_t>(adjusted), std::move(tab));
  return adjusted != from;
}

bool select_tab(PaneState& pane, TabId tab_id) {
  if (!find_tab_index(pane, tab_id).has_value()) {
    return false;
  }
  pane.selected_tab_id = tab_id;
  return true;
}

} // namespace splittab
