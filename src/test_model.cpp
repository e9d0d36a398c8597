#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "model.h"

using namespace splittab;

namespace {

Tab make_tab(const std::string& title, bool pinned = false, bool closable = true) {
  Tab tab;
  tab.id = TabId::generate();
  tab.title = title;
  tab.is_pinned = pinned;
  tab.is_closable = closable;
  return tab;
}

std::vector<std::string> titles(const PaneState& pane) {
  std::vector<std::string> result;
  for (const auto& tab : pane.tabs) {
    result.push_back(tab.title);
  }
  return result;
}

} // namespace

TEST_SUITE("Ids") {
  TEST_CASE("generated ids are unique across kinds") {
    auto a = TabId::generate();
    auto b = PaneId::generate();
    auto c = SplitId::generate();
    auto d = TabId::generate();

    std::unordered_set<std::uint64_t> values{a.value, b.value, c.value, d.value};
    CHECK(values.size() == 4);
    CHECK_FALSE(a == d);
  }

  TEST_CASE("string form round-trips and rejects other kinds") {
    auto id = PaneId::generate();
    auto text = id.to_string();

    CHECK(text.rfind("pane-", 0) == 0);
    CHECK(PaneId::from_string(text) == id);
    CHECK_FALSE(TabId::from_string(text).has_value());
    CHECK_FALSE(PaneId::from_string("pane-").has_value());
    CHECK_FALSE(PaneId::from_string("pane-12x").has_value());
  }

  TEST_CASE("string form rejects values that overflow") {
    auto max = TabId::from_string("tab-18446744073709551615");
    REQUIRE(max.has_value());
    CHECK(max->value == 18446744073709551615ULL);

    CHECK_FALSE(TabId::from_string("tab-18446744073709551616").has_value());
    CHECK_FALSE(TabId::from_string("tab-99999999999999999999999").has_value());
  }
}

TEST_SUITE("Pane model") {
  TEST_CASE("make_pane selects the first tab") {
    auto pane = make_pane({make_tab("a"), make_tab("b")});
    REQUIRE(pane.selected_tab_id.has_value());
    CHECK(*pane.selected_tab_id == pane.tabs[0].id);
    CHECK(is_pane_consistent(pane));

    auto empty = make_pane();
    CHECK_FALSE(empty.selected_tab_id.has_value());
    CHECK(is_pane_consistent(empty));
  }

  TEST_CASE("divider position is clamped") {
    CHECK(clamp_divider_position(0.0) == doctest::Approx(0.1));
    CHECK(clamp_divider_position(1.5) == doctest::Approx(0.9));
    CHECK(clamp_divider_position(0.3) == doctest::Approx(0.3));
    CHECK(make_split(Orientation::Vertical, 0.95).divider_position == doctest::Approx(0.9));
  }

  TEST_CASE("pinned boundaries") {
    auto pane = make_pane({make_tab("a"), make_tab("b"), make_tab("p", true),
                           make_tab("clip", true, false)});

    CHECK(first_pinned_index(pane) == 2);
    CHECK(first_anchored_index(pane) == 3);

    auto unpinned = make_pane({make_tab("a")});
    CHECK(first_pinned_index(unpinned) == 1);
    CHECK(first_anchored_index(unpinned) == 1);
  }

  TEST_CASE("clamp_insert_index keeps each kind in its run") {
    auto pane = make_pane({make_tab("a"), make_tab("b"), make_tab("p", true),
                           make_tab("clip", true, false)});

    auto plain = make_tab("x");
    CHECK(clamp_insert_index(pane, plain, std::nullopt) == 2);
    CHECK(clamp_insert_index(pane, plain, 0) == 0);
    CHECK(clamp_insert_index(pane, plain, 4) == 2);

    auto pinned = make_tab("y", true);
    CHECK(clamp_insert_index(pane, pinned, std::nullopt) == 3);
    CHECK(clamp_insert_index(pane, pinned, 0) == 2);

    auto anchored = make_tab("z", true, false);
    CHECK(clamp_insert_index(pane, anchored, std::nullopt) == 4);
    CHECK(clamp_insert_index(pane, anchored, 1) == 3);
  }

  TEST_CASE("is_pane_consistent detects ordering violations") {
    PaneState pane;
    pane.id = PaneId::generate();
    pane.tabs = {make_tab("p", true), make_tab("a")};
    pane.selected_tab_id = pane.tabs[0].id;
    CHECK_FALSE(is_pane_consistent(pane));

    pane.tabs = {make_tab("a")};
    pane.selected_tab_id = std::nullopt;
    CHECK_FALSE(is_pane_consistent(pane));
  }

  TEST_CASE("removing the selected tab selects the previous neighbor") {
    auto pane = make_pane({make_tab("a"), make_tab("b"), make_tab("c")});
    REQUIRE(select_tab(pane, pane.tabs[1].id));
    TabId a = pane.tabs[0].id;

    auto removed = remove_tab(pane, pane.tabs[1].id);
    REQUIRE(removed.has_value());
    CHECK(removed->title == "b");
    CHECK(pane.selected_tab_id == a);
  }

  TEST_CASE("removing the first selected tab selects the new first tab") {
    auto pane = make_pane({make_tab("a"), make_tab("b")});
    TabId b = pane.tabs[1].id;

    REQUIRE(remove_tab(pane, pane.tabs[0].id).has_value());
    CHECK(pane.selected_tab_id == b);

    REQUIRE(remove_tab(pane, b).has_value());
    CHECK_FALSE(pane.selected_tab_id.has_value());
    CHECK(is_pane_consistent(pane));
  }

  TEST_CASE("removing an unselected tab keeps the selection") {
    auto pane = make_pane({make_tab("a"), make_tab("b")});
    TabId a = pane.tabs[0].id;

    REQUIRE(remove_tab(pane, pane.tabs[1].id).has_value());
    CHECK(pane.selected_tab_id == a);
    CHECK_FALSE(remove_tab(pane, TabId::generate()).has_value());
  }

  TEST_CASE("move_tab_within uses pre-removal destinations") {
    auto pane = make_pane({make_tab("a"), make_tab("b"), make_tab("c")});

    CHECK(move_tab_within(pane, 0, 3));
    CHECK(titles(pane) == std::vector<std::string>{"b", "c", "a"});

    CHECK(move_tab_within(pane, 2, 0));
    CHECK(titles(pane) == std::vector<std::string>{"a", "b", "c"});

    CHECK_FALSE(move_tab_within(pane, 1, 1));
    CHECK_FALSE(move_tab_within(pane, 1, 2));
    CHECK_FALSE(move_tab_within(pane, 5, 0));
  }

  TEST_CASE("insert_tab selects unless told otherwise") {
    auto pane = make_pane({make_tab("a")});
    TabId a = pane.tabs[0].id;

    insert_tab(pane, make_tab("b"), 1, false);
    CHECK(pane.selected_tab_id == a);

    auto c = make_tab("c");
    TabId c_id = c.id;
    insert_tab(pane, c, 99);
    CHECK(pane.tabs.back().id == c_id);
    CHECK(pane.selected_tab_id == c_id);
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
