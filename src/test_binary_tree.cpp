#ifndef DOCTEST_CONFIG_DISABLE
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "binary_tree.h"

using namespace splittab;

// Simple test data type
struct TestData {
  int value = 0;
};

TEST_SUITE("BinaryTree") {
  TEST_CASE("empty tree") {
    BinaryTree<TestData> tree;

    CHECK(tree.empty());
    CHECK(tree.size() == 0);
    CHECK(tree.leaves_in_order().empty());
    CHECK(tree.preorder().empty());
  }

  TEST_CASE("add nodes and check size") {
    BinaryTree<TestData> tree;

    int idx0 = tree.add_node(TestData{10});
    CHECK(tree.size() == 1);
    CHECK(idx0 == 0);
    CHECK(tree[0].value == 10);

    int idx1 = tree.add_node(TestData{20});
    CHECK(tree.size() == 2);
    CHECK(idx1 == 1);
    CHECK(tree[1].value == 20);
  }

  TEST_CASE("is_valid_index") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});

    CHECK(tree.is_valid_index(0));
    CHECK_FALSE(tree.is_valid_index(-1));
    CHECK_FALSE(tree.is_valid_index(1));
    CHECK_FALSE(tree.is_leaf(5));
  }

  TEST_CASE("set_children links both directions") {
    BinaryTree<TestData> tree;

    int parent = tree.add_node(TestData{0});
    int child1 = tree.add_node(TestData{1});
    int child2 = tree.add_node(TestData{2});

    CHECK(tree.is_leaf(parent));
    tree.set_children(parent, child1, child2);

    CHECK_FALSE(tree.is_leaf(parent));
    CHECK(tree.get_first_child(parent) == child1);
    CHECK(tree.get_second_child(parent) == child2);
    CHECK(tree.get_parent(child1) == parent);
    CHECK(tree.get_parent(child2) == parent);
    CHECK(tree.get_sibling(child1) == child2);
    CHECK(tree.get_sibling(child2) == child1);
    CHECK_FALSE(tree.get_sibling(parent).has_value());
  }

  TEST_CASE("split_leaf keeps the old payload in the first child by default") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});

    auto children = tree.split_leaf(0, TestData{100}, TestData{2});
    REQUIRE(children.has_value());

    auto [first, second] = *children;
    CHECK(tree[0].value == 100);
    CHECK(tree[first].value == 1);
    CHECK(tree[second].value == 2);
    CHECK(tree.get_parent(first) == 0);
    CHECK(tree.get_parent(second) == 0);
  }

  TEST_CASE("split_leaf can place the new leaf first") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});

    auto children = tree.split_leaf(0, TestData{100}, TestData{2}, true);
    REQUIRE(children.has_value());

    CHECK(tree[children->first].value == 2);
    CHECK(tree[children->second].value == 1);
  }

  TEST_CASE("split_leaf refuses internal nodes") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});
    REQUIRE(tree.split_leaf(0, TestData{100}, TestData{2}).has_value());

    CHECK_FALSE(tree.split_leaf(0, TestData{200}, TestData{3}).has_value());
    CHECK(tree.size() == 3);
  }

  TEST_CASE("leaves_in_order visits first subtree before second") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});

    //        0
    //      /   \
    //     a     b        (a = 1, b = 2 after the first split)
    //          / \
    //         2   3
    auto top = tree.split_leaf(0, TestData{100}, TestData{2});
    REQUIRE(top.has_value());
    auto bottom = tree.split_leaf(top->second, TestData{200}, TestData{3});
    REQUIRE(bottom.has_value());

    std::vector<int> values;
    for (int index : tree.leaves_in_order()) {
      values.push_back(tree[index].value);
    }
    CHECK(values == std::vector<int>{1, 2, 3});

    std::vector<int> all;
    for (int index : tree.preorder()) {
      all.push_back(tree[index].value);
    }
    CHECK(all == std::vector<int>{100, 1, 200, 2, 3});

    // Subtree traversal
    CHECK(tree.leaves_in_order(top->second).size() == 2);
  }

  TEST_CASE("collapse_leaf promotes a leaf sibling into the parent") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});
    auto children = tree.split_leaf(0, TestData{100}, TestData{2});
    REQUIRE(children.has_value());

    auto remap = tree.collapse_leaf(children->second);
    REQUIRE(remap.has_value());

    CHECK(tree.size() == 1);
    CHECK(tree.is_leaf(0));
    CHECK(tree[0].value == 1);
    CHECK_FALSE(tree.get_parent(0).has_value());
  }

  TEST_CASE("collapse_leaf promotes a subtree sibling and remaps links") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});
    auto top = tree.split_leaf(0, TestData{100}, TestData{2});
    REQUIRE(top.has_value());
    auto bottom = tree.split_leaf(top->second, TestData{200}, TestData{3});
    REQUIRE(bottom.has_value());

    // Remove leaf 1; the split holding 2 and 3 becomes the root
    auto remap = tree.collapse_leaf(top->first);
    REQUIRE(remap.has_value());

    CHECK(tree.size() == 3);
    CHECK(tree[0].value == 200);
    CHECK_FALSE(tree.is_leaf(0));

    auto first = tree.get_first_child(0);
    auto second = tree.get_second_child(0);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(tree[*first].value == 2);
    CHECK(tree[*second].value == 3);
    CHECK(tree.get_parent(*first) == 0);
    CHECK(tree.get_parent(*second) == 0);
    CHECK((*remap)[static_cast<size_t>(top->first)] == -1);
  }

  TEST_CASE("collapse_leaf refuses the root and internal nodes") {
    BinaryTree<TestData> tree;
    tree.add_node(TestData{1});
    CHECK_FALSE(tree.collapse_leaf(0).has_value());

    REQUIRE(tree.split_leaf(0, TestData{100}, TestData{2}).has_value());
    CHECK_FALSE(tree.collapse_leaf(0).has_value());
    CHECK(tree.size() == 3);
  }

  TEST_CASE("remove remaps parent-child pointers correctly") {
    BinaryTree<TestData> tree;

    // Build tree:
    //       0
    //      / \
    //     1   2
    //        / \
    //       3   4
    int root = tree.add_node(TestData{0});
    int node1 = tree.add_node(TestData{1});
    int node2 = tree.add_node(TestData{2});
    int node3 = tree.add_node(TestData{3});
    int node4 = tree.add_node(TestData{4});

    tree.set_children(root, node1, node2);
    tree.set_children(node2, node3, node4);

    auto remap = tree.remove({node1});

    CHECK(tree.size() == 4);
    CHECK(remap[static_cast<size_t>(node1)] == -1);
    CHECK(remap[static_cast<size_t>(node2)] == 1);

    // Root lost its first child
    CHECK_FALSE(tree.get_first_child(0).has_value());
    CHECK(tree.get_second_child(0) == 1);

    CHECK(tree.get_first_child(1) == 2);
    CHECK(tree.get_second_child(1) == 3);
    CHECK(tree.get_parent(2) == 1);
    CHECK(tree.get_parent(3) == 1);
  }

  TEST_CASE("remove on empty tree") {
    BinaryTree<TestData> tree;

    auto remap = tree.remove({0, 1});

    CHECK(remap.empty());
    CHECK(tree.empty());
  }

  TEST_CASE("tree with string payload") {
    BinaryTree<std::string> tree;
    tree.add_node("left");

    auto children = tree.split_leaf(0, "branch", "right");
    REQUIRE(children.has_value());
    CHECK(tree[children->first] == "left");
    CHECK(tree[children->second] == "right");

    tree.clear();
    CHECK(tree.empty());
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
