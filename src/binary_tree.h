#pragma once

#include <algorithm>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace splittab {

// Index-arena binary tree. Node 0 is the root once the tree is non-empty.
// Every node owns either zero or two children.
template <typename T>
class BinaryTree {
public:
  struct Node {
    T data;
    std::optional<int> parent;
    std::optional<int> first_child;
    std::optional<int> second_child;
  };

  BinaryTree() = default;

  // Core Operations

  int add_node(T data, std::optional<int> parent_index = std::nullopt) {
    Node node{std::move(data), parent_index, std::nullopt, std::nullopt};
    nodes_.push_back(std::move(node));
    return static_cast<int>(nodes_.size() - 1);
  }

  [[nodiscard]] bool is_leaf(int index) const {
    if (!is_valid_index(index)) {
      return false;
    }
    const Node& node = nodes_[static_cast<size_t>(index)];
    return !node.first_child.has_value() && !node.second_child.has_value();
  }

  [[nodiscard]] bool is_valid_index(int index) const {
    return index >= 0 && static_cast<size_t>(index) < nodes_.size();
  }

  // Traversal

  [[nodiscard]] std::optional<int> get_parent(int index) const {
    if (!is_valid_index(index)) {
      return std::nullopt;
    }
    return nodes_[static_cast<size_t>(index)].parent;
  }

  [[nodiscard]] std::optional<int> get_first_child(int index) const {
    if (!is_valid_index(index)) {
      return std::nullopt;
    }
    return nodes_[static_cast<size_t>(index)].first_child;
  }

  [[nodiscard]] std::optional<int> get_second_child(int index) const {
    if (!is_valid_index(index)) {
      return std::nullopt;
    }
    return nodes_[static_cast<size_t>(index)].second_child;
  }

  [[nodiscard]] std::optional<int> get_sibling(int index) const {
    auto parent_opt = get_parent(index);
    if (!parent_opt.has_value() || !is_valid_index(*parent_opt)) {
      return std::nullopt; // Root has no sibling
    }

    const Node& parent = nodes_[static_cast<size_t>(*parent_opt)];
    if (parent.first_child == index) {
      return parent.second_child;
    }
    if (parent.second_child == index) {
      return parent.first_child;
    }
    return std::nullopt;
  }

  // Leaves of the subtree rooted at index, first child before second child.
  [[nodiscard]] std::vector<int> leaves_in_order(int index = 0) const {
    std::vector<int> result;
    collect(index, result, true);
    return result;
  }

  // All nodes of the subtree rooted at index in pre-order.
  [[nodiscard]] std::vector<int> preorder(int index = 0) const {
    std::vector<int> result;
    collect(index, result, false);
    return result;
  }

  // Structure Modification

  void set_children(int parent_index, int first_child, int second_child) {
    if (!is_valid_index(parent_index)) {
      return;
    }

    Node& parent = nodes_[static_cast<size_t>(parent_index)];
    parent.first_child = first_child;
    parent.second_child = second_child;

    if (is_valid_index(first_child)) {
      nodes_[static_cast<size_t>(first_child)].parent = parent_index;
    }
    if (is_valid_index(second_child)) {
      nodes_[static_cast<size_t>(second_child)].parent = parent_index;
    }
  }

  // Turn the leaf at index into an internal node. The leaf's payload moves into a
  // new first or second child and new_leaf becomes the other child; the node at
  // index receives branch_data. Returns {first_child, second_child}.
  std::optional<std::pair<int, int>> split_leaf(int index, T branch_data, T new_leaf,
                                                bool new_leaf_first = false) {
    if (!is_leaf(index)) {
      return std::nullopt;
    }

    T old_leaf = std::exchange(nodes_[static_cast<size_t>(index)].data, std::move(branch_data));

    int first = add_node(new_leaf_first ? std::move(new_leaf) : std::move(old_leaf), index);
    int second = add_node(new_leaf_first ? std::move(old_leaf) : std::move(new_leaf), index);
    set_children(index, first, second);
    return std::make_pair(first, second);
  }

  // Remove the leaf at index and let its sibling subtree take the parent's slot.
  // The root keeps index 0. Returns the remap table produced by remove(), or
  // nullopt if index is not a non-root leaf.
  std::optional<std::vector<int>> collapse_leaf(int index) {
    if (!is_leaf(index)) {
      return std::nullopt;
    }
    auto parent_opt = get_parent(index);
    auto sibling_opt = get_sibling(index);
    if (!parent_opt.has_value() || !sibling_opt.has_value()) {
      return std::nullopt;
    }

    int parent_index = *parent_opt;
    int sibling_index = *sibling_opt;

    Node& parent = nodes_[static_cast<size_t>(parent_index)];
    Node& sibling = nodes_[static_cast<size_t>(sibling_index)];
    parent.data = std::move(sibling.data);

    auto sibling_first = sibling.first_child;
    auto sibling_second = sibling.second_child;
    if (sibling_first.has_value() && sibling_second.has_value()) {
      set_children(parent_index, *sibling_first, *sibling_second);
    } else {
      parent.first_child = std::nullopt;
      parent.second_child = std::nullopt;
    }

    return remove({index, sibling_index});
  }

  // Removal
  // Removes nodes at specified indices and remaps all indices.
  // Returns: vector where remap[old_index] = new_index, or -1 if removed.
  [[nodiscard]] std::vector<int> remove(const std::vector<int>& indices_to_remove) {
    if (nodes_.empty()) {
      return {};
    }

    std::set<int> to_remove(indices_to_remove.begin(), indices_to_remove.end());

    std::vector<int> remap(nodes_.size(), -1);
    int new_index = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (to_remove.find(static_cast<int>(i)) == to_remove.end()) {
        remap[i] = new_index++;
      }
    }

    auto remap_link = [&remap](std::optional<int>& link) {
      if (!link.has_value()) {
        return;
      }
      int old = *link;
      if (old >= 0 && static_cast<size_t>(old) < remap.size() &&
          remap[static_cast<size_t>(old)] >= 0) {
        link = remap[static_cast<size_t>(old)];
      } else {
        link = std::nullopt;
      }
    };

    std::vector<Node> new_nodes;
    new_nodes.reserve(static_cast<size_t>(new_index));
    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (remap[i] < 0) {
        continue;
      }
      Node node = std::move(nodes_[i]);
      remap_link(node.parent);
      remap_link(node.first_child);
      remap_link(node.second_child);
      new_nodes.push_back(std::move(node));
    }

    nodes_ = std::move(new_nodes);
    return remap;
  }

  // Accessors

  T& operator[](int index) {
    return nodes_[static_cast<size_t>(index)].data;
  }

  const T& operator[](int index) const {
    return nodes_[static_cast<size_t>(index)].data;
  }

  Node& node(int index) {
    return nodes_[static_cast<size_t>(index)];
  }

  const Node& node(int index) const {
    return nodes_[static_cast<size_t>(index)];
  }

  [[nodiscard]] size_t size() const {
    return nodes_.size();
  }

  [[nodiscard]] bool empty() const {
    return nodes_.empty();
  }

  void clear() {
    nodes_.clear();
  }

private:
  void collect(int index, std::vector<int>& out, bool leaves_only) const {
    if (!is_valid_index(index)) {
      return;
    }
    const Node& n = nodes_[static_cast<size_t>(index)];
    bool leaf = !n.first_child.has_value() && !n.second_child.has_value();
    if (!leaves_only || leaf) {
      out.push_back(index);
    }
    if (n.first_child.has_value()) {
      collect(*n.first_child, out, leaves_only);
    }
    if (n.second_child.has_value()) {
      collect(*n.second_child, out, leaves_only);
    }
  }

  std::vector<Node> nodes_;
};

} // namespace splittab
