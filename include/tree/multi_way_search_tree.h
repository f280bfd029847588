#pragma once

#include <cassert>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "common/errors.h"
#include "tree/multi_way_node.h"

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<const T &>())>>
  : std::true_type {};

// Balanced multiway search tree of a fixed order m: every node holds at most
// m - 1 entries and m children, every node but the root at least
// ceil(m / 2) - 1 entries, and all leaves sit at the same depth.
// Keys are unique; two keys are equal when neither compares less than the other.
// No internal synchronization: callers sharing an instance must serialize access.
template <typename K, typename V, typename Compare = std::less<K>>
class MultiWaySearchTree {
public:
  using Node = MultiWayNode<K, V, Compare>;
  using Entry = Tree_item<K, V>;

private:
  std::unique_ptr<Node> root;
  size_t count;
  size_t max_children;
  size_t min_entries;
  Compare comp;

  size_t max_entries() const { return max_children - 1; }

  // Insert below node; returns a split for the caller to absorb if node overflowed
  std::optional<typename Node::Split> insert_into(Node &node, const K &key, const V &value) {
    auto [found, pos] = node.find(key, comp);
    assert(!found);
    (void)found;

    if (node.is_leaf()) {
      node.insert_entry(pos, Entry{key, value}, nullptr, comp);
    } else {
      std::optional<typename Node::Split> promoted = insert_into(*node.children[pos], key, value);
      if (!promoted) {
        return std::nullopt;
      }
      node.insert_entry(pos, std::move(promoted->median), std::move(promoted->right), comp);
    }

    if (node.num_entries() > max_entries()) {
      return node.split();
    }
    return std::nullopt;
  }

  // Restore minimum occupancy of parent.children[i] by borrowing from an
  // adjacent sibling with a surplus, else by merging with one. The parent may
  // underflow as a result; its own caller repairs that.
  void fix_underflow(Node &parent, size_t i) {
    if (i > 0 && parent.children[i - 1]->num_entries() > min_entries) {
      parent.borrow_from_left(i);
    } else if (i + 1 < parent.children.size() && parent.children[i + 1]->num_entries() > min_entries) {
      parent.borrow_from_right(i);
    } else if (i > 0) {
      parent.merge_children(i - 1);
    } else {
      parent.merge_children(i);
    }
  }

  // Detach the largest entry of the subtree rooted at node
  Entry take_max(Node &node) {
    if (node.is_leaf()) {
      Entry last = std::move(node.entries.back());
      node.entries.pop_back();
      return last;
    }

    size_t last_child = node.children.size() - 1;
    Entry last = take_max(*node.children[last_child]);
    if (node.children[last_child]->num_entries() < min_entries) {
      fix_underflow(node, last_child);
    }
    return last;
  }

  std::optional<V> remove_from(Node &node, const K &key) {
    auto [found, pos] = node.find(key, comp);

    if (node.is_leaf()) {
      if (!found) {
        return std::nullopt;
      }
      V value = std::move(node.entries[pos].value);
      node.entries.erase(node.entries.begin() + pos);
      return value;
    }

    std::optional<V> removed;
    if (found) {
      // swap in the in-order predecessor, taken from the rightmost leaf of the left subtree
      removed = std::move(node.entries[pos].value);
      node.entries[pos] = take_max(*node.children[pos]);
    } else {
      removed = remove_from(*node.children[pos], key);
      if (!removed) {
        return std::nullopt;
      }
    }

    if (node.children[pos]->num_entries() < min_entries) {
      fix_underflow(node, pos);
    }
    return removed;
  }

  // Returns the leaf depth of the subtree, or -1 if an invariant is broken
  int check_subtree(const Node &node, const K *lower, const K *upper, bool is_root) const {
    if (!node.is_sorted_unique(comp))
      return -1;
    if (node.num_entries() > max_entries())
      return -1;
    if (!is_root && node.num_entries() < min_entries)
      return -1;
    if (node.num_entries() == 0)
      return -1;
    if (lower && !comp(*lower, node.entries.front().key))
      return -1;
    if (upper && !comp(node.entries.back().key, *upper))
      return -1;

    if (node.is_leaf())
      return 0;
    if (node.children.size() != node.num_entries() + 1)
      return -1;

    int depth = -1;
    for (size_t i = 0; i < node.children.size(); ++i) {
      const K *child_lower = i == 0 ? lower : &node.entries[i - 1].key;
      const K *child_upper = i == node.num_entries() ? upper : &node.entries[i].key;
      if (!node.children[i])
        return -1;

      int child_depth = check_subtree(*node.children[i], child_lower, child_upper, false);
      if (child_depth < 0)
        return -1;
      if (depth >= 0 && child_depth != depth)
        return -1;
      depth = child_depth;
    }
    return depth + 1;
  }

public:
  // Lazy in-order walk with an explicit stack of (node, next entry index)
  class const_iterator {
  private:
    std::vector<std::pair<const Node *, size_t>> stack;

    void descend_leftmost(const Node *node) {
      while (node != nullptr) {
        stack.emplace_back(node, 0);
        node = node->is_leaf() ? nullptr : node->children[0].get();
      }
    }

    // Drop frames whose entries are all visited
    void settle() {
      while (!stack.empty() && stack.back().second >= stack.back().first->num_entries()) {
        stack.pop_back();
      }
    }

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = const Entry *;
    using reference = const Entry &;

    const_iterator() = default;
    explicit const_iterator(const Node *root) {
      descend_leftmost(root);
      settle();
    }

    reference operator*() const { return stack.back().first->entries[stack.back().second]; }
    pointer operator->() const { return &**this; }

    const_iterator &operator++() {
      auto &top = stack.back();
      size_t next_child = ++top.second;
      const Node *node = top.first;
      if (!node->is_leaf()) {
        descend_leftmost(node->children[next_child].get());
      }
      settle();
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator copy = *this;
      ++*this;
      return copy;
    }

    bool operator==(const const_iterator &other) const { return stack == other.stack; }
    bool operator!=(const const_iterator &other) const { return !(*this == other); }
  };

  // order is the maximum number of children of a node
  explicit MultiWaySearchTree(size_t order = 4, Compare compare = Compare())
    : count(0), max_children(order), min_entries(0), comp(std::move(compare)) {
    if (order < 3) {
      throw std::invalid_argument("Tree order must be at least 3, got " + std::to_string(order));
    }
    min_entries = (order + 1) / 2 - 1;
  }

  MultiWaySearchTree(const MultiWaySearchTree &) = delete;
  MultiWaySearchTree &operator=(const MultiWaySearchTree &) = delete;

  // The moved-from tree is left empty and keeps its order and comparator
  MultiWaySearchTree(MultiWaySearchTree &&other)
    : root(std::move(other.root)), count(other.count), max_children(other.max_children),
      min_entries(other.min_entries), comp(other.comp) {
    other.count = 0;
  }

  MultiWaySearchTree &operator=(MultiWaySearchTree &&other) {
    if (this != &other) {
      root = std::move(other.root);
      count = other.count;
      max_children = other.max_children;
      min_entries = other.min_entries;
      comp = other.comp;
      other.count = 0;
    }
    return *this;
  }

  std::optional<V> search(const K &key) const {
    const Node *node = root.get();
    while (node != nullptr) {
      auto [found, pos] = node->find(key, comp);
      if (found) {
        return node->entries[pos].value;
      }
      node = node->is_leaf() ? nullptr : node->children[pos].get();
    }
    return std::nullopt;
  }

  bool contains(const K &key) const { return search(key).has_value(); }

  // Throws DuplicateKey, leaving the tree untouched, if key is present
  void insert(const K &key, const V &value) {
    if (contains(key)) {
      std::ostringstream msg;
      msg << "Key already present in tree";
      if constexpr (is_streamable<K>::value) {
        msg << ": " << key;
      }
      throw DuplicateKey(msg.str());
    }

    if (!root) {
      root = std::make_unique<Node>();
      root->entries.push_back(Entry{key, value});
      count = 1;
      return;
    }

    std::optional<typename Node::Split> promoted = insert_into(*root, key, value);
    if (promoted) {
      // root split, tree grows one level
      auto new_root = std::make_unique<Node>();
      new_root->entries.push_back(std::move(promoted->median));
      new_root->children.push_back(std::move(root));
      new_root->children.push_back(std::move(promoted->right));
      root = std::move(new_root);
    }
    count++;
  }

  // Returns the removed value, or nullopt if key is absent
  std::optional<V> remove(const K &key) {
    if (!root) {
      return std::nullopt;
    }

    std::optional<V> removed = remove_from(*root, key);
    if (!removed) {
      return std::nullopt;
    }
    count--;

    if (root->num_entries() == 0) {
      // root emptied by a merge, tree shrinks one level
      if (root->is_leaf()) {
        root.reset();
      } else {
        std::unique_ptr<Node> only_child = std::move(root->children[0]);
        root = std::move(only_child);
      }
    }
    return removed;
  }

  const_iterator begin() const { return const_iterator(root.get()); }
  const_iterator end() const { return const_iterator(); }

  template <typename F>
  void for_each_inorder(F &&fn) const {
    for (const Entry &entry : *this) {
      fn(entry.key, entry.value);
    }
  }

  const Entry &min() const {
    if (!root)
      throw std::out_of_range("min() on an empty tree");
    const Node *node = root.get();
    while (!node->is_leaf())
      node = node->children.front().get();
    return node->entries.front();
  }

  const Entry &max() const {
    if (!root)
      throw std::out_of_range("max() on an empty tree");
    const Node *node = root.get();
    while (!node->is_leaf())
      node = node->children.back().get();
    return node->entries.back();
  }

  // Number of levels, 0 for an empty tree
  size_t height() const {
    size_t levels = 0;
    for (const Node *node = root.get(); node != nullptr;
         node = node->is_leaf() ? nullptr : node->children[0].get()) {
      levels++;
    }
    return levels;
  }

  // Ordering, occupancy, child counts and equal leaf depth over the whole tree
  bool check_invariants() const {
    if (!root)
      return count == 0;

    if (check_subtree(*root, nullptr, nullptr, true) < 0)
      return false;

    size_t seen = 0;
    for (auto it = begin(); it != end(); ++it)
      seen++;
    return seen == count;
  }

  void clear() {
    root.reset();
    count = 0;
  }

  size_t size() const { return count; }
  bool empty() const { return count == 0; }
  size_t order() const { return max_children; }
  size_t min_node_entries() const { return min_entries; }

  // One line per level, nodes as [k1 k2 ...]. Only usable when K is streamable.
  void print_structure(std::ostream &out) const {
    if (!root) {
      out << "(empty)\n";
      return;
    }

    std::vector<const Node *> level{root.get()};
    while (!level.empty()) {
      std::vector<const Node *> next;
      for (const Node *node : level) {
        out << "[";
        for (size_t i = 0; i < node->num_entries(); ++i) {
          out << (i == 0 ? "" : " ") << node->entries[i].key;
        }
        out << "] ";
        for (const auto &child : node->children) {
          next.push_back(child.get());
        }
      }
      out << "\n";
      level = std::move(next);
    }
  }
};
