#pragma once

#include <algorithm>
#include <cassert>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

template <typename K, typename V>
struct Tree_item {
  K key;
  V value;
};

// One node of a multiway search tree: entries sorted ascending by key,
// unique, and entries.size() + 1 owned children unless the node is a leaf.
// Children are owned exclusively through unique_ptr and moved, never shared,
// when a split or merge reparents them.
template <typename K, typename V, typename Compare>
class MultiWayNode {
public:
  using Entry = Tree_item<K, V>;
  using NodePtr = std::unique_ptr<MultiWayNode>;

  std::vector<Entry> entries;
  std::vector<NodePtr> children;

  // Result of splitting an overflowing node in two
  struct Split {
    Entry median;
    NodePtr right;
  };

  bool is_leaf() const { return children.empty(); }
  size_t num_entries() const { return entries.size(); }

  // Binary search. Returns (true, i) when entries[i] holds key, otherwise
  // (false, i) with i the insertion point, which is also the index of the
  // child whose open interval contains key.
  std::pair<bool, size_t> find(const K &key, const Compare &comp) const {
    auto it = std::lower_bound(entries.begin(), entries.end(), key,
                               [&comp](const Entry &e, const K &k) { return comp(e.key, k); });
    size_t pos = static_cast<size_t>(it - entries.begin());
    bool found = it != entries.end() && !comp(key, it->key);
    return {found, pos};
  }

  // Place entry at pos; right_child, if any, becomes children[pos + 1]
  void insert_entry(size_t pos, Entry entry, NodePtr right_child, const Compare &comp) {
    assert(pos <= entries.size());
    assert(pos == 0 || comp(entries[pos - 1].key, entry.key));
    assert(pos == entries.size() || comp(entry.key, entries[pos].key));

    entries.insert(entries.begin() + pos, std::move(entry));
    if (right_child) {
      assert(children.size() == entries.size());
      children.insert(children.begin() + pos + 1, std::move(right_child));
    }
    assert(is_leaf() || children.size() == entries.size() + 1);
  }

  // Move the upper half out into a new right sibling and hand back the
  // median for the parent. Left keeps entries [0, mid).
  Split split() {
    size_t mid = entries.size() / 2;
    NodePtr right = std::make_unique<MultiWayNode>();

    right->entries.assign(std::make_move_iterator(entries.begin() + mid + 1),
                          std::make_move_iterator(entries.end()));
    Entry median = std::move(entries[mid]);
    entries.erase(entries.begin() + mid, entries.end());

    if (!is_leaf()) {
      right->children.assign(std::make_move_iterator(children.begin() + mid + 1),
                             std::make_move_iterator(children.end()));
      children.erase(children.begin() + mid + 1, children.end());
    }

    assert(is_leaf() || children.size() == entries.size() + 1);
    assert(right->is_leaf() || right->children.size() == right->entries.size() + 1);
    return {std::move(median), std::move(right)};
  }

  // Rotate through this node: the last entry of children[i - 1] moves up to
  // entries[i - 1], whose old value moves down to the front of children[i].
  void borrow_from_left(size_t i) {
    MultiWayNode &node = *children[i];
    MultiWayNode &left = *children[i - 1];

    node.entries.insert(node.entries.begin(), std::move(entries[i - 1]));
    entries[i - 1] = std::move(left.entries.back());
    left.entries.pop_back();

    if (!left.is_leaf()) {
      node.children.insert(node.children.begin(), std::move(left.children.back()));
      left.children.pop_back();
    }
  }

  // Mirror of borrow_from_left with children[i + 1]
  void borrow_from_right(size_t i) {
    MultiWayNode &node = *children[i];
    MultiWayNode &right = *children[i + 1];

    node.entries.push_back(std::move(entries[i]));
    entries[i] = std::move(right.entries.front());
    right.entries.erase(right.entries.begin());

    if (!right.is_leaf()) {
      node.children.push_back(std::move(right.children.front()));
      right.children.erase(right.children.begin());
    }
  }

  // Fold entries[i] and children[i + 1] into children[i]; the right
  // sibling is destroyed. This node loses one entry.
  void merge_children(size_t i) {
    MultiWayNode &left = *children[i];
    NodePtr right = std::move(children[i + 1]);

    left.entries.push_back(std::move(entries[i]));
    left.entries.insert(left.entries.end(),
                        std::make_move_iterator(right->entries.begin()),
                        std::make_move_iterator(right->entries.end()));
    left.children.insert(left.children.end(),
                         std::make_move_iterator(right->children.begin()),
                         std::make_move_iterator(right->children.end()));

    entries.erase(entries.begin() + i);
    children.erase(children.begin() + i + 1);

    assert(left.is_leaf() || left.children.size() == left.entries.size() + 1);
  }

  bool is_sorted_unique(const Compare &comp) const {
    for (size_t i = 1; i < entries.size(); ++i) {
      if (!comp(entries[i - 1].key, entries[i].key))
        return false;
    }
    return true;
  }
};
