#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <MurmurHash3.h>
#include <xxHash64.h>

#include "common/errors.h"
#include "common/utils.h"
#include "hash_table/prime_source.h"

template <typename K, typename V>
struct Ht_item {
  K key;
  V value;
};

struct HashMapConfig {
  double load_factor = 0.75;  // live entries / capacity never goes above this
  double growth_factor = 2.0; // new capacity is the next prime >= growth_factor * capacity, finite

  void validate() const {
    if (!(load_factor > 0.0 && load_factor <= 1.0)) {
      throw std::invalid_argument("Load factor must be in (0, 1], got " + std::to_string(load_factor));
    }
    if (!(growth_factor > 1.0 && std::isfinite(growth_factor))) {
      throw std::invalid_argument("Growth factor must be greater than 1, got " + std::to_string(growth_factor));
    }
  }
};

// Open addressing hash map resolving collisions with double hashing.
// Capacity is always a prime taken from a PrimeSource, so every step in
// [1, capacity - 1] is coprime with it and a probe sequence visits all slots.
// No internal synchronization: callers sharing an instance must serialize access.
template <typename K, typename V>
class DoubleHashingHashMap {
private:
  enum class SlotState : uint8_t { Empty, Occupied, Tombstone };

  struct Slot {
    SlotState state = SlotState::Empty;
    std::optional<Ht_item<K, V>> item;
  };

  // Raw 64 bit hashes of a key, independent of the capacity
  struct Hashes {
    uint64_t home;
    uint64_t step;
  };

  struct ProbeResult {
    bool found;   // true if index holds the key
    size_t index; // match, first reusable slot, or npos if the sequence has none
  };

  static constexpr size_t npos = static_cast<size_t>(-1);

  std::vector<Slot> table;
  size_t capacity;
  size_t count;
  uint64_t collision_counter; // never reset, survives resize and clear
  size_t resizes;
  HashMapConfig config;
  std::shared_ptr<const PrimeSource> primes;

  static std::pair<const void *, size_t> key_bytes(const K &key) {
    if constexpr (std::is_same_v<K, std::string>) {
      // hash the characters not the object
      return {key.data(), key.length()};
    } else {
      static_assert(std::is_trivially_copyable_v<K>, "keys are hashed over their bytes");
      return {&key, sizeof(K)};
    }
  }

  static Hashes hash_key(const K &key) {
    auto [data_ptr, len] = key_bytes(key);

    uint32_t seed = 2400;
    uint64_t hash_output[2] = {0}; // 128 bit output buffer
    MurmurHash3_x86_128(data_ptr, (int)len, seed, hash_output);

    return {hash_output[0], XXHash64::hash(data_ptr, len, 0)};
  }

  static size_t home_slot(const Hashes &h, size_t cap) {
    return h.home % cap;
  }

  // never zero, always below a prime capacity
  static size_t step_size(const Hashes &h, size_t cap) {
    return 1 + h.step % (cap - 1);
  }

  bool exceeds_load_factor(size_t entries, size_t cap) const {
    return static_cast<double>(entries) > config.load_factor * static_cast<double>(cap);
  }

  // Walk the probe sequence of key. Tombstones are skipped but remembered as
  // the first reusable slot; an empty slot ends the walk. Every probe after
  // the first is added to *collisions when it is not null.
  ProbeResult find_slot(const K &key, const Hashes &h, uint64_t *collisions) const {
    size_t first_avail = npos;
    size_t step = step_size(h, capacity);
    size_t j = home_slot(h, capacity);

    for (size_t attempt = 0; attempt < capacity; ++attempt) {
      if (attempt > 0 && collisions != nullptr) {
        (*collisions)++;
      }

      const Slot &slot = table[j];
      if (slot.state == SlotState::Empty) {
        return {false, first_avail == npos ? j : first_avail};
      }
      if (slot.state == SlotState::Tombstone) {
        if (first_avail == npos)
          first_avail = j;
      } else if (slot.item->key == key) {
        return {true, j};
      }

      j = (j + step) % capacity;
    }

    // visited every slot without meeting an empty one
    return {false, first_avail};
  }

  size_t grown_capacity() const {
    double target = std::ceil(static_cast<double>(capacity) * config.growth_factor);
    uint64_t wanted = std::max<uint64_t>(static_cast<uint64_t>(target), capacity + 1);
    return primes->next_prime_at_least(wanted);
  }

  // Rebuild into new_capacity slots. Tombstones are dropped and the probe of
  // every live entry is recomputed; those probe steps count as collisions.
  void resize(size_t new_capacity) {
    std::vector<Slot> temp_table(new_capacity);
    uint64_t rehash_collisions = 0;

    for (Slot &slot : table) {
      if (slot.state != SlotState::Occupied)
        continue;

      Hashes h = hash_key(slot.item->key);
      size_t step = step_size(h, new_capacity);
      size_t j = home_slot(h, new_capacity);
      while (temp_table[j].state != SlotState::Empty) {
        j = (j + step) % new_capacity;
        rehash_collisions++;
      }

      temp_table[j].item = std::move(slot.item);
      temp_table[j].state = SlotState::Occupied;
    }

#ifndef NDEBUG
    log_info("HashMap", "Resized " + std::to_string(capacity) + " -> " + std::to_string(new_capacity) +
                        " slots with " + std::to_string(count) + " entries");
#endif

    table = std::move(temp_table);
    capacity = new_capacity;
    collision_counter += rehash_collisions;
    resizes++;
  }

public:
  // A capacity that is not prime is rounded up to the next prime of the source.
  explicit DoubleHashingHashMap(int initial_capacity = 17,
                                HashMapConfig cfg = HashMapConfig{},
                                std::shared_ptr<const PrimeSource> source = PrimeSource::default_source())
    : count(0), collision_counter(0), resizes(0), config(cfg), primes(std::move(source)) {
    if (initial_capacity < 2) {
      throw InvalidCapacity(initial_capacity);
    }
    if (!primes) {
      throw std::invalid_argument("Hash map needs a prime source");
    }
    config.validate();

    capacity = primes->next_prime_at_least(static_cast<uint64_t>(initial_capacity));
    table.resize(capacity);
  }

  DoubleHashingHashMap(const DoubleHashingHashMap &) = default;
  DoubleHashingHashMap &operator=(const DoubleHashingHashMap &) = default;

  // The moved-from map is left empty with its capacity, config and prime source
  DoubleHashingHashMap(DoubleHashingHashMap &&other)
    : table(std::move(other.table)), capacity(other.capacity), count(other.count),
      collision_counter(other.collision_counter), resizes(other.resizes),
      config(other.config), primes(other.primes) {
    other.table.assign(other.capacity, Slot{});
    other.count = 0;
  }

  DoubleHashingHashMap &operator=(DoubleHashingHashMap &&other) {
    if (this != &other) {
      table = std::move(other.table);
      capacity = other.capacity;
      count = other.count;
      collision_counter = other.collision_counter;
      resizes = other.resizes;
      config = other.config;
      primes = other.primes;

      other.table.assign(other.capacity, Slot{});
      other.count = 0;
    }
    return *this;
  }

  // Returns true if a new entry was created, false if an existing value was overwritten
  bool insert(const K &key, const V &value) {
    Hashes h = hash_key(key);

    for (;;) {
      ProbeResult slot = find_slot(key, h, &collision_counter);

      if (slot.found) {
        table[slot.index].item->value = value;
        return false;
      }

      // grow before placing, so a failed resize leaves the map untouched
      if (slot.index != npos && !exceeds_load_factor(count + 1, capacity)) {
        Slot &target = table[slot.index];
        target.item.emplace(Ht_item<K, V>{key, value});
        target.state = SlotState::Occupied;
        count++;
        return true;
      }

      resize(grown_capacity());
    }
  }

  std::optional<V> search(const K &key) const {
    ProbeResult slot = find_slot(key, hash_key(key), nullptr);
    if (!slot.found) {
      return std::nullopt;
    }
    return table[slot.index].item->value;
  }

  bool contains(const K &key) const {
    return find_slot(key, hash_key(key), nullptr).found;
  }

  V get_or(const K &key, const V &fallback) const {
    std::optional<V> value = search(key);
    return value ? *value : fallback;
  }

  // Removes key and hands back its value; the slot becomes a tombstone
  std::optional<V> pop(const K &key) {
    ProbeResult slot = find_slot(key, hash_key(key), nullptr);
    if (!slot.found) {
      return std::nullopt;
    }

    Slot &target = table[slot.index];
    V value = std::move(target.item->value);
    target.item.reset();
    target.state = SlotState::Tombstone;
    count--;
    return value;
  }

  // Returns false if the key does not exist. Never shrinks the table.
  bool remove(const K &key) {
    return pop(key).has_value();
  }

  // Drops every entry; capacity and the collision counter are kept
  void clear() {
    table.assign(capacity, Slot{});
    count = 0;
  }

  // Slot index visited at the given attempt of key's probe sequence
  size_t probe(const K &key, size_t attempt) const {
    Hashes h = hash_key(key);
    return (home_slot(h, capacity) + (attempt % capacity) * step_size(h, capacity)) % capacity;
  }

  template <typename F>
  void for_each(F &&fn) const {
    for (const Slot &slot : table) {
      if (slot.state == SlotState::Occupied) {
        fn(slot.item->key, slot.item->value);
      }
    }
  }

  std::vector<K> keys() const {
    std::vector<K> result;
    result.reserve(count);
    for_each([&result](const K &key, const V &) { result.push_back(key); });
    return result;
  }

  // Same set of (key, value) pairs, regardless of capacity or layout
  bool operator==(const DoubleHashingHashMap &other) const {
    if (count != other.count) {
      return false;
    }
    bool same = true;
    for_each([&](const K &key, const V &value) {
      if (same) {
        std::optional<V> theirs = other.search(key);
        same = theirs.has_value() && *theirs == value;
      }
    });
    return same;
  }

  bool operator!=(const DoubleHashingHashMap &other) const { return !(*this == other); }

  size_t get_capacity() const { return capacity; }
  size_t get_count() const { return count; }
  bool empty() const { return count == 0; }
  uint64_t collision_count() const { return collision_counter; }
  size_t get_resize_count() const { return resizes; }
  double get_load_factor() const { return static_cast<double>(count) / capacity; }
  const HashMapConfig &get_config() const { return config; }
};
