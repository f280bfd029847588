#include <cassert>
#include <limits>
#include <iostream>
#include <random>
#include <set>
#include <unordered_map>

#include "hash_table/double_hashing_hash_map.h"
#include "common/errors.h"

void log(const std::string& message) {
  std::cout << "[TEST] " << message << std::endl;
}

bool is_prime(size_t n) {
  if (n < 2) return false;
  for (size_t d = 2; d * d <= n; ++d) {
    if (n % d == 0) return false;
  }
  return true;
}

void test_basic_operations() {
  log("Running Basic Operations Test...");
  DoubleHashingHashMap<std::string, int> ht(11);

  // insert
  assert(ht.insert("key1", 100));
  assert(ht.insert("key2", 200));

  // search
  auto val1 = ht.search("key1");
  auto val2 = ht.search("key2");
  auto val3 = ht.search("key_missing");

  assert(val1.has_value() && val1.value() == 100);
  assert(val2.has_value() && val2.value() == 200);
  assert(!val3.has_value());

  // update overwrites in place
  assert(!ht.insert("key1", 101));
  assert(ht.search("key1").value() == 101);
  assert(ht.get_count() == 2);

  // remove
  assert(ht.remove("key1"));
  assert(!ht.search("key1").has_value());
  assert(!ht.remove("key1"));
  assert(ht.get_count() == 1);

  assert(ht.contains("key2"));
  assert(!ht.contains("key1"));
  assert(ht.get_or("key2", -1) == 200);
  assert(ht.get_or("key1", -1) == -1);
  assert(ht.pop("key2").value() == 200);
  assert(ht.empty());

  log("Basic Operations Test Passed!");
}

void test_invalid_capacity() {
  log("Running Invalid Capacity Test...");
  bool thrown = false;
  try {
    DoubleHashingHashMap<int, int> ht(-5);
  } catch (const InvalidCapacity&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    DoubleHashingHashMap<int, int> ht(1);
  } catch (const InvalidCapacity&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    HashMapConfig config;
    config.load_factor = 1.5;
    DoubleHashingHashMap<int, int> ht(7, config);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    HashMapConfig config;
    config.growth_factor = std::numeric_limits<double>::infinity();
    DoubleHashingHashMap<int, int> ht(7, config);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);

  // non-prime capacities round up
  DoubleHashingHashMap<int, int> ht(20);
  assert(ht.get_capacity() == 23);
  assert(ht.get_config().load_factor == 0.75);
  assert(ht.get_config().growth_factor == 2.0);

  log("Invalid Capacity Test Passed!");
}

void test_single_resize_to_next_prime() {
  log("Running Single Resize Test...");
  DoubleHashingHashMap<int, int> ht(7);
  assert(ht.get_capacity() == 7);

  for (int k = 1; k <= 8; ++k) {
    ht.insert(k, k * 10);
  }

  assert(ht.get_resize_count() == 1);
  assert(ht.get_capacity() == 17);
  for (int k = 1; k <= 8; ++k) {
    assert(ht.search(k).value() == k * 10);
  }

  log("Single Resize Test Passed!");
}

void test_load_factor_bound() {
  log("Running Load Factor Bound Test...");
  HashMapConfig config;
  config.load_factor = 0.5;
  config.growth_factor = 1.5;
  DoubleHashingHashMap<int, int> ht(3, config);

  for (int k = 0; k < 5000; ++k) {
    ht.insert(k * 7919, k);
    assert(ht.get_load_factor() <= config.load_factor);
    assert(is_prime(ht.get_capacity()));
  }
  assert(ht.get_count() == 5000);

  log("Load Factor Bound Test Passed!");
}

void test_probe_coverage() {
  log("Running Probe Coverage Test...");
  DoubleHashingHashMap<std::string, int> ht(101);

  for (int i = 0; i < 50; ++i) {
    std::string key = "probe" + std::to_string(i);
    std::set<size_t> visited;
    for (size_t attempt = 0; attempt < ht.get_capacity(); ++attempt) {
      size_t index = ht.probe(key, attempt);
      assert(index < ht.get_capacity());
      visited.insert(index);
    }
    // every slot exactly once, then the sequence repeats
    assert(visited.size() == ht.get_capacity());
    assert(ht.probe(key, ht.get_capacity()) == ht.probe(key, 0));
    // pure function of key and attempt
    assert(ht.probe(key, 3) == ht.probe(key, 3));
  }

  log("Probe Coverage Test Passed!");
}

void test_tombstone_reinsert() {
  log("Running Tombstone Reinsert Test...");
  DoubleHashingHashMap<int, int> ht(13);

  for (int k = 0; k < 8; ++k) {
    ht.insert(k, k);
  }
  size_t capacity = ht.get_capacity();

  // delete, reinsert, search: keys probed past the tombstones must stay reachable
  for (int round = 0; round < 20; ++round) {
    for (int k = 0; k < 8; k += 2) {
      assert(ht.remove(k));
      assert(!ht.search(k).has_value());
    }
    for (int k = 1; k < 8; k += 2) {
      assert(ht.search(k).value() == k);
    }
    for (int k = 0; k < 8; k += 2) {
      assert(ht.insert(k, k + round));
      assert(ht.search(k).value() == k + round);
    }
    assert(ht.get_count() == 8);
  }

  // deletion never shrinks the table
  assert(ht.get_capacity() == capacity);

  log("Tombstone Reinsert Test Passed!");
}

void test_full_table_under_tombstones() {
  log("Running Full Table Test...");
  HashMapConfig config;
  config.load_factor = 1.0;
  DoubleHashingHashMap<int, int> ht(5, config);

  for (int k = 0; k < 5; ++k) {
    ht.insert(k, k);
  }
  assert(ht.get_capacity() == 5);
  assert(ht.get_count() == 5);

  // no empty slot left: a new key must enlarge the table
  ht.insert(100, 100);
  assert(ht.get_capacity() > 5);
  for (int k = 0; k < 5; ++k) {
    assert(ht.search(k).value() == k);
  }
  assert(ht.search(100).value() == 100);

  log("Full Table Test Passed!");
}

void test_collision_monotonicity() {
  log("Running Collision Monotonicity Test...");
  DoubleHashingHashMap<std::string, std::string> ht(17);
  std::mt19937 rng(2400);
  std::uniform_int_distribution<int> key_dist(0, 199);
  std::uniform_int_distribution<int> op_dist(0, 2);

  uint64_t last = ht.collision_count();
  for (int i = 0; i < 5000; ++i) {
    std::string key = "k" + std::to_string(key_dist(rng));
    switch (op_dist(rng)) {
      case 0: ht.insert(key, key); break;
      case 1: ht.remove(key); break;
      default: ht.search(key); break;
    }
    assert(ht.collision_count() >= last);
    last = ht.collision_count();
  }

  // clear keeps the history
  ht.clear();
  assert(ht.empty());
  assert(ht.collision_count() == last);

  log("Collision Monotonicity Test Passed!");
}

void test_round_trip_against_reference() {
  log("Running Reference Model Test...");
  DoubleHashingHashMap<int, int> ht(2);
  std::unordered_map<int, int> reference;
  std::mt19937 rng(375);
  std::uniform_int_distribution<int> key_dist(0, 999);
  std::uniform_int_distribution<int> op_dist(0, 3);

  for (int i = 0; i < 20000; ++i) {
    int key = key_dist(rng);
    if (op_dist(rng) == 0) {
      bool removed = ht.remove(key);
      assert(removed == (reference.erase(key) == 1));
    } else {
      bool inserted = ht.insert(key, i);
      assert(inserted == (reference.find(key) == reference.end()));
      reference[key] = i;
    }
  }

  assert(ht.get_count() == reference.size());
  for (int key = 0; key < 1000; ++key) {
    auto it = reference.find(key);
    auto value = ht.search(key);
    if (it == reference.end()) {
      assert(!value.has_value());
    } else {
      assert(value.has_value() && *value == it->second);
    }
  }
  assert(ht.keys().size() == reference.size());

  log("Reference Model Test Passed!");
}

void test_equality() {
  log("Running Equality Test...");
  DoubleHashingHashMap<std::string, int> a(7);
  DoubleHashingHashMap<std::string, int> b(101);

  for (int i = 0; i < 20; ++i) {
    a.insert("USD" + std::to_string(i), i);
  }
  for (int i = 19; i >= 0; --i) {
    b.insert("USD" + std::to_string(i), i);
  }
  assert(a == b);

  b.insert("USD0", -1);
  assert(a != b);

  log("Equality Test Passed!");
}

void test_exhausted_prime_table() {
  log("Running Exhausted Prime Table Test...");
  auto primes = std::make_shared<const PrimeSource>(std::vector<uint64_t>{5, 7, 11});
  DoubleHashingHashMap<int, int> ht(5, HashMapConfig{}, primes);

  bool thrown = false;
  try {
    for (int k = 0; k < 20; ++k) {
      ht.insert(k, k);
    }
  } catch (const ExhaustedPrimeTable&) {
    thrown = true;
  }
  assert(thrown);

  // the failed insert left the map as it was
  assert(ht.get_capacity() == 11);
  size_t count = ht.get_count();
  assert(count == 8);
  for (int k = 0; k < static_cast<int>(count); ++k) {
    assert(ht.search(k).value() == k);
  }

  log("Exhausted Prime Table Test Passed!");
}

void test_moved_from_map_reusable() {
  log("Running Move Test...");
  DoubleHashingHashMap<std::string, int> source(7);
  for (int i = 0; i < 30; ++i) {
    source.insert("EUR" + std::to_string(i), i);
  }
  size_t capacity = source.get_capacity();

  DoubleHashingHashMap<std::string, int> target(std::move(source));
  assert(target.get_count() == 30);
  assert(target.search("EUR12").value() == 12);

  assert(source.empty());
  assert(source.get_capacity() == capacity);
  assert(!source.search("EUR12").has_value());
  assert(!source.contains("EUR0"));
  assert(source.insert("USD", 1));
  assert(source.search("USD").value() == 1);
  assert(source.get_count() == 1);

  DoubleHashingHashMap<std::string, int> other(11);
  other = std::move(target);
  assert(other.get_count() == 30);
  assert(target.empty());
  assert(target.insert("GBP", 2));
  assert(target.search("GBP").value() == 2);

  // copies are independent
  DoubleHashingHashMap<std::string, int> copy(other);
  copy.remove("EUR3");
  assert(other.contains("EUR3"));
  assert(copy != other);

  log("Move Test Passed!");
}

int main() {
  test_basic_operations();
  test_invalid_capacity();
  test_single_resize_to_next_prime();
  test_load_factor_bound();
  test_probe_coverage();
  test_tombstone_reinsert();
  test_full_table_under_tombstones();
  test_collision_monotonicity();
  test_round_trip_against_reference();
  test_equality();
  test_exhausted_prime_table();
  test_moved_from_map_reusable();

  log("All Double Hashing Hash Map Tests Passed!");
  return 0;
}
