#include "hash_table/double_hashing_hash_map.h"
#include "currency/currency.h"
#include "common/config_t.h"

#include <random>
#include <iomanip>

struct RoundStats {
  uint64_t collisions;
  size_t capacity;
  size_t resizes;
  size_t entries;
};

// One round: random ISO codes inserted, then random codes deleted (absent
// codes are simply not found). Mirrors the workload the table was tuned for.
RoundStats do_round(const config_t& config, std::shared_ptr<const PrimeSource> primes, std::mt19937& rng) {
  const std::vector<std::string>& codes = Currency::registry();
  std::uniform_int_distribution<size_t> code_dist(0, codes.size() - 1);

  HashMapConfig map_config;
  map_config.load_factor = config.load_factor;
  map_config.growth_factor = config.growth_factor;
  DoubleHashingHashMap<std::string, std::string> map(config.initial_capacity, map_config, std::move(primes));

  for (int i = 0; i < config.inserts; ++i) {
    const std::string& code = codes[code_dist(rng)];
    map.insert(code, code + " value");
  }

  for (int i = 0; i < config.deletes; ++i) {
    map.remove(codes[code_dist(rng)]);
  }

  return {map.collision_count(), map.get_capacity(), map.get_resize_count(), map.get_count()};
}

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config_file]\n";
    return 1;
  }

  try {
    config_t config = argc == 2 ? load_config(argv[1]) : config_t();
    if (config.trials <= 0 || config.inserts < 0 || config.deletes < 0) {
      throw std::runtime_error("trials must be positive, inserts and deletes non-negative");
    }
    config.dump();

    std::shared_ptr<const PrimeSource> primes = config.prime_table.empty()
        ? PrimeSource::default_source()
        : std::make_shared<const PrimeSource>(PrimeSource::from_file(config.prime_table));

    std::mt19937 rng(config.seed);
    uint64_t total_collisions = 0;
    uint64_t total_capacity = 0;
    uint64_t total_resizes = 0;
    uint64_t total_entries = 0;

    for (int t = 0; t < config.trials; ++t) {
      RoundStats stats = do_round(config, primes, rng);
      total_collisions += stats.collisions;
      total_capacity += stats.capacity;
      total_resizes += stats.resizes;
      total_entries += stats.entries;
    }

    double trials = static_cast<double>(config.trials);
    std::cout << "\nCollision Benchmark RESULTS (" << config.trials << " rounds of "
              << config.inserts << " inserts / " << config.deletes << " deletes)\n";
    std::cout << "Average Collisions:     " << std::fixed << std::setprecision(2) << total_collisions / trials << "\n";
    std::cout << "Average Final Capacity: " << std::fixed << std::setprecision(2) << total_capacity / trials << "\n";
    std::cout << "Average Resizes:        " << std::fixed << std::setprecision(2) << total_resizes / trials << "\n";
    std::cout << "Average Live Entries:   " << std::fixed << std::setprecision(2) << total_entries / trials << "\n";
    std::cout << std::endl;

  } catch (const std::exception& e) {
      std::cerr << "[Fatal Error] " << e.what() << std::endl;
      return 1;
  }

  return 0;
}
