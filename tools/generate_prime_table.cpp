#include "hash_table/prime_source.h"
#include "common/utils.h"

#include <iostream>

// Writes every prime in [low, high] as little-endian uint32 records
int main(int argc, char** argv) {
  if (argc < 4) {
      std::cerr << "Usage: " << argv[0] << " <low> <high> <out_file>\n";
      return 1;
  }

  try {
    uint64_t low = std::stoull(argv[1]);
    uint64_t high = std::stoull(argv[2]);
    std::string out_file = argv[3];

    PrimeSource primes = PrimeSource::sieve(low, high);
    primes.write_file(out_file);

    log_info("PrimeTable", "Wrote " + std::to_string(primes.size()) + " primes up to " +
                           std::to_string(primes.largest()) + " to " + out_file);

  } catch (const std::exception& e) {
      std::cerr << "[Fatal Error] " << e.what() << std::endl;
      return 1;
  }

  return 0;
}
