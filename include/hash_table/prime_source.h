#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Read-only, ascending table of primes used for hash table capacities.
// Lookups never test primality, they only search the curated table.
class PrimeSource {
private:
  std::vector<uint64_t> primes; // strictly increasing, every value >= 2

public:
  explicit PrimeSource(std::vector<uint64_t> table);

  // Flat binary file of little-endian uint32_t primes
  static PrimeSource from_file(const std::string &filename);

  // All primes in [low, high], segmented Sieve of Eratosthenes
  static PrimeSource sieve(uint64_t low, uint64_t high);

  // Shared table of every prime below 2^22, built on first use
  static std::shared_ptr<const PrimeSource> default_source();

  void write_file(const std::string &filename) const;

  uint64_t next_prime_at_least(uint64_t n) const;  // throws ExhaustedPrimeTable
  uint64_t previous_prime_below(uint64_t n) const; // throws ExhaustedPrimeTable

  size_t size() const { return primes.size(); }
  uint64_t largest() const { return primes.back(); }
  const std::vector<uint64_t> &table() const { return primes; }
};
