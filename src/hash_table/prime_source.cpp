#include "hash_table/prime_source.h"
#include "common/errors.h"
#include "common/utils.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>

PrimeSource::PrimeSource(std::vector<uint64_t> table) : primes{std::move(table)} {
  if (primes.empty()) {
    throw std::invalid_argument("Prime table is empty");
  }
  if (primes.front() < 2) {
    throw std::invalid_argument("Prime table starts below 2: " + std::to_string(primes.front()));
  }
  for (size_t i = 1; i < primes.size(); ++i) {
    if (primes[i] <= primes[i - 1]) {
      throw std::invalid_argument("Prime table is not strictly increasing at position " + std::to_string(i));
    }
  }
}

PrimeSource PrimeSource::from_file(const std::string &filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file.is_open()) {
    int err = errno;
    log_error(("Could not open prime table " + filename).c_str(), err);
    throw std::runtime_error("Could not open prime table: " + filename);
  }

  std::vector<uint64_t> table;
  unsigned char record[4];
  while (file.read(reinterpret_cast<char *>(record), sizeof(record))) {
    uint32_t value = static_cast<uint32_t>(record[0])
                   | static_cast<uint32_t>(record[1]) << 8
                   | static_cast<uint32_t>(record[2]) << 16
                   | static_cast<uint32_t>(record[3]) << 24;
    table.push_back(value);
  }

  // read() stopped part way through a record
  if (file.gcount() != 0) {
    throw std::runtime_error("Truncated record at the end of prime table: " + filename);
  }

  return PrimeSource(std::move(table));
}

void PrimeSource::write_file(const std::string &filename) const {
  if (largest() > std::numeric_limits<uint32_t>::max()) {
    throw std::out_of_range("Prime table does not fit 32-bit records");
  }

  std::ofstream file(filename, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    int err = errno;
    log_error(("Could not create prime table " + filename).c_str(), err);
    throw std::runtime_error("Could not create prime table: " + filename);
  }

  for (uint64_t p : primes) {
    unsigned char record[4] = {
      static_cast<unsigned char>(p & 0xFF),
      static_cast<unsigned char>((p >> 8) & 0xFF),
      static_cast<unsigned char>((p >> 16) & 0xFF),
      static_cast<unsigned char>((p >> 24) & 0xFF)
    };
    file.write(reinterpret_cast<const char *>(record), sizeof(record));
  }

  if (!file) {
    throw std::runtime_error("Failed writing prime table: " + filename);
  }
}

PrimeSource PrimeSource::sieve(uint64_t low, uint64_t high) {
  low = std::max<uint64_t>(low, 2);
  if (high < low) {
    throw std::invalid_argument("Empty sieve range [" + std::to_string(low) + ", " + std::to_string(high) + "]");
  }

  // base primes up to sqrt(high) with a simple sieve
  uint64_t limit = static_cast<uint64_t>(std::sqrt(static_cast<double>(high))) + 1;
  std::vector<bool> composite(limit + 1, false);
  std::vector<uint64_t> base;
  for (uint64_t i = 2; i <= limit; ++i) {
    if (composite[i])
      continue;
    base.push_back(i);
    for (uint64_t j = i * i; j <= limit; j += i) {
      composite[j] = true;
    }
  }

  // cross out multiples of every base prime inside [low, high]
  std::vector<bool> marked(high - low + 1, false);
  for (uint64_t p : base) {
    uint64_t first = std::max(p * p, ((low + p - 1) / p) * p);
    for (uint64_t j = first; j <= high; j += p) {
      marked[j - low] = true;
    }
  }

  std::vector<uint64_t> table;
  for (uint64_t i = low; i <= high; ++i) {
    if (!marked[i - low]) {
      table.push_back(i);
    }
  }

  if (table.empty()) {
    throw std::invalid_argument("No primes in [" + std::to_string(low) + ", " + std::to_string(high) + "]");
  }
  return PrimeSource(std::move(table));
}

std::shared_ptr<const PrimeSource> PrimeSource::default_source() {
  static const std::shared_ptr<const PrimeSource> source =
      std::make_shared<const PrimeSource>(PrimeSource::sieve(2, (1u << 22) - 1));
  return source;
}

uint64_t PrimeSource::next_prime_at_least(uint64_t n) const {
  auto it = std::lower_bound(primes.begin(), primes.end(), n);
  if (it == primes.end()) {
    throw ExhaustedPrimeTable("No prime >= " + std::to_string(n) +
                              " in table (largest is " + std::to_string(largest()) + ")");
  }
  return *it;
}

uint64_t PrimeSource::previous_prime_below(uint64_t n) const {
  auto it = std::lower_bound(primes.begin(), primes.end(), n);
  if (it == primes.begin()) {
    throw ExhaustedPrimeTable("No prime < " + std::to_string(n) +
                              " in table (smallest is " + std::to_string(primes.front()) + ")");
  }
  return *std::prev(it);
}
