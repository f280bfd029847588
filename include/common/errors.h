#pragma once

#include <stdexcept>
#include <string>

// Thrown when a hash map is asked to start with a capacity it can not use
struct InvalidCapacity : public std::invalid_argument {
  explicit InvalidCapacity(long long requested)
    : std::invalid_argument("Invalid hash table capacity: " + std::to_string(requested)) {}
};

// Thrown when the prime table has no prime that satisfies the request
struct ExhaustedPrimeTable : public std::out_of_range {
  explicit ExhaustedPrimeTable(const std::string& what) : std::out_of_range(what) {}
};

// Thrown by tree insertion when the key is already present
struct DuplicateKey : public std::invalid_argument {
  explicit DuplicateKey(const std::string& what) : std::invalid_argument(what) {}
};
