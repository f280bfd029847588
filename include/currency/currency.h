#pragma once

#include <ostream>
#include <string>
#include <vector>

// Immutable amount of money in one ISO-4217 currency.
// Ordering and equality look at the code only, so a multiway tree keyed
// by Currency holds at most one entry per currency.
class Currency {
private:
  std::string code;
  double amount;

public:
  // throws std::invalid_argument if code is not in the ISO-4217 registry
  explicit Currency(const std::string &code, double amount = 0.0);

  static bool is_valid_code(const std::string &code);
  static const std::vector<std::string> &registry(); // sorted ascending

  const std::string &get_code() const { return code; }
  double get_amount() const { return amount; }

  bool operator<(const Currency &other) const { return code < other.code; }
  bool operator==(const Currency &other) const { return code == other.code; }
  bool operator!=(const Currency &other) const { return code != other.code; }
};

std::ostream &operator<<(std::ostream &out, const Currency &currency);
