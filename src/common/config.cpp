#include "common/config_t.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

void config_t::dump() const {
  std::cout << "# trials, inserts, deletes, initial_capacity, load_factor, growth_factor, tree_order, prime_table, seed\n"
            << trials << ", " << inserts << ", " << deletes << ", "
            << initial_capacity << ", " << load_factor << ", " << growth_factor << ", "
            << tree_order << ", " << (prime_table.empty() ? "<built-in>" : prime_table) << ", "
            << seed << std::endl;
}

namespace {

template <typename T>
void read_value(std::stringstream &ss, T &out, const std::string &key, int line_num) {
  if (!(ss >> out)) {
    throw std::runtime_error("Malformed value for '" + key + "' on line " + std::to_string(line_num));
  }
}

} // namespace

config_t load_config(const std::string &filename) {
  config_t config;
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open config file: " + filename);
  }

  std::string line;
  int line_num = 0;
  while (std::getline(file, line)) {
    line_num++;

    if (line.empty() || line[0] == '#')
      continue;

    std::stringstream ss(line);
    std::string key;
    if (!(ss >> key)) {
      continue; // whitespace only
    }

    if (key == "trials") {
      read_value(ss, config.trials, key, line_num);
    } else if (key == "inserts") {
      read_value(ss, config.inserts, key, line_num);
    } else if (key == "deletes") {
      read_value(ss, config.deletes, key, line_num);
    } else if (key == "initial_capacity") {
      read_value(ss, config.initial_capacity, key, line_num);
    } else if (key == "load_factor") {
      read_value(ss, config.load_factor, key, line_num);
    } else if (key == "growth_factor") {
      read_value(ss, config.growth_factor, key, line_num);
    } else if (key == "tree_order") {
      read_value(ss, config.tree_order, key, line_num);
    } else if (key == "prime_table") {
      read_value(ss, config.prime_table, key, line_num);
    } else if (key == "seed") {
      read_value(ss, config.seed, key, line_num);
    } else {
      throw std::runtime_error("Unknown config key '" + key + "' on line " + std::to_string(line_num));
    }

    std::string trailing;
    if (ss >> trailing) {
      throw std::runtime_error("Unexpected trailing text on line " + std::to_string(line_num));
    }
  }

  return config;
}
