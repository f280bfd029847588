// Description: This file declares a struct for storing per-execution configuration information.
#pragma once

#include <iostream>
#include <string>

// store all of our driver configuration parameters

struct config_t {

    // The number of independent rounds the collision benchmark runs
    int trials;

    // The number of random inserts per round
    int inserts;

    // The number of random deletes per round
    int deletes;

    // Capacity a fresh hash map starts with (rounded up to a prime)
    int initial_capacity;

    // Live entries / capacity ratio that triggers a resize
    double load_factor;

    // The new capacity is the next prime at least growth_factor * capacity
    double growth_factor;

    // Maximum number of children of a multiway tree node
    int tree_order;

    // Binary prime table to load; empty means the built-in table
    std::string prime_table;

    // Seed for the random workload
    unsigned int seed;

    // simple constructor
    config_t()
      : trials(10000), inserts(70), deletes(30), initial_capacity(17),
        load_factor(0.75), growth_factor(2.0), tree_order(4), seed(2400) { }

    // Print the values of every field
    void dump() const;
};

// format of the config file, one setting per line:
// key value
config_t load_config(const std::string &filename);
