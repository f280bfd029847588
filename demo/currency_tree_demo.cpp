#include "tree/multi_way_search_tree.h"
#include "currency/currency.h"
#include "common/utils.h"
#include "common/config_t.h"

#include <iomanip>

void print_listing(const MultiWaySearchTree<Currency, double>& tree) {
  std::cout << "In-order listing (" << tree.size() << " entries, height " << tree.height() << "):\n";
  tree.for_each_inorder([](const Currency& currency, double rate) {
    std::cout << "  " << currency << "  rate " << std::fixed << std::setprecision(4) << rate << "\n";
  });
  std::cout << "Node layout:\n";
  tree.print_structure(std::cout);
  std::cout << std::endl;
}

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config_file]\n";
    return 1;
  }

  try {
    config_t config = argc == 2 ? load_config(argv[1]) : config_t();
    config.dump();
    if (config.tree_order < 3) {
      throw std::invalid_argument("tree_order must be at least 3, got " + std::to_string(config.tree_order));
    }
    MultiWaySearchTree<Currency, double> tree(static_cast<size_t>(config.tree_order));

    // amount held, exchange rate to EUR
    const std::vector<std::pair<Currency, double>> holdings = {
      {Currency("USD", 120.50), 0.9210}, {Currency("EUR", 75.00), 1.0000},
      {Currency("JPY", 15000), 0.0062}, {Currency("GBP", 40.25), 1.1650},
      {Currency("CHF", 90.00), 1.0420}, {Currency("CAD", 33.10), 0.6780},
      {Currency("AUD", 12.00), 0.6090}, {Currency("SEK", 500.00), 0.0870},
      {Currency("NOK", 250.00), 0.0860}, {Currency("DKK", 310.00), 0.1340},
      {Currency("PLN", 64.00), 0.2310}, {Currency("CZK", 880.00), 0.0400}
    };

    for (const auto& holding : holdings) {
      tree.insert(holding.first, holding.second);
    }
    log_info("Demo", "Inserted " + std::to_string(tree.size()) + " currencies into an order-" +
                     std::to_string(tree.order()) + " tree");
    print_listing(tree);

    // same code, different amount: rejected as a duplicate
    try {
      tree.insert(Currency("USD", 1.00), 0.9);
    } catch (const DuplicateKey& e) {
      log_info("Demo", std::string("Rejected: ") + e.what());
    }

    std::optional<double> rate = tree.search(Currency("GBP"));
    log_info("Demo", "GBP rate: " + (rate ? std::to_string(*rate) : std::string("not found")));

    for (const char* code : {"EUR", "SEK", "USD", "XAU"}) {
      std::optional<double> removed = tree.remove(Currency(code));
      log_info("Demo", std::string("Remove ") + code + ": " + (removed ? "removed" : "not found"));
    }
    print_listing(tree);

    if (!tree.check_invariants()) {
      throw std::logic_error("tree invariants violated");
    }

  } catch (const std::exception& e) {
      std::cerr << "[Fatal Error] " << e.what() << std::endl;
      return 1;
  }

  return 0;
}
