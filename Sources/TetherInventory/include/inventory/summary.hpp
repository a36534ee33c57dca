#pragma once

#include "models.hpp"
#include <tether/observable_collection.hpp>
#include <string>
#include <vector>

namespace tether::inventory {

// ============================================================================
// stock_summary - what is left of every listed product after its orders
// ============================================================================

class stock_summary {
public:
    explicit stock_summary(observable_collection<Product>& products);

    stock_summary(const stock_summary&) = delete;
    stock_summary& operator=(const stock_summary&) = delete;

    /// quantity minus the summed quantity of the product's stored orders
    int64_t left_of(const view_model& product);

    /// "Left of <name>: <n>", or "Need to supply of <name>: <n>" when short
    std::string line_for(const view_model& product);

    /// One line per product, in collection order
    std::vector<std::string> lines();

private:
    observable_collection<Product>& products_;
    notification_token subscription_;
};

} // namespace tether::inventory
