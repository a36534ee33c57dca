#include "inventory/summary.hpp"
#include <tether/log.hpp>

namespace tether::inventory {

stock_summary::stock_summary(observable_collection<Product>& products)
    : products_(products) {
    // Any stored change may move a total, so every listed row re-renders
    subscription_ = products_.repo().subscribe([this](const change_notification&) {
        products_.notify_modified_all();
    });
}

int64_t stock_summary::left_of(const view_model& product) {
    auto quantity = product.get_as<int64_t>("quantity");
    if (product.is_pending()) {
        return quantity;
    }

    const auto& orders = entity_traits<Order>::schema();
    int64_t ordered = 0;
    products_.repo().read([&](database& db) {
        auto rows = db.query("SELECT COALESCE(SUM(quantity), 0) AS total FROM " + orders.table_name +
                             " WHERE product_id = ?", {*product.key()});
        if (!rows.empty()) {
            ordered = detail::as_int64(rows.front().at("total"));
        }
    });
    return quantity - ordered;
}

std::string stock_summary::line_for(const view_model& product) {
    auto left = left_of(product);
    auto name = product.get_as<std::string>("name");
    if (left < 0) {
        return "Need to supply of " + name + ": " + std::to_string(-left);
    }
    return "Left of " + name + ": " + std::to_string(left);
}

std::vector<std::string> stock_summary::lines() {
    std::vector<std::string> result;
    result.reserve(products_.size());
    for (const auto& product : products_) {
        result.push_back(line_for(*product));
    }
    LOG_DEBUG("summary", "Summarized %zu products", result.size());
    return result;
}

} // namespace tether::inventory
