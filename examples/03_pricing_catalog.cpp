// 03_pricing_catalog.cpp
//
// Loading and querying a pricing table.
//
// Loads the bundled pricing table, then shows how malformed rows are
// reported and skipped, how dated model names resolve to their family price,
// and what an unknown model costs.

#include <quotaguard/quotaguard.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace quotaguard;

int main() {
    std::cout << "=== QuotaGuard: Pricing Catalog Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. The bundled table.
    // ----------------------------------------------------------------
    PriceCatalog bundled;
    try {
        bundled = PriceCatalog::from_csv_file(
            std::string(QUOTAGUARD_SOURCE_DIR) + "/config/model_pricing.csv");
    } catch (const PricingLoadException& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "Bundled table has " << bundled.size() << " keys:\n";
    for (const auto& key : bundled.keys()) {
        const auto& e = bundled.entries().at(key);
        std::cout << "  " << std::left << std::setw(26) << key
                  << " in=" << e.input_rate << " out=" << e.output_rate << "\n";
    }
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 2. A table with broken rows.
    // ----------------------------------------------------------------
    std::istringstream csv(
        "model,version,input,cached_input,output\n"
        "gpt-4o,gpt-4o-2024-08-06,2.50,1.25,10.00\n"
        "gpt-4o-mini,gpt-4o-mini-2024-07-18,0.15,0.075,0.60\n"
        "o3,o3-2025-04-16,2.00,,8.00\n"
        "broken-model,v1,not-a-number,,1.0\n"
        "short-row,v1\n");

    CatalogLoadReport report;
    auto catalog = std::make_shared<const PriceCatalog>(
        PriceCatalog::from_csv(csv, "inline", Config{}.default_price, &report));

    std::cout << "Loaded " << report.rows_loaded << " rows into "
              << catalog->size() << " keys\n";
    for (const auto& row : report.skipped) {
        std::cout << "  skipped line " << row.line << " (" << row.model << "): "
                  << row.reason << "\n";
    }
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 3. Quotes.
    // ----------------------------------------------------------------
    CostCalculator calculator(catalog);
    std::cout << std::fixed << std::setprecision(6);
    for (const char* model : {"gpt-4o", "gpt-4o-2024-11-20", "gpt-4o-mini", "o3", "unknown-xl"}) {
        auto q = calculator.quote(1000, 500, model);
        std::cout << std::left << std::setw(20) << model
                  << " -> " << std::setw(12) << q.entry.model_key
                  << (q.matched ? "          " : " (default)")
                  << " $" << q.cost << " for 1000+500 tokens\n";
    }

    std::cout << "\nAllow-list derived from the catalog:\n";
    auto allow = ModelAllowList::from_catalog(*catalog, Config{});
    for (const auto& prefix : allow.prefixes()) {
        std::cout << "  " << prefix << "\n";
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
