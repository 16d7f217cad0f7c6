#pragma once

#include "quotaguard/types.hpp"
#include "quotaguard/config.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quotaguard {

class Monitor;

// A data row that was dropped while building the catalog
struct SkippedRow {
    std::size_t line{0};
    std::string model;
    std::string reason;
};

// Outcome of one catalog build
struct CatalogLoadReport {
    std::size_t records{0};       // including the header
    std::size_t rows_loaded{0};
    std::vector<SkippedRow> skipped;
};

// Result of a price lookup
struct PriceResolution {
    PriceEntry entry;
    bool matched{false};
};

// Per-model pricing, immutable once built.
//
// Lookup tries an exact key first, then any key that is a prefix of the
// requested model ("gpt-4o-2024-08-06" -> "gpt-4o"). When several keys are
// prefixes of the same model, which one wins is unspecified.
class PriceCatalog {
public:
    explicit PriceCatalog(PriceEntry default_entry = Config{}.default_price);

    // Build from CSV text. The first record is a header. Throws
    // PricingLoadException on read errors or fewer than two records.
    static PriceCatalog from_csv(std::istream& in,
                                 const std::string& source_name,
                                 PriceEntry default_entry = Config{}.default_price,
                                 CatalogLoadReport* report = nullptr);

    static PriceCatalog from_csv_file(const std::string& path,
                                      PriceEntry default_entry = Config{}.default_price,
                                      CatalogLoadReport* report = nullptr);

    // Adds the entry under its model key, and under its version when the
    // version is non-empty and differs from the key.
    void insert(const PriceEntry& entry);

    PriceResolution resolve(const std::string& model) const;

    bool contains(const std::string& key) const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

    // Sorted catalog keys
    std::vector<std::string> keys() const;
    const PricingTable& entries() const noexcept;
    const PriceEntry& default_entry() const noexcept;

private:
    PricingTable entries_;
    PriceEntry default_entry_;
};

// Startup helper: loads config.pricing_path, reporting every skipped row
// to the monitor. On failure the error is reported and an empty catalog is
// returned, so every model resolves to the default price.
std::shared_ptr<const PriceCatalog> load_price_catalog(
    const Config& config,
    const std::shared_ptr<Monitor>& monitor = nullptr);

// Splits one CSV line into fields. Handles quoted fields and "" escapes.
std::vector<std::string> split_csv_line(const std::string& line);

// Parses a non-negative price. The empty string parses as zero.
std::optional<double> parse_rate(const std::string& text);

} // namespace quotaguard
