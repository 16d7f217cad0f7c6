#pragma once

#include "quotaguard/types.hpp"
#include "quotaguard/price_catalog.hpp"

#include <memory>
#include <string>

namespace quotaguard {

// prompt * input_rate / 1e6 + completion * output_rate / 1e6
Cost compute_cost(TokenCount prompt_tokens,
                  TokenCount completion_tokens,
                  const PriceEntry& entry) noexcept;

// Truncates to 6 decimal places, for caller-visible amounts only
Cost round_cost(Cost cost) noexcept;

struct CostQuote {
    PriceEntry entry;
    bool matched{false};
    Cost cost{0.0};
};

// Resolves a model's price through the catalog and prices token counts.
// Stateless apart from the shared read-only catalog; safe to call from any
// number of threads.
class CostCalculator {
public:
    explicit CostCalculator(std::shared_ptr<const PriceCatalog> catalog);

    Cost calculate_cost(TokenCount prompt_tokens,
                        TokenCount completion_tokens,
                        const std::string& model) const;

    CostQuote quote(TokenCount prompt_tokens,
                    TokenCount completion_tokens,
                    const std::string& model) const;

    const PriceCatalog& catalog() const noexcept;

private:
    std::shared_ptr<const PriceCatalog> catalog_;
};

} // namespace quotaguard
