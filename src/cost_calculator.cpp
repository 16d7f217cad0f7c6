#include "quotaguard/cost_calculator.hpp"
#include "quotaguard/exceptions.hpp"

#include <cmath>

namespace quotaguard {

Cost compute_cost(TokenCount prompt_tokens,
                  TokenCount completion_tokens,
                  const PriceEntry& entry) noexcept
{
    Cost prompt_cost = static_cast<double>(prompt_tokens) * entry.input_rate
                       / TOKENS_PER_PRICING_UNIT;
    Cost completion_cost = static_cast<double>(completion_tokens) * entry.output_rate
                           / TOKENS_PER_PRICING_UNIT;
    return prompt_cost + completion_cost;
}

Cost round_cost(Cost cost) noexcept {
    return std::trunc(cost * 1e6) / 1e6;
}

CostCalculator::CostCalculator(std::shared_ptr<const PriceCatalog> catalog)
    : catalog_(std::move(catalog))
{
    if (!catalog_) {
        throw InvalidConfigException("CostCalculator requires a price catalog");
    }
}

Cost CostCalculator::calculate_cost(TokenCount prompt_tokens,
                                    TokenCount completion_tokens,
                                    const std::string& model) const
{
    return quote(prompt_tokens, completion_tokens, model).cost;
}

CostQuote CostCalculator::quote(TokenCount prompt_tokens,
                                TokenCount completion_tokens,
                                const std::string& model) const
{
    auto resolution = catalog_->resolve(model);
    CostQuote q;
    q.cost = compute_cost(prompt_tokens, completion_tokens, resolution.entry);
    q.entry = std::move(resolution.entry);
    q.matched = resolution.matched;
    return q;
}

const PriceCatalog& CostCalculator::catalog() const noexcept { return *catalog_; }

} // namespace quotaguard
