#pragma once

#include "quotaguard/types.hpp"
#include <string>
#include <vector>

namespace quotaguard {

struct Config {
    // Maximum cumulative spend before requests are refused.
    // Zero or negative means every request is refused.
    Cost cost_ceiling = 2.0;

    // CSV with columns model,version,input,cached_input,output
    std::string pricing_path = "config/model_pricing.csv";

    // Allowed model-family prefixes when the catalog is empty or
    // derive_prefixes_from_catalog is false
    std::vector<std::string> fallback_model_prefixes = {
        "gpt-4o", "gpt-4-1106-preview", "gpt-4.1", "o3", "o4", "gpt-3.5"
    };

    // Use the loaded catalog's keys as the allow-list
    bool derive_prefixes_from_catalog = true;

    // Price used for models the catalog does not know
    PriceEntry default_price{"default", "", 30.0, 0.0, 60.0};

    // Chat framing overhead added on top of the message text
    TokenCount tokens_per_message = 3;
    TokenCount reply_priming_tokens = 3;
};

} // namespace quotaguard
