#include "quotaguard/allow_list.hpp"
#include "quotaguard/price_catalog.hpp"

#include <algorithm>

namespace quotaguard {

ModelAllowList::ModelAllowList(std::vector<std::string> prefixes) {
    // An empty prefix would admit every model, including the empty one
    for (auto& p : prefixes) {
        if (p.empty()) continue;
        if (std::find(prefixes_.begin(), prefixes_.end(), p) != prefixes_.end()) continue;
        prefixes_.push_back(std::move(p));
    }
}

ModelAllowList ModelAllowList::from_catalog(const PriceCatalog& catalog, const Config& config) {
    if (config.derive_prefixes_from_catalog && !catalog.empty()) {
        return ModelAllowList(catalog.keys());
    }
    return ModelAllowList(config.fallback_model_prefixes);
}

bool ModelAllowList::is_allowed(const std::string& model) const {
    return std::any_of(prefixes_.begin(), prefixes_.end(),
        [&model](const std::string& prefix) {
            return model.compare(0, prefix.size(), prefix) == 0;
        });
}

const std::vector<std::string>& ModelAllowList::prefixes() const noexcept { return prefixes_; }
bool ModelAllowList::empty() const noexcept { return prefixes_.empty(); }

} // namespace quotaguard
