#pragma once

#include "quotaguard/config.hpp"
#include <string>
#include <vector>

namespace quotaguard {

class PriceCatalog;

// Ordered list of model-family prefixes a request's model must start with
class ModelAllowList {
public:
    ModelAllowList() = default;
    explicit ModelAllowList(std::vector<std::string> prefixes);

    // Catalog keys when config.derive_prefixes_from_catalog is set and the
    // catalog is non-empty, otherwise config.fallback_model_prefixes.
    static ModelAllowList from_catalog(const PriceCatalog& catalog, const Config& config);

    bool is_allowed(const std::string& model) const;

    const std::vector<std::string>& prefixes() const noexcept;
    bool empty() const noexcept;

private:
    std::vector<std::string> prefixes_;
};

} // namespace quotaguard
