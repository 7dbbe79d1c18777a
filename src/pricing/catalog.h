#pragma once

/// @file catalog.h
/// @brief Ordered mapping from vendor model name to pricing entry

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pricing/types.h"

namespace tokenledger::pricing {

/// @brief Model-name keyed pricing catalog
///
/// Keys are stored exactly as published and are never normalized. Iteration
/// follows insertion order, which is the order keys appeared in the source
/// document; the substring fallback in the resolver depends on it.
class PricingCatalog {
public:
    using value_type = std::pair<std::string, ModelPricingEntry>;
    using const_iterator = std::vector<value_type>::const_iterator;

    PricingCatalog() = default;

    /// @brief Add an entry, or replace the entry of an existing key in place
    void Insert(std::string model_name, ModelPricingEntry entry);

    /// @brief Exact, case-sensitive lookup
    /// @return Pointer into the catalog, or nullptr when the key is absent
    const ModelPricingEntry* Find(const std::string& model_name) const;

    bool Contains(const std::string& model_name) const {
        return index_.count(model_name) > 0;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<value_type> entries_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace tokenledger::pricing
