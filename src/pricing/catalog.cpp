#include "pricing/catalog.h"

namespace tokenledger::pricing {

void PricingCatalog::Insert(std::string model_name, ModelPricingEntry entry) {
    auto it = index_.find(model_name);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(entry);
        return;
    }
    index_.emplace(model_name, entries_.size());
    entries_.emplace_back(std::move(model_name), std::move(entry));
}

const ModelPricingEntry* PricingCatalog::Find(const std::string& model_name) const {
    auto it = index_.find(model_name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

}  // namespace tokenledger::pricing
