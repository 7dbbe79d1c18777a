#pragma once

/// @file catalog_provider.h
/// @brief Interface for anything that can produce a pricing catalog

#include <string>

#include <absl/status/statusor.h>

#include "pricing/catalog.h"

namespace tokenledger::pricing {

/// Base catalog provider interface
///
/// The fetcher evaluates providers in order and keeps the first catalog that
/// loads. Each call to Load() does the full work again; providers do not cache.
class CatalogProvider {
public:
    virtual ~CatalogProvider() = default;

    /// Produce a freshly loaded catalog
    virtual absl::StatusOr<PricingCatalog> Load() = 0;

    /// Short name used in log messages
    virtual std::string Name() const = 0;
};

}  // namespace tokenledger::pricing
