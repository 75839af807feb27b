#pragma once

#include <vector>
#include "gateway.hpp"
#include "status.hpp"

namespace gridsync {

/**
 * Ordered set of known gateways plus the currently selected one.
 *
 * Pure in-memory directory; owned by the UI thread.
 */
class GatewayRegistry {
public:
    // Appends and selects gateway. Returns false if it was already registered.
    bool add(const GatewayPtr& gateway);

    Status select(const GatewayPtr& gateway);

    // Selected gateway, or nullptr if the registry is empty
    GatewayPtr current() const { return current_; }

    bool contains(const GatewayPtr& gateway) const;
    size_t size() const { return gateways_.size(); }
    bool empty() const { return gateways_.empty(); }
    const std::vector<GatewayPtr>& gateways() const { return gateways_; }

private:
    std::vector<GatewayPtr> gateways_;
    GatewayPtr current_;
};

} // namespace gridsync
