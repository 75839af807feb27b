#include "gateway_registry.hpp"
#include "logger.hpp"
#include <algorithm>

namespace gridsync {

bool GatewayRegistry::add(const GatewayPtr& gateway) {
    if (!gateway || contains(gateway)) {
        return false;
    }
    gateways_.push_back(gateway);
    current_ = gateway;
    Logger::debug("[Registry] Added gateway " + gateway->name +
                  " (" + std::to_string(gateways_.size()) + " total)");
    return true;
}

Status GatewayRegistry::select(const GatewayPtr& gateway) {
    if (!contains(gateway)) {
        Logger::debug("[Registry] Ignoring selection of unregistered gateway");
        return Status::UnknownGateway;
    }
    current_ = gateway;
    Logger::debug("[Registry] Selected " + gateway->name);
    return Status::Ok;
}

bool GatewayRegistry::contains(const GatewayPtr& gateway) const {
    if (!gateway) return false;
    return std::find(gateways_.begin(), gateways_.end(), gateway) != gateways_.end();
}

} // namespace gridsync
