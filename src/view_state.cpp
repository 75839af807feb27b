#include "view_state.hpp"
#include "logger.hpp"
#include <utility>

namespace gridsync {

const char* view_kind_name(ViewKind kind) {
    switch (kind) {
        case ViewKind::Folders: return "folders";
        case ViewKind::History: return "history";
        case ViewKind::Quota:   return "quota";
    }
    return "unknown";
}

std::optional<InviteControl> resolve_invite_control(const FeatureFlags& features) {
    if (features.grid_invites) {
        return InviteControl::Menu;
    }
    if (features.invites) {
        return InviteControl::EnterCode;
    }
    return std::nullopt;
}

EnablementState compute_enablement(const Gateway& gateway, const FeatureFlags& features) {
    EnablementState state;
    state.invite_control = resolve_invite_control(features);
    state.grid_selector_visible = features.multiple_grids;
    state.new_grid_shortcut = features.multiple_grids;

    const bool enabled = !gateway.quota_exhausted();
    state.restricted = !enabled;
    state.add_folder = enabled;
    state.invites = enabled && state.invite_control.has_value();
    state.history = enabled;
    state.recovery = enabled;
    state.folders_panel = enabled;
    state.grid_selector = enabled;
    state.quota_panel = true;

    // New users with no quota land on the purchase screen, not an empty folder list
    if (state.restricted && gateway.magic_folders.empty()) {
        state.forced_view = ViewKind::Quota;
    }
    return state;
}

ViewStateCoordinator::ViewStateCoordinator(GatewayRegistry& registry, const FeatureFlags& features,
                                           std::string app_name)
    : registry_(registry),
      features_(features),
      app_name_(std::move(app_name)),
      window_title_(app_name_) {}

bool ViewStateCoordinator::register_gateway(const GatewayPtr& gateway) {
    if (!gateway || bindings_.count(gateway)) {
        return false;
    }
    registry_.add(gateway);

    PanelBinding binding;
    binding.panels = {ViewKind::Folders, ViewKind::History, ViewKind::Quota};
    bindings_.emplace(gateway, std::move(binding));
    apply_forced_view(gateway, compute_enablement(*gateway, features_));
    update_window_title(gateway);

    Logger::info("[Coordinator] Registered gateway " + gateway->name);
    return true;
}

void ViewStateCoordinator::populate(const std::vector<GatewayPtr>& gateways) {
    for (const auto& gateway : gateways) {
        register_gateway(gateway);
    }
    if (!gateways.empty()) {
        refresh();
    }
}

Status ViewStateCoordinator::select_view(ViewKind kind) {
    GatewayPtr gateway = registry_.current();
    if (!gateway) {
        Logger::debug(std::string("[Coordinator] No gateway selected for ") + view_kind_name(kind) + " view");
        return Status::UnknownGateway;
    }
    auto it = bindings_.find(gateway);
    if (it == bindings_.end() || !it->second.panels.count(kind)) {
        Logger::warn(std::string("[Coordinator] No ") + view_kind_name(kind) +
                     " panel registered for " + gateway->name);
        return Status::NoSuchView;
    }
    it->second.active = kind;
    Logger::debug(std::string("[Coordinator] ") + gateway->name + " -> " + view_kind_name(kind));

    // Switching panels re-evaluates the quota rule, as any status change does
    refresh();
    return Status::Ok;
}

Status ViewStateCoordinator::on_gateway_selected(const GatewayPtr& gateway) {
    Status status = registry_.select(gateway);
    if (status != Status::Ok) {
        return status;
    }
    refresh();
    update_window_title(gateway);
    if (!bindings_.count(gateway)) {
        Logger::warn("[Coordinator] Selected gateway " + gateway->name + " has no panels");
        return Status::NoSuchView;
    }
    return Status::Ok;
}

ViewState ViewStateCoordinator::refresh() {
    GatewayPtr gateway = registry_.current();
    if (gateway) {
        EnablementState enablement = compute_enablement(*gateway, features_);
        apply_forced_view(gateway, enablement);
        if (enablement.restricted) {
            Logger::debug("[Coordinator] " + gateway->name + " has no ZKAPs left; controls restricted");
        }
    }
    return state();
}

ViewState ViewStateCoordinator::state() const {
    ViewState state;
    state.window_title = window_title_;
    state.gateway = registry_.current();
    if (!state.gateway) {
        return state;
    }
    state.enablement = compute_enablement(*state.gateway, features_);
    auto it = bindings_.find(state.gateway);
    if (it != bindings_.end()) {
        state.active_view = it->second.active;
    }
    return state;
}

std::optional<ViewKind> ViewStateCoordinator::active_view(const GatewayPtr& gateway) const {
    auto it = bindings_.find(gateway);
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second.active;
}

bool ViewStateCoordinator::has_panel(const GatewayPtr& gateway, ViewKind kind) const {
    auto it = bindings_.find(gateway);
    return it != bindings_.end() && it->second.panels.count(kind) > 0;
}

void ViewStateCoordinator::apply_forced_view(const GatewayPtr& gateway, const EnablementState& enablement) {
    if (!enablement.forced_view) {
        return;
    }
    auto it = bindings_.find(gateway);
    if (it == bindings_.end() || !it->second.panels.count(*enablement.forced_view)) {
        return;
    }
    it->second.active = *enablement.forced_view;
}

void ViewStateCoordinator::update_window_title(const GatewayPtr& gateway) {
    if (features_.multiple_grids && registry_.size() > 1) {
        window_title_ = app_name_ + " - " + gateway->name;
    } else {
        window_title_ = app_name_;
    }
}

} // namespace gridsync
