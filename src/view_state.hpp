#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "app_info.hpp"
#include "gateway.hpp"
#include "gateway_registry.hpp"
#include "preferences.hpp"
#include "status.hpp"

namespace gridsync {

/**
 * Panels the central area can show for a gateway.
 */
enum class ViewKind {
    Folders,
    History,
    Quota
};

const char* view_kind_name(ViewKind kind);

/**
 * Shape of the invite control, fixed at startup by the feature flags.
 */
enum class InviteControl {
    Menu,       // "Invites" button with Enter/Create Invite Code entries
    EnterCode   // single "Enter Code" action
};

std::optional<InviteControl> resolve_invite_control(const FeatureFlags& features);

/**
 * Which toolbar controls are usable for a gateway.
 *
 * Derived from the gateway snapshot on every recomputation; never stored.
 */
struct EnablementState {
    bool restricted = false;  // quota exhausted on a ZKAP-authorized grid

    bool add_folder = true;
    bool invites = true;      // only meaningful when invite_control is set
    bool history = true;
    bool recovery = true;
    bool folders_panel = true;
    bool quota_panel = true;
    bool grid_selector = true;

    std::optional<InviteControl> invite_control;
    bool grid_selector_visible = true;
    bool new_grid_shortcut = true;

    // Panel that must be shown regardless of the user's last choice
    std::optional<ViewKind> forced_view;
};

/**
 * Pure enablement rule.
 *
 * A grid that requires ZKAPs and has none left only offers its quota
 * panel; with no folders yet, that panel is forced to the front.
 */
EnablementState compute_enablement(const Gateway& gateway, const FeatureFlags& features = FeatureFlags());

/**
 * Everything the window needs to render for the selected gateway.
 */
struct ViewState {
    GatewayPtr gateway;
    ViewKind active_view = ViewKind::Folders;
    EnablementState enablement;
    std::string window_title;
};

/**
 * View State Coordinator
 *
 * Owns the per-gateway panel bindings and last-active panel, and turns
 * gateway status into a ViewState for the presentation layer:
 * - registering a gateway binds its Folders/History/Quota panels
 * - selecting a gateway restores that gateway's own last panel
 * - status changes (quota, folders) recompute enablement via refresh()
 *
 * Single-threaded; every call is synchronous and does no I/O.
 */
class ViewStateCoordinator {
public:
    ViewStateCoordinator(GatewayRegistry& registry, const FeatureFlags& features,
                         std::string app_name = APP_NAME);

    // Adds gateway to the registry (selecting it) and binds its panels. No-op if already bound.
    bool register_gateway(const GatewayPtr& gateway);

    // Registers every unseen gateway in order, then refreshes if gateways is non-empty
    void populate(const std::vector<GatewayPtr>& gateways);

    Status select_view(ViewKind kind);

    Status on_gateway_selected(const GatewayPtr& gateway);

    // Recompute after the current gateway's quota or folders changed
    ViewState refresh();

    // Snapshot of the current gateway's state; gateway is null if nothing is registered
    ViewState state() const;

    std::optional<ViewKind> active_view(const GatewayPtr& gateway) const;
    bool has_panel(const GatewayPtr& gateway, ViewKind kind) const;
    const std::string& window_title() const { return window_title_; }
    const FeatureFlags& features() const { return features_; }

private:
    struct PanelBinding {
        std::set<ViewKind> panels;
        ViewKind active = ViewKind::Folders;
    };

    void apply_forced_view(const GatewayPtr& gateway, const EnablementState& enablement);
    void update_window_title(const GatewayPtr& gateway);

    GatewayRegistry& registry_;
    FeatureFlags features_;
    std::string app_name_;
    std::string window_title_;
    std::map<GatewayPtr, PanelBinding> bindings_;
};

} // namespace gridsync
