#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <ctime>

namespace gridsync {

enum class FolderStatus {
    Unknown,   // nothing reported yet
    Loading,
    Syncing,
    Synced,
    Error
};

/**
 * Snapshot of one magic folder as reported by the sync engine.
 */
struct Folder {
    std::string name;
    FolderStatus status = FolderStatus::Unknown;
    std::optional<std::time_t> last_sync_time;

    // Still being loaded: no status reported and never synced.
    bool is_loading() const {
        return (status == FolderStatus::Unknown || status == FolderStatus::Loading) &&
               !last_sync_time.has_value();
    }
};

/**
 * Snapshot of a gateway (grid connection).
 *
 * Gateways are created and updated by the gateway subsystem and shared
 * with the coordinator as std::shared_ptr<Gateway>; two gateways are the
 * same gateway only if they are the same object.
 */
struct Gateway {
    std::string name;
    std::string nodedir;
    bool zkap_auth_required = false;
    int zkaps_remaining = 0;
    std::vector<Folder> magic_folders;

    // Quota is only enforced when the grid asks for ZKAP authorization.
    bool quota_exhausted() const {
        return zkap_auth_required && zkaps_remaining == 0;
    }
};

using GatewayPtr = std::shared_ptr<Gateway>;

} // namespace gridsync
