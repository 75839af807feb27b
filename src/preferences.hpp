#pragma once

#include <string>
#include <mutex>
#include "status.hpp"

namespace gridsync {

/**
 * Preference Store
 *
 * Durable (section, option) -> value string pairs kept in an INI-style
 * file (GKeyFile syntax):
 *
 *   [features]
 *   invites=false
 *
 * Every set() rewrites the file before returning and every get() reads it
 * again, so a value written by one caller is visible to the next get() in
 * this or any later process. Defaults are the caller's concern: a missing
 * pair is reported as Status::NotFound.
 *
 * The default location is $XDG_CONFIG_HOME/gridsync/preferences.ini.
 */
class PreferenceStore {
public:
    PreferenceStore();
    explicit PreferenceStore(std::string path);

    Status get(const std::string& section, const std::string& option, std::string* value) const;
    Status set(const std::string& section, const std::string& option, const std::string& value);

    // "true"/"false" (any case) parsed; anything else, or a missing pair, yields default_value
    bool get_bool(const std::string& section, const std::string& option, bool default_value) const;

    const std::string& path() const { return path_; }

    static std::string default_path();

private:
    std::string path_;
    mutable std::mutex mutex_;
};

/**
 * Feature switches read from the [features] section at startup.
 * Each one is on unless the file says "false".
 */
struct FeatureFlags {
    bool grid_invites = true;
    bool invites = true;
    bool multiple_grids = true;
};

FeatureFlags load_feature_flags(const PreferenceStore& store);

} // namespace gridsync
