#include "preferences.hpp"
#include "app_info.hpp"
#include "logger.hpp"
#include <glib.h>
#include <utility>

namespace gridsync {

namespace {

// Loads path into key_file. A missing file leaves key_file empty and is not an error.
Status load_key_file(GKeyFile* key_file, const std::string& path, bool* exists) {
    GError* error = nullptr;
    *exists = true;
    if (g_key_file_load_from_file(key_file, path.c_str(), G_KEY_FILE_KEEP_COMMENTS, &error)) {
        return Status::Ok;
    }
    if (g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT)) {
        *exists = false;
        g_error_free(error);
        return Status::Ok;
    }
    Logger::error("[Preferences] Failed to read " + path + ": " + error->message);
    g_error_free(error);
    return Status::IoError;
}

// Mirrors GKeyFile's own group rules: non-empty, no brackets, no control characters.
bool is_valid_section(const std::string& name) {
    if (name.empty()) return false;
    for (unsigned char c : name) {
        if (c == '[' || c == ']' || g_ascii_iscntrl(c)) return false;
    }
    return true;
}

// GKeyFile keys: non-empty, no '=' or brackets, no control characters,
// no leading or trailing space.
bool is_valid_option(const std::string& name) {
    if (name.empty() || name.front() == ' ' || name.back() == ' ') return false;
    for (unsigned char c : name) {
        if (c == '=' || c == '[' || c == ']' || g_ascii_iscntrl(c)) return false;
    }
    return true;
}

} // namespace

PreferenceStore::PreferenceStore()
    : path_(default_path()) {}

PreferenceStore::PreferenceStore(std::string path)
    : path_(std::move(path)) {}

std::string PreferenceStore::default_path() {
    gchar* path = g_build_filename(g_get_user_config_dir(), APP_CONFIG_DIR_NAME,
                                   PREFERENCES_FILE_NAME, nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

Status PreferenceStore::get(const std::string& section, const std::string& option,
                            std::string* value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    GKeyFile* key_file = g_key_file_new();
    bool exists = false;
    Status status = load_key_file(key_file, path_, &exists);
    if (status != Status::Ok || !exists) {
        g_key_file_free(key_file);
        return status == Status::Ok ? Status::NotFound : status;
    }

    GError* error = nullptr;
    gchar* raw = g_key_file_get_string(key_file, section.c_str(), option.c_str(), &error);
    if (!raw) {
        if (g_error_matches(error, G_KEY_FILE_ERROR, G_KEY_FILE_ERROR_GROUP_NOT_FOUND) ||
            g_error_matches(error, G_KEY_FILE_ERROR, G_KEY_FILE_ERROR_KEY_NOT_FOUND)) {
            status = Status::NotFound;
        } else {
            Logger::warn("[Preferences] Bad value for " + section + "." + option + ": " + error->message);
            status = Status::IoError;
        }
        g_error_free(error);
        g_key_file_free(key_file);
        return status;
    }

    if (value) {
        *value = raw;
    }
    g_free(raw);
    g_key_file_free(key_file);
    return Status::Ok;
}

Status PreferenceStore::set(const std::string& section, const std::string& option,
                            const std::string& value) {
    if (!is_valid_section(section) || !is_valid_option(option)) {
        Logger::warn("[Preferences] Refusing to store invalid name [" + section + "] " + option);
        return Status::InvalidName;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    GKeyFile* key_file = g_key_file_new();
    bool exists = false;
    Status status = load_key_file(key_file, path_, &exists);
    if (status != Status::Ok) {
        g_key_file_free(key_file);
        return status;
    }

    g_key_file_set_string(key_file, section.c_str(), option.c_str(), value.c_str());

    gchar* dir = g_path_get_dirname(path_.c_str());
    if (g_mkdir_with_parents(dir, 0700) != 0) {
        Logger::error(std::string("[Preferences] Could not create ") + dir);
        g_free(dir);
        g_key_file_free(key_file);
        return Status::IoError;
    }
    g_free(dir);

    // g_key_file_save_to_file goes through g_file_set_contents (write + rename)
    GError* error = nullptr;
    if (!g_key_file_save_to_file(key_file, path_.c_str(), &error)) {
        Logger::error("[Preferences] Failed to write " + path_ + ": " + error->message);
        g_error_free(error);
        g_key_file_free(key_file);
        return Status::IoError;
    }
    g_key_file_free(key_file);

    Logger::debug("[Preferences] Set user preference: " + section + " " + option + " " + value);
    return Status::Ok;
}

bool PreferenceStore::get_bool(const std::string& section, const std::string& option,
                               bool default_value) const {
    std::string value;
    if (get(section, option, &value) != Status::Ok) {
        return default_value;
    }
    if (g_ascii_strcasecmp(value.c_str(), "true") == 0) return true;
    if (g_ascii_strcasecmp(value.c_str(), "false") == 0) return false;
    return default_value;
}

FeatureFlags load_feature_flags(const PreferenceStore& store) {
    FeatureFlags flags;
    flags.grid_invites = store.get_bool("features", "grid_invites", true);
    flags.invites = store.get_bool("features", "invites", true);
    flags.multiple_grids = store.get_bool("features", "multiple_grids", true);

    Logger::info(std::string("[Features] grid_invites=") + (flags.grid_invites ? "true" : "false") +
                 " invites=" + (flags.invites ? "true" : "false") +
                 " multiple_grids=" + (flags.multiple_grids ? "true" : "false"));
    return flags;
}

} // namespace gridsync
