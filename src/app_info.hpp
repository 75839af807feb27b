#pragma once

namespace gridsync {

constexpr const char* APP_NAME = "Gridsync";
constexpr const char* APP_CONFIG_DIR_NAME = "gridsync";
constexpr const char* PREFERENCES_FILE_NAME = "preferences.ini";

} // namespace gridsync
