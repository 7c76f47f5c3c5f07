// include/dw/core/util/config_loader.hpp
#pragma once

#include <functional>
#include <string>

#include "dw/core/config.hpp"
#include "dw/core/status.hpp"

namespace dw {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - Secrets are then overridden from the environment (see apply_env_overrides).
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Lookup used for environment overrides; returns empty for unset variables.
using EnvLookup = std::function<std::string(const char* name)>;

// OPENAI_API_KEY, GOOGLE_DRIVE_FOLDER_ID, LOCAL_SAVE_DIR, RING_AUTH_FILE, RING_DOORBELL_NAME,
// ALERT_SOUND_FILE, SENDER_EMAIL, EMAIL_APP_PASSWORD, NOTIFICATION_RECIPIENTS (comma separated).
void apply_env_overrides(Config& cfg, const EnvLookup& env);

// Process environment lookup.
std::string getenv_or_empty(const char* name);

}  // namespace dw
