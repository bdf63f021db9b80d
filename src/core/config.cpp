#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// Expand a leading "~/" against home.
static fs::path expand_home(const std::string& raw, const fs::path& home) {
    if (raw == "~") return home;
    if (raw.rfind("~/", 0) == 0) return home / raw.substr(2);
    return fs::path(raw);
}

fs::path get_config_path(const fs::path& home) {
    std::string env = env_or_empty(ENV_CONFIG_FILE);
    if (!env.empty()) return expand_home(env, home);
    return home / CONFIG_FILE_NAME;
}

fs::path get_sessions_path(const Config& config, const fs::path& home) {
    std::string env = env_or_empty(ENV_SESSIONS_FILE);
    if (!env.empty()) return expand_home(env, home);
    if (config.sessions_file()) return *config.sessions_file();
    return home / SESSIONS_FILE_NAME;
}

Result<Config> Config::load(const fs::path& home) {
    return load_file(get_config_path(home), home);
}

Result<Config> Config::load_file(const fs::path& path, const fs::path& home) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config;

        // An empty file parses to a null node
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Failed to parse config " + path.string() +
                                       ": top level must be a mapping");
        }

        config.ssh_.program = root["ssh_program"].as<std::string>(config.ssh_.program);
        if (root["ssh_options"]) {
            if (root["ssh_options"].IsScalar()) {
                // Single option given as a string
                config.ssh_.options = {root["ssh_options"].as<std::string>()};
            } else {
                config.ssh_.options = root["ssh_options"].as<std::vector<std::string>>();
            }
        }
        config.ssh_.bind_address = root["bind_address"].as<std::string>(config.ssh_.bind_address);

        if (root["sessions_file"]) {
            std::string raw = root["sessions_file"].as<std::string>();
            trim(raw);
            if (!raw.empty()) config.sessions_file_ = expand_home(raw, home);
        }

        if (config.ssh_.program.empty()) {
            return Result<Config>::Err("Failed to parse config " + path.string() +
                                       ": ssh_program is empty");
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }
}
