#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.rjy.yaml (or $RJY_CONFIG). A missing file gives the defaults.
    static Result<Config> load(const fs::path& home);

    // Load a specific config file. A missing file gives the defaults.
    static Result<Config> load_file(const fs::path& path, const fs::path& home);

    // Accessors
    const SshSettings& ssh() const { return ssh_; }
    const std::optional<fs::path>& sessions_file() const { return sessions_file_; }

public:
    Config() = default;

private:
    SshSettings ssh_;
    std::optional<fs::path> sessions_file_;
};

// $RJY_CONFIG if set, else ~/.rjy.yaml
fs::path get_config_path(const fs::path& home);

// Where the session registry lives: $RJY_SESSIONS_FILE, then the config's
// sessions_file, then ~/.remote_jupyter_sessions.
fs::path get_sessions_path(const Config& config, const fs::path& home);
