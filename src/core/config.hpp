#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.nimbus/config.yaml. A missing file yields the built-in defaults.
    static Result<Config> load_global();

    // Load a specific YAML file (must exist).
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const TransferSettings& transfer() const { return transfer_; }
    const RemoteSettings& remote() const { return remote_; }

public:
    Config() = default;

private:
    TransferSettings transfer_;
    RemoteSettings remote_;

    friend class ConfigBuilder;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Expand a leading "~/" to the user's home directory.
std::string expand_home(const std::string& path);
