#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class ConfigBuilder {
public:
    static Result<Config> from_node(const YAML::Node& root);
};

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".nimbus";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

static TransferSettings parse_transfer_settings(const YAML::Node& node) {
    TransferSettings t;
    t.max_retries = node["max_retries"].as<int>(DEFAULT_MAX_RETRIES);
    t.chunk_prefix = node["chunk_prefix"].as<std::string>(DEFAULT_CHUNK_PREFIX);
    t.manifest_name = node["manifest_name"].as<std::string>(DEFAULT_MANIFEST_NAME);
    t.work_dir = expand_home(node["work_dir"].as<std::string>("."));
    t.codec = node["codec"].as<std::string>("auto");
    return t;
}

static RemoteSettings parse_remote_settings(const YAML::Node& node) {
    RemoteSettings r;
    r.tmp_dir = node["tmp_dir"].as<std::string>(DEFAULT_REMOTE_TMP_DIR);
    r.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    r.timeout = node["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT);
    r.password = node["password"].as<std::string>("");

    if (node["ssh_key_path"]) {
        r.ssh_key_path = expand_home(node["ssh_key_path"].as<std::string>());
    }

    return r;
}

Result<Config> ConfigBuilder::from_node(const YAML::Node& root) {
    Config config;
    config.transfer_ = parse_transfer_settings(root["transfer"] ? root["transfer"] : YAML::Node());
    config.remote_ = parse_remote_settings(root["remote"] ? root["remote"] : YAML::Node());

    const auto& t = config.transfer_;
    if (t.max_retries < 1) {
        return Result<Config>::Err("transfer.max_retries must be at least 1");
    }
    if (t.chunk_prefix.empty() || t.chunk_prefix.find('/') != std::string::npos) {
        return Result<Config>::Err("transfer.chunk_prefix must be a plain file name prefix");
    }
    if (t.manifest_name.empty() || t.manifest_name.find('/') != std::string::npos ||
        t.manifest_name.rfind(t.chunk_prefix, 0) == 0) {
        return Result<Config>::Err(
            "transfer.manifest_name must be a plain file name that does not start with the chunk prefix");
    }
    if (t.codec != "auto" && t.codec != "zstd" && t.codec != "gzip") {
        return Result<Config>::Err("transfer.codec must be one of: auto, zstd, gzip");
    }

    const auto& r = config.remote_;
    if (r.tmp_dir.empty() || r.tmp_dir[0] != '/' || r.tmp_dir == "/") {
        return Result<Config>::Err("remote.tmp_dir must be an absolute path below /");
    }
    if (r.port < 1 || r.port > 65535) {
        return Result<Config>::Err("remote.port must be between 1 and 65535");
    }
    if (r.timeout < 1) {
        return Result<Config>::Err("remote.timeout must be at least 1 second");
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(Config{});
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }
        return ConfigBuilder::from_node(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(Config{});
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping: " + path.string());
        }
        return ConfigBuilder::from_node(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}
