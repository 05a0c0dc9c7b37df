#pragma once

#include <retext/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace retext {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then the file, then RETEXT_* environment, then cmdOverrides
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "preserver.width-tolerance")
    // Returns nullopt if the key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // $XDG_CONFIG_HOME/retext/config.yaml, or ~/.config/retext/config.yaml
    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "RETEXT_";

    // Section keys
    static constexpr const char* KEY_PRESERVER = "preserver";
    static constexpr const char* KEY_ZORDER = "zorder";
    static constexpr const char* KEY_REWRITER = "rewriter";
    static constexpr const char* KEY_VALIDATOR = "validator";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);

    // Every known leaf can be overridden by RETEXT_<SECTION>_<KEY>
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "zorder.max-history" -> "RETEXT_ZORDER_MAX_HISTORY"
    static std::string pathToEnvVar(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace retext
