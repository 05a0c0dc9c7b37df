#include <retext/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace retext {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            if (std::filesystem::exists(xdgPath)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicitly named file must load; the XDG one is optional
                if (!_configPath.empty()) {
                    return Err("Cannot load config " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err("Config: " + std::string(e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        return Err("Config: " + std::string(e.what()));
    }
    return Ok();
}

void Config::loadDefaults() {
    auto preserver = _config[KEY_PRESERVER];
    preserver["default-strategy"] = "exact";
    preserver["width-tolerance"] = 0.5;
    preserver["ratio-tolerance"] = 0.01;
    preserver["min-tracking"] = -3.0;
    preserver["max-tracking"] = 5.0;
    preserver["min-word-spacing"] = -5.0;
    preserver["max-word-spacing"] = 10.0;
    preserver["min-horizontal-scale"] = 50.0;
    preserver["max-horizontal-scale"] = 150.0;
    preserver["prefer-word-spacing"] = true;
    preserver["use-kerning"] = true;
    preserver["ellipsis"] = "...";
    preserver["truncate-at-word"] = true;
    preserver["max-tj-adjustment"] = 200.0;

    auto zorder = _config[KEY_ZORDER];
    zorder["maintain-level-boundaries"] = true;
    zorder["allow-cross-level-movement"] = false;
    zorder["max-layers-per-page"] = 1000;
    zorder["z-order-step"] = 10;
    zorder["enable-history"] = true;
    zorder["max-history"] = 100;
    zorder["collision-tolerance"] = 0.5;

    auto rewriter = _config[KEY_REWRITER];
    rewriter["default-strategy"] = "redact-then-insert";
    rewriter["default-mode"] = "preserve-position";
    rewriter["auto-adjust-tracking"] = true;
    rewriter["auto-adjust-size"] = true;
    rewriter["min-tracking-delta"] = -2.0;
    rewriter["max-tracking-delta"] = 2.0;
    rewriter["min-size-factor"] = 0.7;
    rewriter["max-size-factor"] = 1.3;
    rewriter["min-scale-x"] = 0.75;
    rewriter["max-scale-x"] = 1.25;
    rewriter["redact-margin"] = 1.0;

    auto validator = _config[KEY_VALIDATOR];
    validator["check-structure"] = true;
    validator["check-fonts"] = true;
    validator["check-content"] = true;
    validator["check-resources"] = true;
    validator["check-annotations"] = true;
    validator["check-metadata"] = true;
    validator["check-security"] = true;
    validator["check-modifications"] = true;
    validator["allow-missing-fonts"] = false;
    validator["allow-subset-fonts"] = true;
    validator["allow-empty-pages"] = true;
    validator["max-issues"] = 100;
    validator["timeout-ms"] = 30000;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_config, fileConfig);
        } else if (fileConfig && !fileConfig.IsNull()) {
            return Err<void>("Config file is not a mapping: " + path);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (val) {
            // Scalars stay strings; get<T>() converts on access
            it->second = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);

    // Rebind with reset(); operator= would write through to the tree
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "retext" / "config.yaml";
}

} // namespace retext
