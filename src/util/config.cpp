#include <verchain/config.hpp>
#include <verchain/manifest.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>

namespace verchain {

static VerchainError type_error(const std::string& key, const char* expected,
                                const toml::node& node) {
    return VerchainError{VerchainError::Parse,
        "config key '" + key + "' must be " + expected,
        "", "", static_cast<int>(node.source().begin.line)};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VerchainError{VerchainError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("log.level", "a string", *node);
            VERCHAIN_TRY_ASSIGN(cfg.log_level, log::parse_level(*v));
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) return type_error("log.color", "true or false", *node);
            cfg.color = *v;
        }
    }

    // [manifest] section
    if (auto mf = doc["manifest"].as_table()) {
        if (auto node = mf->get("path")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("manifest.path", "a string", *node);
            cfg.manifest_path = *v;
        }
    }

    // [order] section
    if (auto order = doc["order"].as_table()) {
        if (auto node = order->get("skip")) {
            auto arr = node->as_array();
            if (!arr) return type_error("order.skip", "an array of component names", *node);
            for (const auto& elem : *arr) {
                auto name = elem.value<std::string>();
                if (!name) return type_error("order.skip", "an array of component names", elem);
                cfg.skip.push_back(*name);
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VerchainError{VerchainError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto result = Config::parse(ss.str());
    result.context(path);
    return result;
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.color) color = other.color;
    if (other.manifest_path) manifest_path = other.manifest_path;

    // Skip lists accumulate
    for (const auto& name : other.skip) {
        if (std::find(skip.begin(), skip.end(), name) == skip.end()) {
            skip.push_back(name);
        }
    }
}

std::string Config::manifest() const {
    return manifest_path.value_or(VersionsManifest::FILE_NAME);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.verchain/config.toml";
}

} // namespace verchain
