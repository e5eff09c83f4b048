#pragma once

#include <verchain/result.hpp>
#include <verchain/log.hpp>
#include <string>
#include <vector>
#include <optional>

namespace verchain {

// Layered configuration: global > project
// Later layers override earlier ones, field by field
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> color;
    std::optional<std::string> manifest_path;
    // Components whose artifacts come from elsewhere; still validated,
    // left out of printed orders
    std::vector<std::string> skip;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Effective manifest path, falling back to versions.toml
    std::string manifest() const;

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.verchain/config.toml, or empty when HOME is unset
std::string global_config_path();

// verchain.toml in the working directory
constexpr const char* PROJECT_CONFIG_FILE = "verchain.toml";

} // namespace verchain
