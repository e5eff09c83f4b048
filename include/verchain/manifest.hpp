#pragma once

#include <verchain/result.hpp>
#include <verchain/requirement.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace verchain {

// One entry of the [versions] table
struct Component {
    std::string name;
    std::string version;
    std::optional<std::string> git_tag;   // passed through, never interpreted
    std::vector<Requirement> requirements; // declaration order
};

// Parsed versions.toml. Immutable once constructed.
class VersionsManifest {
public:
    using Map = std::map<std::string, Component>;
    using const_iterator = Map::const_iterator;

    static constexpr const char* FILE_NAME = "versions.toml";

    // Parse from TOML string
    static Result<VersionsManifest> parse(const std::string& toml_str);

    // Parse from file path
    static Result<VersionsManifest> load(const std::string& path);

    // Build from already-parsed records; rejects duplicate or invalid names
    static Result<VersionsManifest> from_components(std::vector<Component> components);

    // nullptr when absent
    const Component* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }

    const Map& components() const { return components_; }
    const_iterator begin() const { return components_.begin(); }
    const_iterator end() const { return components_.end(); }

    // Git tag of `reference`, or "v<version>" when it declares none.
    Result<std::string> release_tag(const std::string& reference) const;

    // Resolve a fresh dependency graph; see resolver.hpp
    Result<std::vector<std::string>> build_order() const;
    Result<std::vector<std::vector<std::string>>> build_levels() const;

private:
    Map components_;
};

} // namespace verchain
