#include <verchain/manifest.hpp>
#include <verchain/name.hpp>
#include <verchain/resolver.hpp>
#include <verchain/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace verchain {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<std::vector<Requirement>> parse_requirements(
    const std::string& name, const toml::array& arr)
{
    std::vector<Requirement> reqs;
    reqs.reserve(arr.size());
    for (const auto& elem : arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return VerchainError{VerchainError::Manifest,
                "component '" + name + "' has a non-string requirement",
                "requirements are strings like \"other=0.1.0\""};
        }
        VERCHAIN_TRY_ASSIGN(auto req, Requirement::parse(*s));
        reqs.push_back(std::move(req));
    }
    return Result<std::vector<Requirement>>::ok(std::move(reqs));
}

static Result<Component> parse_component(const std::string& name,
                                         const toml::node& node) {
    Component comp;
    comp.name = name;

    // Short form: name = "0.1.0"
    if (auto v = node.value<std::string>()) {
        comp.version = *v;
        return Result<Component>::ok(std::move(comp));
    }

    if (!node.is_table()) {
        return VerchainError{VerchainError::Manifest,
            "component '" + name + "' must be a table or a version string"};
    }
    const auto& tbl = *node.as_table();

    auto version = tbl["version"].value<std::string>();
    if (!version) {
        return VerchainError{VerchainError::Manifest,
            "component '" + name + "' is missing a string 'version'"};
    }
    comp.version = *version;

    if (tbl.contains("git_tag")) {
        auto tag = tbl["git_tag"].value<std::string>();
        if (!tag) {
            return VerchainError{VerchainError::Manifest,
                "component '" + name + "' has a non-string 'git_tag'"};
        }
        comp.git_tag = *tag;
    }

    if (tbl.contains("requires")) {
        const auto* arr = tbl["requires"].as_array();
        if (!arr) {
            return VerchainError{VerchainError::Manifest,
                "component '" + name + "': 'requires' must be an array"};
        }
        VERCHAIN_TRY_ASSIGN(comp.requirements, parse_requirements(name, *arr));
    }

    return Result<Component>::ok(std::move(comp));
}

// ---------------------------------------------------------------------------
// VersionsManifest
// ---------------------------------------------------------------------------

Result<VersionsManifest> VersionsManifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return VerchainError{VerchainError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    const auto* versions = doc["versions"].as_table();
    if (!versions) {
        return VerchainError{VerchainError::Manifest,
            "missing [versions] table",
            "declare components as: name = { version = \"0.1.0\" }"};
    }

    std::vector<Component> comps;
    for (const auto& [key, val] : *versions) {
        VERCHAIN_TRY_ASSIGN(auto comp, parse_component(std::string(key.str()), val));
        comps.push_back(std::move(comp));
    }

    return from_components(std::move(comps));
}

Result<VersionsManifest> VersionsManifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VerchainError{VerchainError::IO,
            "cannot open manifest: " + path,
            "pass --manifest or run from the directory containing " +
            std::string(FILE_NAME)};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    log::debug("loading manifest %s", path.c_str());
    auto result = VersionsManifest::parse(ss.str());
    result.context(path);
    return result;
}

Result<VersionsManifest> VersionsManifest::from_components(
    std::vector<Component> components)
{
    VersionsManifest m;
    for (auto& comp : components) {
        VERCHAIN_TRY(validate_name(comp.name));
        std::string name = comp.name;
        if (!m.components_.emplace(name, std::move(comp)).second) {
            return VerchainError{VerchainError::Duplicate,
                "component '" + name + "' is declared more than once"}
                .with_names({name});
        }
    }
    return Result<VersionsManifest>::ok(std::move(m));
}

const Component* VersionsManifest::find(const std::string& name) const {
    auto it = components_.find(name);
    if (it == components_.end()) return nullptr;
    return &it->second;
}

bool VersionsManifest::contains(const std::string& name) const {
    return components_.count(name) > 0;
}

Result<std::string> VersionsManifest::release_tag(const std::string& reference) const {
    const Component* comp = find(reference);
    if (!comp) {
        return VerchainError{VerchainError::NotFound,
            "component '" + reference + "' is not in the manifest"}
            .with_names({reference});
    }
    if (comp->git_tag) return Result<std::string>::ok(*comp->git_tag);
    return Result<std::string>::ok("v" + comp->version);
}

Result<std::vector<std::string>> VersionsManifest::build_order() const {
    return verchain::build_order(*this);
}

Result<std::vector<std::vector<std::string>>> VersionsManifest::build_levels() const {
    return verchain::build_levels(*this);
}

} // namespace verchain
