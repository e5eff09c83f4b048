#include <catch2/catch.hpp>
#include <verchain/manifest.hpp>
#include <cstdlib>

using namespace verchain;

static std::string fixture_dir() {
    const char* src = std::getenv("VERCHAIN_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// ===== [versions] table =====

TEST_CASE("parse component with version, tag and requirements", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
bllvm-consensus = { version = "0.1.0", git_tag = "v0.1.0" }
bllvm-node = { version = "0.1.0", git_tag = "v0.1.0", requires = ["bllvm-protocol=0.1.0", "bllvm-consensus=0.1.0"] }
bllvm-protocol = { version = "0.1.0", requires = ["bllvm-consensus=0.1.0"] }
)");
    REQUIRE(r.is_ok());
    auto& m = r.value();
    REQUIRE(m.size() == 3);

    const Component* node = m.find("bllvm-node");
    REQUIRE(node != nullptr);
    REQUIRE(node->version == "0.1.0");
    REQUIRE(node->git_tag.value() == "v0.1.0");
    REQUIRE(node->requirements.size() == 2);
    // Declaration order is kept
    REQUIRE(node->requirements[0].name == "bllvm-protocol");
    REQUIRE(node->requirements[1].name == "bllvm-consensus");

    const Component* protocol = m.find("bllvm-protocol");
    REQUIRE_FALSE(protocol->git_tag.has_value());
}

TEST_CASE("iteration is in name order", "[manifest]") {
    auto m = VersionsManifest::parse(R"(
[versions]
zeta = "1.0.0"
alpha = "1.0.0"
mid = "1.0.0"
)").value();
    std::vector<std::string> names;
    for (const auto& [name, comp] : m) names.push_back(name);
    REQUIRE(names == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("bare version string declares a component", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
bllvm-sdk = "0.3.0"
)");
    REQUIRE(r.is_ok());
    const Component* sdk = r.value().find("bllvm-sdk");
    REQUIRE(sdk->version == "0.3.0");
    REQUIRE(sdk->requirements.empty());
}

TEST_CASE("empty [versions] table", "[manifest]") {
    auto r = VersionsManifest::parse("[versions]\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("find and contains on missing component", "[manifest]") {
    auto m = VersionsManifest::parse("[versions]\na = \"1\"\n").value();
    REQUIRE(m.find("b") == nullptr);
    REQUIRE_FALSE(m.contains("b"));
    REQUIRE(m.contains("a"));
}

// ===== Errors =====

TEST_CASE("missing [versions] table", "[manifest]") {
    auto r = VersionsManifest::parse("[package]\nname = \"x\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Manifest);
}

TEST_CASE("invalid TOML is a parse error", "[manifest]") {
    auto r = VersionsManifest::parse("[versions\nA = ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Parse);
}

TEST_CASE("component without version", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
A = { git_tag = "v0.1.0" }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Manifest);
    REQUIRE(r.error().message.find("'A'") != std::string::npos);
}

TEST_CASE("non-array requires", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
A = { version = "0.1.0", requires = "B=0.1.0" }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Manifest);
}

TEST_CASE("non-string requirement element", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
A = { version = "0.1.0", requires = [1] }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Manifest);
}

TEST_CASE("malformed requirement string", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
A = { version = "0.1.0", requires = ["B"] }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Parse);
}

TEST_CASE("invalid component name", "[manifest]") {
    auto r = VersionsManifest::parse(R"(
[versions]
"my component" = "0.1.0"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::InvalidArg);
}

// ===== from_components =====

TEST_CASE("from_components rejects duplicates", "[manifest]") {
    std::vector<Component> comps(2);
    comps[0].name = "consensus";
    comps[0].version = "0.1.0";
    comps[1].name = "consensus";
    comps[1].version = "0.2.0";
    auto r = VersionsManifest::from_components(std::move(comps));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Duplicate);
    REQUIRE(r.error().names == std::vector<std::string>{"consensus"});
}

TEST_CASE("from_components keeps records unchanged", "[manifest]") {
    Component c;
    c.name = "protocol";
    c.version = "0.1.0";
    c.git_tag = "release/0.1";
    c.requirements.push_back(Requirement{"consensus", "0.1.0"});
    auto r = VersionsManifest::from_components({c});
    REQUIRE(r.is_ok());
    const Component* p = r.value().find("protocol");
    REQUIRE(p->git_tag.value() == "release/0.1");
    REQUIRE(p->requirements[0] == Requirement{"consensus", "0.1.0"});
}

// ===== release_tag =====

TEST_CASE("release_tag uses git_tag or falls back to v<version>", "[manifest]") {
    auto m = VersionsManifest::parse(R"(
[versions]
tagged = { version = "0.1.0", git_tag = "bllvm-0.1.0" }
untagged = { version = "0.4.2" }
)").value();
    REQUIRE(m.release_tag("tagged").value() == "bllvm-0.1.0");
    REQUIRE(m.release_tag("untagged").value() == "v0.4.2");

    auto missing = m.release_tag("other");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == VerchainError::NotFound);
}

// ===== load =====

TEST_CASE("load fixture manifest", "[manifest]") {
    auto r = VersionsManifest::load(fixture_dir() + "/versions.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 5);
    REQUIRE(r.value().find("governance-app")->version == "0.2.1");
}

TEST_CASE("load missing file is an IO error", "[manifest]") {
    auto r = VersionsManifest::load(fixture_dir() + "/does-not-exist.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::IO);
}

TEST_CASE("load reports the file on parse errors", "[manifest]") {
    auto r = VersionsManifest::load(fixture_dir() + "/verchain.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::Manifest);
    REQUIRE(r.error().file.find("verchain.toml") != std::string::npos);
}
