#include <catch2/catch.hpp>
#include <verchain/log.hpp>
#include <verchain/resolver.hpp>

#include <cstdio>
#include <string>

using namespace verchain;

// Sends log lines to a temporary file at the given threshold, then restores
// stderr and the Info threshold.
class LogCapture {
public:
    explicit LogCapture(log::Level lvl) : file_(std::tmpfile()) {
        REQUIRE(file_ != nullptr);
        log::set_output(file_);
        log::set_color_enabled(false);
        log::set_level(lvl);
    }

    ~LogCapture() {
        log::set_output(nullptr);
        log::set_level(log::Info);
        log::set_color_enabled(false);
        std::fclose(file_);
    }

    std::string text() {
        std::fflush(file_);
        std::rewind(file_);
        std::string out;
        char buf[512];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
            out.append(buf, n);
        }
        std::fseek(file_, 0, SEEK_END);
        return out;
    }

private:
    std::FILE* file_;
};

static VersionsManifest three_components() {
    auto r = VersionsManifest::parse(R"(
[versions]
core = "1.0.0"
net = { version = "1.0.0", requires = ["core=1.0.0"] }
app = { version = "2.0.0", requires = ["core=1.0.0", "net=1.0.0"] }
)");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

TEST_CASE("graph build reports its size at debug level", "[log]") {
    auto m = three_components();
    LogCapture cap(log::Debug);

    REQUIRE(DependencyGraph::build(m).is_ok());
    REQUIRE(cap.text() == "debug: dependency graph: 3 components, 3 edges\n");
}

TEST_CASE("graph build is silent at info level", "[log]") {
    auto m = three_components();
    LogCapture cap(log::Info);

    REQUIRE(DependencyGraph::build(m).is_ok());
    REQUIRE(cap.text().empty());
}

TEST_CASE("each skipped component is announced at info level", "[log]") {
    LogCapture cap(log::Info);

    auto kept = without_skipped({"core", "net", "app"}, {"net", "core"});
    REQUIRE(kept == std::vector<std::string>{"app"});
    REQUIRE(cap.text() ==
            "info: skipping core (pre-built)\n"
            "info: skipping net (pre-built)\n");
}

TEST_CASE("skip announcements are dropped below the threshold", "[log]") {
    LogCapture cap(log::Warn);

    without_skipped({"core", "net"}, {"core"});
    REQUIRE(cap.text().empty());
}

TEST_CASE("target selection reports how much of the manifest it kept", "[log]") {
    auto m = three_components();
    LogCapture cap(log::Debug);

    auto order = build_order_for(m, {"net"});
    REQUIRE(order.value() == std::vector<std::string>{"core", "net"});
    REQUIRE(cap.text().find("debug: selected 2 of 3 components\n") != std::string::npos);
}

TEST_CASE("a stalled resolution is logged before the cycle error", "[log]") {
    auto m = VersionsManifest::parse(R"(
[versions]
a = { version = "1", requires = ["b=1"] }
b = { version = "1", requires = ["a=1"] }
)").value();
    LogCapture cap(log::Debug);

    REQUIRE(m.build_order().is_err());
    REQUIRE(cap.text().find("debug: resolution stalled with 2 unresolved components\n")
            != std::string::npos);
}

TEST_CASE("colored lines wrap the level name only", "[log]") {
    LogCapture cap(log::Info);
    log::set_color_enabled(true);

    without_skipped({"core"}, {"core"});
    REQUIRE(cap.text() == "\033[32minfo\033[0m: skipping core (pre-built)\n");
}

TEST_CASE("explicit color setting survives redirection", "[log]") {
    std::FILE* file = std::tmpfile();
    REQUIRE(file != nullptr);

    log::set_color_enabled(true);
    log::set_output(file);
    REQUIRE(log::is_color_enabled());

    log::set_color_enabled(false);
    log::set_output(nullptr);
    REQUIRE_FALSE(log::is_color_enabled());
    std::fclose(file);
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(log::parse_level("trace").value() == log::Trace);
    REQUIRE(log::parse_level("DEBUG").value() == log::Debug);
    REQUIRE(log::parse_level("Warn").value() == log::Warn);
    REQUIRE(log::parse_level("error").value() == log::Error);
}

TEST_CASE("parse_level reads back every level name", "[log]") {
    for (log::Level lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        REQUIRE(log::parse_level(log::level_name(lvl)).value() == lvl);
    }
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    auto r = log::parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VerchainError::InvalidArg);
    REQUIRE(r.error().message.find("verbose") != std::string::npos);
}
