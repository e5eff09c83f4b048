// verchain: build order for a versions.toml manifest
//
//     verchain order                  # full build order, one per line
//     verchain order bllvm-node       # only what bllvm-node needs
//     verchain levels                 # groups that can build in parallel
//     verchain tree bllvm-node        # requirement tree
//     verchain check                  # validate only
//     verchain tag                    # release tag for the chain

#include <verchain/config.hpp>
#include <verchain/log.hpp>
#include <verchain/manifest.hpp>
#include <verchain/name.hpp>
#include <verchain/resolver.hpp>
#include <verchain/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace verchain;

static const char* USAGE =
    "usage: verchain [options] <command> [args]\n"
    "\n"
    "commands:\n"
    "  order [targets...]   print the build order\n"
    "  levels               print parallel build levels\n"
    "  tree <component>     print the requirement tree\n"
    "  check                validate the manifest\n"
    "  tag [component]      print the release tag\n"
    "\n"
    "options:\n"
    "  -m, --manifest PATH  manifest file (default: versions.toml)\n"
    "      --skip A,B       validate but do not print these components\n"
    "  -v, --verbose        debug logging\n"
    "  -q, --quiet          errors only\n"
    "      --no-color       disable colored output\n"
    "  -h, --help           show this help\n";

struct CliOptions {
    std::optional<std::string> manifest;
    std::vector<std::string> skip;
    std::optional<log::Level> level;
    bool no_color = false;
    bool help = false;
    std::string command;
    std::vector<std::string> args;
};

static Result<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-m" || arg == "--manifest") {
            if (i + 1 >= argc) {
                return VerchainError{VerchainError::InvalidArg,
                    arg + " requires a path"};
            }
            opts.manifest = argv[++i];
        } else if (arg == "--skip") {
            if (i + 1 >= argc) {
                return VerchainError{VerchainError::InvalidArg,
                    "--skip requires a comma-separated list"};
            }
            for (auto& name : split_names(argv[++i])) {
                opts.skip.push_back(std::move(name));
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.level = log::Error;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return VerchainError{VerchainError::InvalidArg,
                "unknown option: " + arg, "run 'verchain --help'"};
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }

    if (!opts.help && opts.command.empty()) {
        return VerchainError{VerchainError::InvalidArg,
            "no command given", "run 'verchain --help'"};
    }
    return Result<CliOptions>::ok(std::move(opts));
}

// Global and project config layers, each optional.
static Result<Config> load_config() {
    std::optional<Config> global;
    std::optional<Config> project;

    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        VERCHAIN_TRY_ASSIGN(global, Config::load(global_path));
    }
    if (fs::exists(PROJECT_CONFIG_FILE)) {
        VERCHAIN_TRY_ASSIGN(project, Config::load(PROJECT_CONFIG_FILE));
    }
    return Result<Config>::ok(Config::effective(global, project));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static Status cmd_order(const VersionsManifest& manifest,
                        const std::vector<std::string>& targets,
                        const std::vector<std::string>& skip) {
    Result<std::vector<std::string>> order = targets.empty()
        ? manifest.build_order()
        : build_order_for(manifest, targets);
    VERCHAIN_TRY(order);

    for (const auto& name : without_skipped(order.value(), skip)) {
        std::cout << name << "\n";
    }
    return ok_status();
}

static Status cmd_levels(const VersionsManifest& manifest,
                         const std::vector<std::string>& skip) {
    VERCHAIN_TRY_ASSIGN(auto levels, manifest.build_levels());

    for (size_t i = 0; i < levels.size(); ++i) {
        std::cout << "level " << i << ":";
        for (const auto& name : without_skipped(levels[i], skip)) {
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
    return ok_status();
}

static Status cmd_tree(const VersionsManifest& manifest,
                       const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return VerchainError{VerchainError::InvalidArg,
            "tree takes exactly one component name"};
    }
    if (!manifest.contains(args[0])) {
        return VerchainError{VerchainError::NotFound,
            "component '" + args[0] + "' is not in the manifest"};
    }
    VERCHAIN_TRY_ASSIGN(auto graph, DependencyGraph::build(manifest));
    std::cout << graph.tree_display(args[0]);
    return ok_status();
}

static Status cmd_check(const VersionsManifest& manifest) {
    VERCHAIN_TRY_ASSIGN(auto levels, manifest.build_levels());
    log::info("%zu components, %zu build levels: ok",
              manifest.size(), levels.size());
    return ok_status();
}

static Status cmd_tag(const VersionsManifest& manifest,
                      const std::vector<std::string>& args) {
    std::string reference;
    if (!args.empty()) {
        reference = args[0];
    } else {
        VERCHAIN_TRY_ASSIGN(auto order, manifest.build_order());
        if (order.empty()) {
            return VerchainError{VerchainError::Manifest,
                "manifest declares no components"};
        }
        reference = order.front();
    }
    VERCHAIN_TRY_ASSIGN(auto tag, manifest.release_tag(reference));
    std::cout << tag << "\n";
    return ok_status();
}

static Status run(const CliOptions& opts) {
    VERCHAIN_TRY_ASSIGN(Config cfg, load_config());

    if (cfg.log_level) log::set_level(*cfg.log_level);
    if (cfg.color) log::set_color_enabled(*cfg.color);
    if (opts.level) log::set_level(*opts.level);
    if (opts.no_color) log::set_color_enabled(false);

    Config cli;
    cli.skip = opts.skip;
    cfg.merge(cli);
    const std::vector<std::string>& skip = cfg.skip;

    std::string path = opts.manifest.value_or(cfg.manifest());
    VERCHAIN_TRY_ASSIGN(auto manifest, VersionsManifest::load(path));
    VERCHAIN_TRY(check_skip(manifest, skip));

    if (opts.command == "order") return cmd_order(manifest, opts.args, skip);
    if (opts.command == "levels") return cmd_levels(manifest, skip);
    if (opts.command == "tree") return cmd_tree(manifest, opts.args);
    if (opts.command == "check") return cmd_check(manifest);
    if (opts.command == "tag") return cmd_tag(manifest, opts.args);

    return VerchainError{VerchainError::InvalidArg,
        "unknown command: " + opts.command, "run 'verchain --help'"};
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        log::error("%s", opts.error().format().c_str());
        std::cerr << USAGE;
        return 2;
    }
    if (opts.value().help) {
        std::cout << USAGE;
        return 0;
    }

    auto status = run(opts.value());
    if (status.is_err()) {
        log::error("%s", status.error().format().c_str());
        return 1;
    }
    return 0;
}
