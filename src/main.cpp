/// kinship-layout
/// ---------------------------------------------------------------------------
/// Arranges a family tree document (YAML or JSON) around a root person.
///
/// Usage:
///   kinship-layout <tree.yaml> [--root <id>] [--direction top-down|left-right]
///                  [--spacing-x <n>] [--spacing-y <n>] [--config <options.yaml>]
///                  [--output <file>] [--verbose | -v] [--quiet | -q]
///
/// * options are taken from --config first and then overridden by the command line.
/// * without --root the tree's metadata key 'root_person_id' names the root.
/// * with --output the laid-out tree is written to <file>, otherwise '<id> <x> <y>' is printed per person.

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <kinship/Layout.hpp>
#include <kinship/LayoutConfig.hpp>
#include <kinship/Log.hpp>
#include <kinship/YamlFamilyTree.hpp>

namespace {

struct Options {
    std::filesystem::path                treePath;
    std::optional<std::filesystem::path> outputPath;
    kin::LayoutOverrides                 layout;
    kin::log::Level                      logLevel = kin::log::Level::Info;

    static std::expected<Options, kin::Error> parse(int argc, char** argv) {
        Options options;
        for (int index = 1; index < argc; index++) {
            const std::string_view arg      = argv[index];
            const bool             hasValue = argc > index + 1;
            if (arg == "--verbose" || arg == "-v") {
                options.logLevel = kin::log::Level::Debug;
            } else if (arg == "--quiet" || arg == "-q") {
                options.logLevel = kin::log::Level::Warning;
            } else if (hasValue && arg == "--root") {
                options.layout.root = argv[++index];
            } else if (hasValue && arg == "--direction") {
                options.layout.direction = argv[++index];
            } else if (hasValue && arg == "--spacing-x") {
                options.layout.spacingX = argv[++index];
            } else if (hasValue && arg == "--spacing-y") {
                options.layout.spacingY = argv[++index];
            } else if (hasValue && arg == "--config") {
                options.layout.configPath = argv[++index];
            } else if (hasValue && arg == "--output") {
                options.outputPath = argv[++index];
            } else if (arg.starts_with("-")) {
                return std::unexpected(kin::Error(fmt::format("unknown or incomplete option '{}'", arg)));
            } else if (options.treePath.empty()) {
                options.treePath = arg;
            } else {
                return std::unexpected(kin::Error(fmt::format("unexpected argument '{}'", arg)));
            }
        }
        if (options.treePath.empty()) {
            return std::unexpected(kin::Error("missing family tree file"));
        }
        return options;
    }
};

void printUsage(std::string_view command) {
    fmt::print(stderr, "Usage: {} <tree.yaml> [--root <id>] [--direction top-down|left-right] [--spacing-x <n>] [--spacing-y <n>] [--config <options.yaml>] [--output <file>] [--verbose | -v] [--quiet | -q]\n", command);
}

} // namespace

int main(int argc, char** argv) try {
    const std::string command = std::filesystem::path(argv[0]).filename().string();

    auto options = Options::parse(argc, argv);
    if (!options) {
        kin::log::error("{}", options.error().message);
        printUsage(command);
        return EXIT_FAILURE;
    }
    kin::log::setLevel(options->logLevel);

    auto tree = kin::loadFamilyTreeFile(options->treePath);
    if (!tree) {
        kin::log::error("{}", tree.error().message);
        return EXIT_FAILURE;
    }
    kin::log::debug("loaded '{}': {} persons, {} marriages, {} parent-child links", options->treePath.string(), tree->persons.size(), tree->marriages.size(), tree->parentChild.size());

    auto layoutOptions = kin::resolveLayoutOptions(*tree, options->layout);
    if (!layoutOptions) {
        kin::log::error("{}", layoutOptions.error().message);
        return EXIT_FAILURE;
    }

    auto positions = kin::autoLayout(*tree, *layoutOptions);
    if (!positions) {
        kin::log::error("{}", positions.error().message);
        return EXIT_FAILURE;
    }

    if (options->outputPath) {
        if (auto saved = kin::saveFamilyTreeFile(*options->outputPath, *tree); !saved) {
            kin::log::error("{}", saved.error().message);
            return EXIT_FAILURE;
        }
        kin::log::info("wrote laid-out tree to '{}'", options->outputPath->string());
        return EXIT_SUCCESS;
    }

    for (const kin::Person& person : tree->persons) {
        fmt::print("{} {} {}\n", person.id, person.position.x, person.position.y);
    }
    return EXIT_SUCCESS;
} catch (const std::exception& ex) {
    kin::log::error("{}", ex.what());
    return EXIT_FAILURE;
}
