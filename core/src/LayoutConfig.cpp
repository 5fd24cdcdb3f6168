#include <kinship/LayoutConfig.hpp>
#include <kinship/YamlFamilyTree.hpp>

#include <charconv>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace kin {

std::expected<double, Error> parseSpacing(std::string_view name, std::string_view value) {
    double result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        return std::unexpected(Error(fmt::format("{}: '{}' is not a number", name, value)));
    }
    return result;
}

std::expected<LayoutOptions, Error> resolveLayoutOptions(const FamilyTree& tree, const LayoutOverrides& overrides) {
    LayoutOptions options;
    if (overrides.configPath) {
        auto fromFile = loadLayoutOptionsFile(*overrides.configPath);
        if (!fromFile) {
            return std::unexpected(fromFile.error());
        }
        options = std::move(*fromFile);
    }

    if (overrides.root) {
        options.rootPersonId = *overrides.root;
    } else if (options.rootPersonId.empty()) {
        if (auto it = tree.metadata.find("root_person_id"); it != tree.metadata.end()) {
            options.rootPersonId = it->second;
        }
    }
    if (options.rootPersonId.empty()) {
        return std::unexpected(Error("no root person given (use --root, 'root_person_id' in --config or in the tree metadata)"));
    }

    if (overrides.direction) {
        auto parsed = parseDirection(*overrides.direction);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.direction = *parsed;
    }
    if (overrides.spacingX) {
        auto parsed = parseSpacing("--spacing-x", *overrides.spacingX);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.spacingX = *parsed;
    }
    if (overrides.spacingY) {
        auto parsed = parseSpacing("--spacing-y", *overrides.spacingY);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.spacingY = *parsed;
    }

    if (auto valid = options.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return options;
}

} // namespace kin
