#ifndef KINSHIP_LAYOUT_CONFIG_HPP
#define KINSHIP_LAYOUT_CONFIG_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <kinship/Error.hpp>
#include <kinship/FamilyTree.hpp>
#include <kinship/LayoutOptions.hpp>

namespace kin {

/// unparsed layout settings as given on the command line, unset fields keep the configured value
struct LayoutOverrides {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::string>           root;
    std::optional<std::string>           direction;
    std::optional<std::string>           spacingX;
    std::optional<std::string>           spacingY;
};

[[nodiscard]] std::expected<double, Error> parseSpacing(std::string_view name, std::string_view value);

/**
 * @brief combines defaults, the options file and the overrides into validated `LayoutOptions`
 *
 * Precedence: overrides > `configPath` document > `LayoutOptions` defaults. The root person is taken from
 * `overrides.root`, then from the options document, then from the tree's metadata key `root_person_id`;
 * no root at all is an error.
 */
[[nodiscard]] std::expected<LayoutOptions, Error> resolveLayoutOptions(const FamilyTree& tree, const LayoutOverrides& overrides);

} // namespace kin

#endif // KINSHIP_LAYOUT_CONFIG_HPP
