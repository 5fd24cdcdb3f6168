#ifndef KINSHIP_LAYOUT_OPTIONS_HPP
#define KINSHIP_LAYOUT_OPTIONS_HPP

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <kinship/Error.hpp>
#include <kinship/FamilyTree.hpp>

namespace kin {

/// orientation of the generation (depth) axis
enum class Direction : std::uint8_t {
    TopDown,  ///< generations grow along y, families spread along x
    LeftRight ///< generations grow along x, families spread along y
};

[[nodiscard]] constexpr std::string_view directionName(Direction direction) noexcept {
    switch (direction) {
    case Direction::TopDown: return "top-down";
    case Direction::LeftRight: return "left-right";
    }
    return "top-down"; // unreachable
}

[[nodiscard]] inline std::expected<Direction, Error> parseDirection(std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "top-down" || lower == "down") {
        return Direction::TopDown;
    }
    if (lower == "left-right" || lower == "across") {
        return Direction::LeftRight;
    }
    return std::unexpected(Error(fmt::format("unknown layout direction '{}' (expected 'top-down' or 'left-right')", name)));
}

struct LayoutOptions {
    Direction direction = Direction::TopDown;
    PersonId  rootPersonId;
    double    spacingX = 200.0; ///< distance between neighbouring family members/siblings
    double    spacingY = 150.0; ///< distance between generations

    [[nodiscard]] std::expected<void, Error> validate() const {
        if (!std::isfinite(spacingX) || spacingX <= 0.0) {
            return std::unexpected(Error(fmt::format("spacing_x must be a positive number, got {}", spacingX)));
        }
        if (!std::isfinite(spacingY) || spacingY <= 0.0) {
            return std::unexpected(Error(fmt::format("spacing_y must be a positive number, got {}", spacingY)));
        }
        return {};
    }
};

} // namespace kin

template<>
struct fmt::formatter<kin::Direction> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(kin::Direction direction, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", kin::directionName(direction));
    }
};

#endif // KINSHIP_LAYOUT_OPTIONS_HPP
