#ifndef KINSHIP_LAYOUT_HPP
#define KINSHIP_LAYOUT_HPP

#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <ostream>
#include <string_view>

#include <kinship/Error.hpp>
#include <kinship/FamilyTree.hpp>
#include <kinship/LayoutOptions.hpp>
#include <kinship/RelationshipIndex.hpp>
#include <kinship/meta/InsertionOrderedSet.hpp>

namespace kin {

using PositionMap = std::map<PersonId, Position, std::less<>>;

namespace layout {

/// direction-independent placement: `depth` along the generation axis, `offset` along the family axis
struct Slot {
    double depth  = 0.0;
    double offset = 0.0;

    bool operator==(const Slot&) const = default;
};

using SlotMap = std::map<PersonId, Slot, std::less<>>;

/**
 * @brief state of one layout run, threaded through the placement passes
 *
 * A person that entered `visited` is never placed again. This bounds the traversal on cyclic-looking data and
 * keeps a child reachable through several relationships from being counted twice.
 */
struct PlacementContext {
    const RelationshipIndex&            index;
    double                              spacingX = 200.0; ///< family axis
    double                              spacingY = 150.0; ///< generation axis
    meta::InsertionOrderedSet<PersonId> visited{};
    SlotMap                             slots{};
};

/**
 * @brief places `personId`, its spouses and all its unvisited descendants
 *
 * The person's marriages are taken in ascending `Marriage::order`. Not yet visited spouses are claimed before any
 * child is placed and are lined up right of the person at `spacingX * (i + 1)`. Children of all marriages followed by
 * the person's direct children are laid out left to right starting at `base`, each child subtree starting where the
 * previous one ended. The person is centred over its children.
 *
 * @return footprint along the family axis: max(sum of child footprints, spacingX * (1 + #spouses)), 0 if `personId`
 *         was already visited
 */
double placeFamilyUnit(PlacementContext& ctx, std::string_view personId, std::size_t generation, double base);

/**
 * @brief gives every not yet visited person of `tree` a slot on the row one generation below the deepest one placed
 * @return number of persons placed
 */
std::size_t placeOrphans(const FamilyTree& tree, PlacementContext& ctx);

[[nodiscard]] constexpr Position emit(Slot slot, Direction direction) noexcept {
    switch (direction) {
    case Direction::LeftRight: return {.x = slot.depth, .y = slot.offset};
    case Direction::TopDown:
    default: return {.x = slot.offset, .y = slot.depth};
    }
}

} // namespace layout

/**
 * @brief computes diagram positions for all persons of the snapshot
 *
 * Runs the family placement from `options.rootPersonId`, then places everybody the root does not reach on a fallback
 * row, and maps the result to (x, y) according to `options.direction`. The returned map holds exactly one entry per
 * person of `tree`, also if the root is not part of the tree. The snapshot is not modified.
 *
 * @throws kin::exception if `options` fail `LayoutOptions::validate()`
 */
[[nodiscard]] PositionMap computeLayout(const FamilyTree& tree, const LayoutOptions& options);

[[nodiscard]] PositionMap computeLayout(const FamilyTree& tree, std::string_view rootPersonId, Direction direction = Direction::TopDown, double spacingX = 200.0, double spacingY = 150.0);

/// writes the positions onto the matching persons, ids unknown to `tree` are skipped
/// @return number of persons updated
std::size_t applyPositions(FamilyTree& tree, const PositionMap& positions);

/// computes and applies the layout, rejects invalid options and a root that is not part of the tree
[[nodiscard]] std::expected<PositionMap, Error> autoLayout(FamilyTree& tree, const LayoutOptions& options);

} // namespace kin

template<>
struct fmt::formatter<kin::layout::Slot> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const kin::layout::Slot& slot, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{{ depth: {}, offset: {} }}", slot.depth, slot.offset);
    }
};

namespace kin::layout {
inline std::ostream& operator<<(std::ostream& os, const Slot& slot) { return os << fmt::format("{}", slot); }
} // namespace kin::layout

#endif // KINSHIP_LAYOUT_HPP
