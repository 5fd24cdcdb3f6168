#include <kinship/Layout.hpp>
#include <kinship/Log.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace kin {

namespace layout {

namespace {
struct FamilyFrame {
    PersonId              person;
    std::size_t           generation = 0UZ;
    double                base       = 0.0;
    std::vector<PersonId> spouses{};
    std::vector<PersonId> children{};
    std::size_t           nextChild         = 0UZ;
    double                childrenFootprint = 0.0;
};

// claims the person and its free spouses and collects the children, false if the person was already visited
bool enterFamily(PlacementContext& ctx, std::vector<FamilyFrame>& stack, std::string_view personId, std::size_t generation, double base) {
    if (!ctx.visited.insert(PersonId(personId))) {
        return false;
    }

    FamilyFrame                         frame{.person = PersonId(personId), .generation = generation, .base = base};
    meta::InsertionOrderedSet<PersonId> children;
    for (const Marriage* marriage : ctx.index.marriagesOf(personId)) {
        const PersonId& spouse = marriage->spouseOf(personId);
        if (ctx.visited.insert(spouse)) {
            frame.spouses.push_back(spouse);
        }
        for (const PersonId& child : ctx.index.childrenOfMarriage(marriage->id)) {
            children.insert(child);
        }
    }
    for (const PersonId& child : ctx.index.childrenOfParent(personId)) {
        children.insert(child);
    }
    frame.children.assign(children.begin(), children.end());

    stack.push_back(std::move(frame));
    return true;
}

// assigns the slots of the family unit once all children are placed and returns its footprint
double closeFamily(PlacementContext& ctx, const FamilyFrame& frame) {
    const double unitWidth         = ctx.spacingX * static_cast<double>(1UZ + frame.spouses.size());
    const double childrenFootprint = frame.childrenFootprint > 0.0 ? frame.childrenFootprint : unitWidth;
    const double centre            = frame.base + childrenFootprint / 2.0 - unitWidth / 2.0;
    const double depth             = static_cast<double>(frame.generation) * ctx.spacingY;

    ctx.slots.insert_or_assign(frame.person, Slot{.depth = depth, .offset = centre});
    for (std::size_t i = 0UZ; i < frame.spouses.size(); ++i) {
        ctx.slots.insert_or_assign(frame.spouses[i], Slot{.depth = depth, .offset = centre + ctx.spacingX * static_cast<double>(i + 1UZ)});
    }
    return std::max(childrenFootprint, unitWidth);
}
} // namespace

double placeFamilyUnit(PlacementContext& ctx, std::string_view personId, std::size_t generation, double base) {
    // depth-first over an explicit frame stack: the family tree may be arbitrarily deep
    std::vector<FamilyFrame> stack;
    if (!enterFamily(ctx, stack, personId, generation, base)) {
        return 0.0;
    }

    double footprint = 0.0;
    while (!stack.empty()) {
        FamilyFrame& frame = stack.back();
        if (frame.nextChild < frame.children.size()) {
            const PersonId child      = frame.children[frame.nextChild++]; // copy, 'stack' may grow below
            const double   childBase  = frame.base + frame.childrenFootprint;
            const auto     childDepth = frame.generation + 1UZ;
            enterFamily(ctx, stack, child, childDepth, childBase); // already visited children occupy no space
            continue;
        }

        footprint = closeFamily(ctx, frame);
        stack.pop_back();
        if (!stack.empty()) {
            stack.back().childrenFootprint += footprint;
        }
    }
    return footprint;
}

std::size_t placeOrphans(const FamilyTree& tree, PlacementContext& ctx) {
    double maxDepth = 0.0;
    for (const auto& [_, slot] : ctx.slots) {
        maxDepth = std::max(maxDepth, slot.depth);
    }

    std::size_t nPlaced = 0UZ;
    for (const Person& person : tree.persons) {
        if (!ctx.visited.insert(person.id)) {
            continue;
        }
        ctx.slots.insert_or_assign(person.id, Slot{.depth = maxDepth + ctx.spacingY, .offset = static_cast<double>(nPlaced) * ctx.spacingX});
        nPlaced++;
    }
    return nPlaced;
}

} // namespace layout

PositionMap computeLayout(const FamilyTree& tree, const LayoutOptions& options) {
    if (auto valid = options.validate(); !valid) {
        throw kin::exception(fmt::format("invalid layout options: {}", valid.error().message));
    }

    PositionMap positions;
    if (tree.persons.empty()) {
        return positions;
    }

    const RelationshipIndex  index(tree);
    layout::PlacementContext ctx{.index = index, .spacingX = options.spacingX, .spacingY = options.spacingY};

    if (tree.contains(options.rootPersonId)) {
        layout::placeFamilyUnit(ctx, options.rootPersonId, 0UZ, 0.0);
    } else {
        log::warning("root person not found: '{}'", options.rootPersonId);
    }

    if (const std::size_t nOrphans = layout::placeOrphans(tree, ctx); nOrphans > 0UZ) {
        log::debug("{} person(s) not reachable from root '{}' placed on the fallback row", nOrphans, options.rootPersonId);
    }

    for (const Person& person : tree.persons) {
        auto it = ctx.slots.find(person.id);
        if (it == ctx.slots.end()) {
            throw kin::exception(fmt::format("layout invariant violated: person '{}' received no position", person.id));
        }
        positions.insert_or_assign(person.id, layout::emit(it->second, options.direction));
    }

    log::info("calculated layout for {} persons", positions.size());
    return positions;
}

PositionMap computeLayout(const FamilyTree& tree, std::string_view rootPersonId, Direction direction, double spacingX, double spacingY) {
    return computeLayout(tree, LayoutOptions{.direction = direction, .rootPersonId = PersonId(rootPersonId), .spacingX = spacingX, .spacingY = spacingY});
}

std::size_t applyPositions(FamilyTree& tree, const PositionMap& positions) {
    std::size_t nUpdated = 0UZ;
    for (Person& person : tree.persons) {
        if (auto it = positions.find(person.id); it != positions.end()) {
            person.position = it->second;
            nUpdated++;
        }
    }
    return nUpdated;
}

std::expected<PositionMap, Error> autoLayout(FamilyTree& tree, const LayoutOptions& options) {
    if (auto valid = options.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (!tree.contains(options.rootPersonId)) {
        return std::unexpected(Error(fmt::format("root person not found: '{}'", options.rootPersonId)));
    }

    PositionMap positions = computeLayout(tree, options);
    applyPositions(tree, positions);
    log::info("applied {} auto-layout with root: '{}'", options.direction, options.rootPersonId);
    return positions;
}

} // namespace kin
