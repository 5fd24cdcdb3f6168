#ifndef KINSHIP_FAMILY_TREE_HPP
#define KINSHIP_FAMILY_TREE_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace kin {

using PersonId   = std::string;
using MarriageId = std::string;

struct Position {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Position&) const = default;
};

enum class Gender : std::uint8_t { Male, Female, Unknown };

struct Person {
    PersonId                   id;
    std::string                name;
    Gender                     gender = Gender::Unknown;
    std::optional<std::string> dateOfBirth;
    std::optional<std::string> dateOfDeath;
    std::optional<std::string> photoPath;
    std::optional<std::string> notes;
    Position                   position; ///< diagram position, written by the layout
};

struct Marriage {
    MarriageId                 id;
    PersonId                   spouse1;
    PersonId                   spouse2;
    std::optional<std::string> marriageDate;
    int                        order = 1; ///< lower order = earlier/primary marriage of a spouse

    [[nodiscard]] bool involves(std::string_view personId) const noexcept { return spouse1 == personId || spouse2 == personId; }

    /// the other participant; `spouse1` if `personId` takes no part in this marriage
    [[nodiscard]] const PersonId& spouseOf(std::string_view personId) const noexcept { return spouse1 == personId ? spouse2 : spouse1; }
};

struct ParentChild {
    PersonId                  parent;
    PersonId                  child;
    std::optional<MarriageId> marriage; ///< union that produced the child, if known
};

/**
 * @brief point-in-time snapshot of a family tree
 *
 * Persons and marriages keep their insertion order, which is the order the layout uses for
 * tie-breaking and for the placement of unconnected persons. Person identifiers are unique.
 */
struct FamilyTree {
    std::vector<Person>                             persons;
    std::vector<Marriage>                           marriages;
    std::vector<ParentChild>                        parentChild;
    std::map<std::string, std::string, std::less<>> metadata;

    [[nodiscard]] const Person* findPerson(std::string_view personId) const noexcept {
        auto it = std::ranges::find(persons, personId, &Person::id);
        return it == persons.end() ? nullptr : std::addressof(*it);
    }

    [[nodiscard]] Person* findPerson(std::string_view personId) noexcept {
        auto it = std::ranges::find(persons, personId, &Person::id);
        return it == persons.end() ? nullptr : std::addressof(*it);
    }

    [[nodiscard]] const Marriage* findMarriage(std::string_view marriageId) const noexcept {
        auto it = std::ranges::find(marriages, marriageId, &Marriage::id);
        return it == marriages.end() ? nullptr : std::addressof(*it);
    }

    [[nodiscard]] bool contains(std::string_view personId) const noexcept { return findPerson(personId) != nullptr; }
};

} // namespace kin

template<>
struct fmt::formatter<kin::Position> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const kin::Position& pos, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({}, {})", pos.x, pos.y);
    }
};

namespace kin {
inline std::ostream& operator<<(std::ostream& os, const Position& pos) { return os << fmt::format("{}", pos); }
} // namespace kin

#endif // KINSHIP_FAMILY_TREE_HPP
