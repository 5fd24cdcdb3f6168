#ifndef KINSHIP_RELATIONSHIP_INDEX_HPP
#define KINSHIP_RELATIONSHIP_INDEX_HPP

#include <functional>
#include <map>
#include <span>
#include <string_view>
#include <vector>

#include <kinship/FamilyTree.hpp>
#include <kinship/meta/InsertionOrderedSet.hpp>

namespace kin {

/**
 * @brief read-only lookup tables over the relationships of a `FamilyTree` snapshot
 *
 *  - marriagesOf(person)         -> marriages the person takes part in, sorted by `Marriage::order` (stable)
 *  - childrenOfMarriage(id)      -> children recorded against a marriage, first-insertion order, unique
 *  - childrenOfParent(person)    -> children recorded without a usable marriage reference, first-insertion order, unique
 *
 * A parent-child record lands in `childrenOfParent` if it names no marriage, names a marriage that is not part
 * of the snapshot, or names a marriage the parent does not take part in. Unknown keys yield empty spans.
 *
 * N.B. the index refers to the marriages of the snapshot it was built from and must not outlive it.
 */
class RelationshipIndex {
    using ChildSet = meta::InsertionOrderedSet<PersonId>;

    std::map<PersonId, std::vector<const Marriage*>, std::less<>> _marriagesByPerson;
    std::map<MarriageId, ChildSet, std::less<>>                   _childrenByMarriage;
    std::map<PersonId, ChildSet, std::less<>>                     _childrenByParent;

public:
    explicit RelationshipIndex(const FamilyTree& tree);

    [[nodiscard]] std::span<const Marriage* const> marriagesOf(std::string_view personId) const noexcept;
    [[nodiscard]] std::span<const PersonId>        childrenOfMarriage(std::string_view marriageId) const noexcept;
    [[nodiscard]] std::span<const PersonId>        childrenOfParent(std::string_view personId) const noexcept;
};

} // namespace kin

#endif // KINSHIP_RELATIONSHIP_INDEX_HPP
