#include <kinship/RelationshipIndex.hpp>

#include <algorithm>

namespace kin {

RelationshipIndex::RelationshipIndex(const FamilyTree& tree) {
    std::map<MarriageId, const Marriage*, std::less<>> marriageById;

    for (const Marriage& marriage : tree.marriages) {
        _marriagesByPerson[marriage.spouse1].push_back(&marriage);
        if (marriage.spouse2 != marriage.spouse1) {
            _marriagesByPerson[marriage.spouse2].push_back(&marriage);
        }
        _childrenByMarriage.try_emplace(marriage.id);
        marriageById.try_emplace(marriage.id, &marriage);
    }

    for (auto& [_, marriages] : _marriagesByPerson) {
        std::ranges::stable_sort(marriages, std::less<>{}, [](const Marriage* m) { return m->order; });
    }

    for (const ParentChild& link : tree.parentChild) {
        if (link.marriage) {
            if (auto it = marriageById.find(*link.marriage); it != marriageById.end()) {
                _childrenByMarriage[it->first].insert(link.child);
                if (it->second->involves(link.parent)) {
                    continue;
                }
            }
        }
        _childrenByParent[link.parent].insert(link.child); // no (usable) marriage reference
    }
}

std::span<const Marriage* const> RelationshipIndex::marriagesOf(std::string_view personId) const noexcept {
    if (auto it = _marriagesByPerson.find(personId); it != _marriagesByPerson.end()) {
        return it->second;
    }
    return {};
}

std::span<const PersonId> RelationshipIndex::childrenOfMarriage(std::string_view marriageId) const noexcept {
    if (auto it = _childrenByMarriage.find(marriageId); it != _childrenByMarriage.end()) {
        return it->second.values();
    }
    return {};
}

std::span<const PersonId> RelationshipIndex::childrenOfParent(std::string_view personId) const noexcept {
    if (auto it = _childrenByParent.find(personId); it != _childrenByParent.end()) {
        return it->second.values();
    }
    return {};
}

} // namespace kin
