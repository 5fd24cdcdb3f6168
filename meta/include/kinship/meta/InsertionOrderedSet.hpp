#ifndef KINSHIP_INSERTION_ORDERED_SET_HPP
#define KINSHIP_INSERTION_ORDERED_SET_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <set>
#include <span>
#include <vector>

namespace kin::meta {

/**
 * @brief set of unique values that iterates in first-insertion order.
 *
 * Re-inserting a known value is a no-op and keeps its original position. Lookups accept any type
 * comparable with `T` (e.g. `std::string_view` for a set of `std::string`).
 */
template<typename T, typename Compare = std::less<>>
class InsertionOrderedSet {
    std::vector<T>       _ordered;
    std::set<T, Compare> _lookup;

public:
    using value_type     = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    InsertionOrderedSet() = default;
    InsertionOrderedSet(std::initializer_list<T> init) {
        for (const auto& value : init) {
            insert(value);
        }
    }

    /// @return true if `value` was not yet part of the set
    bool insert(const T& value) {
        if (!_lookup.insert(value).second) {
            return false;
        }
        _ordered.push_back(value);
        return true;
    }

    template<typename K>
    [[nodiscard]] bool contains(const K& key) const {
        return _lookup.find(key) != _lookup.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return _ordered.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _ordered.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return _ordered.cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return _ordered.cend(); }

    [[nodiscard]] std::span<const T> values() const noexcept { return _ordered; }

    void clear() noexcept {
        _ordered.clear();
        _lookup.clear();
    }
};

} // namespace kin::meta

#endif // KINSHIP_INSERTION_ORDERED_SET_HPP
