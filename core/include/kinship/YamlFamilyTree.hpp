#ifndef KINSHIP_YAML_FAMILY_TREE_HPP
#define KINSHIP_YAML_FAMILY_TREE_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include <kinship/Error.hpp>
#include <kinship/FamilyTree.hpp>
#include <kinship/LayoutOptions.hpp>

namespace kin {

/**
 * @brief family tree documents
 *
 * @code
 * persons:
 *   <id>: { id, name, gender, date_of_birth, date_of_death, photo_path, notes, x, y }
 * marriages:
 *   <id>: { id, spouse1_id, spouse2_id, marriage_date, order }
 * parent_child:
 *   - { parent_id, child_id, marriage_id }
 * metadata: { <key>: <value> }
 * @endcode
 *
 * JSON documents of the same shape are accepted as well. Missing sections are empty, a person or marriage without
 * `id` takes its map key, `null` marks an absent optional field. `persons` and `marriages` may also be given as
 * sequences, in which case `id` is mandatory.
 *
 * Metadata values are kept as text: scalars verbatim, `null`, sequences and maps as their YAML representation
 * (e.g. `~` for null). Saving writes every metadata value back as a string scalar, so such values stay text.
 */
[[nodiscard]] std::expected<FamilyTree, Error> loadFamilyTree(std::string_view source);
[[nodiscard]] std::expected<FamilyTree, Error> loadFamilyTreeFile(const std::filesystem::path& path);

[[nodiscard]] std::string                saveFamilyTree(const FamilyTree& tree);
[[nodiscard]] std::expected<void, Error> saveFamilyTreeFile(const std::filesystem::path& path, const FamilyTree& tree);

[[nodiscard]] std::string_view genderName(Gender gender) noexcept;
[[nodiscard]] std::expected<Gender, Error> parseGender(std::string_view name);

/// reads `direction`, `root_person_id`, `spacing_x` and `spacing_y` on top of `defaults`, unknown keys are ignored
[[nodiscard]] std::expected<LayoutOptions, Error> loadLayoutOptions(std::string_view source, LayoutOptions defaults = {});
[[nodiscard]] std::expected<LayoutOptions, Error> loadLayoutOptionsFile(const std::filesystem::path& path, LayoutOptions defaults = {});

} // namespace kin

#endif // KINSHIP_YAML_FAMILY_TREE_HPP
