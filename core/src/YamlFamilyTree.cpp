#include <kinship/YamlFamilyTree.hpp>
#include <kinship/YamlUtils.hpp>

#include <fstream>
#include <functional>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace kin {

namespace {

// calls `fun(key, entry)` for each entry of a map section (key = map key) or a sequence section (key = "")
template<typename Fun>
std::expected<void, Error> forEachEntry(const YAML::Node& root, const char* section, Fun&& fun) {
    const YAML::Node node = root[section];
    if (!node || node.IsNull()) {
        return {};
    }
    if (node.IsMap()) {
        for (const auto& kv : node) {
            if (auto result = fun(kv.first.as<std::string>(), kv.second); !result) {
                return result;
            }
        }
        return {};
    }
    if (node.IsSequence()) {
        for (const auto& entry : node) {
            if (auto result = fun(std::string{}, entry); !result) {
                return result;
            }
        }
        return {};
    }
    return std::unexpected(Error(fmt::format("section '{}' must be a map or a sequence", section)));
}

std::expected<std::string, Error> requiredString(const YAML::Node& node, const char* key, std::string_view context) {
    auto value = detail::optionalValue<std::string>(node, key);
    if (!value || value->empty()) {
        return std::unexpected(Error(fmt::format("{}: missing required field '{}'", context, key)));
    }
    return *value;
}

std::expected<Person, Error> parsePerson(std::string_view key, const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::unexpected(Error(fmt::format("person '{}' must be a map", key)));
    }
    Person person;
    person.id = detail::optionalValue<std::string>(node, "id").value_or(std::string(key));
    if (person.id.empty()) {
        return std::unexpected(Error("person without 'id'"));
    }

    auto name = requiredString(node, "name", fmt::format("person '{}'", person.id));
    if (!name) {
        return std::unexpected(name.error());
    }
    person.name = std::move(*name);

    if (auto gender = detail::optionalValue<std::string>(node, "gender")) {
        auto parsed = parseGender(*gender);
        if (!parsed) {
            return std::unexpected(Error(fmt::format("person '{}': {}", person.id, parsed.error().message)));
        }
        person.gender = *parsed;
    }
    person.dateOfBirth = detail::optionalValue<std::string>(node, "date_of_birth");
    person.dateOfDeath = detail::optionalValue<std::string>(node, "date_of_death");
    person.photoPath   = detail::optionalValue<std::string>(node, "photo_path");
    person.notes       = detail::optionalValue<std::string>(node, "notes");
    person.position.x  = detail::optionalValue<double>(node, "x").value_or(0.0);
    person.position.y  = detail::optionalValue<double>(node, "y").value_or(0.0);
    return person;
}

std::expected<Marriage, Error> parseMarriage(std::string_view key, const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::unexpected(Error(fmt::format("marriage '{}' must be a map", key)));
    }
    Marriage marriage;
    marriage.id = detail::optionalValue<std::string>(node, "id").value_or(std::string(key));
    if (marriage.id.empty()) {
        return std::unexpected(Error("marriage without 'id'"));
    }

    const std::string context = fmt::format("marriage '{}'", marriage.id);
    auto              spouse1 = requiredString(node, "spouse1_id", context);
    if (!spouse1) {
        return std::unexpected(spouse1.error());
    }
    auto spouse2 = requiredString(node, "spouse2_id", context);
    if (!spouse2) {
        return std::unexpected(spouse2.error());
    }
    marriage.spouse1      = std::move(*spouse1);
    marriage.spouse2      = std::move(*spouse2);
    marriage.marriageDate = detail::optionalValue<std::string>(node, "marriage_date");
    marriage.order        = detail::optionalValue<int>(node, "order").value_or(1);
    return marriage;
}

std::expected<ParentChild, Error> parseParentChild(std::size_t index, const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::unexpected(Error(fmt::format("parent_child[{}] must be a map", index)));
    }
    const std::string context = fmt::format("parent_child[{}]", index);
    auto              parent  = requiredString(node, "parent_id", context);
    if (!parent) {
        return std::unexpected(parent.error());
    }
    auto child = requiredString(node, "child_id", context);
    if (!child) {
        return std::unexpected(child.error());
    }
    return ParentChild{.parent = std::move(*parent), .child = std::move(*child), .marriage = detail::optionalValue<std::string>(node, "marriage_id")};
}

std::expected<std::string, Error> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(Error(fmt::format("cannot open '{}' for reading", path.string())));
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(Error(fmt::format("failed to read '{}'", path.string())));
    }
    return content.str();
}

} // namespace

std::string_view genderName(Gender gender) noexcept {
    switch (gender) {
    case Gender::Male: return "male";
    case Gender::Female: return "female";
    case Gender::Unknown:
    default: return "unknown";
    }
}

std::expected<Gender, Error> parseGender(std::string_view name) {
    if (auto gender = magic_enum::enum_cast<Gender>(name, magic_enum::case_insensitive)) {
        return *gender;
    }
    return std::unexpected(Error(fmt::format("unknown gender '{}' (expected one of: male, female, unknown)", name)));
}

std::expected<FamilyTree, Error> loadFamilyTree(std::string_view source) try {
    const YAML::Node root = YAML::Load(std::string(source));
    FamilyTree       tree;
    if (!root || root.IsNull()) {
        return tree;
    }
    if (!root.IsMap()) {
        return std::unexpected(Error("family tree document must be a map"));
    }

    std::set<PersonId, std::less<>> personIds;
    auto                            persons = forEachEntry(root, "persons", [&](const std::string& key, const YAML::Node& node) -> std::expected<void, Error> {
        auto person = parsePerson(key, node);
        if (!person) {
            return std::unexpected(person.error());
        }
        if (!personIds.insert(person->id).second) {
            return std::unexpected(Error(fmt::format("duplicate person id '{}'", person->id)));
        }
        tree.persons.push_back(std::move(*person));
        return {};
    });
    if (!persons) {
        return std::unexpected(persons.error());
    }

    auto marriages = forEachEntry(root, "marriages", [&](const std::string& key, const YAML::Node& node) -> std::expected<void, Error> {
        auto marriage = parseMarriage(key, node);
        if (!marriage) {
            return std::unexpected(marriage.error());
        }
        tree.marriages.push_back(std::move(*marriage));
        return {};
    });
    if (!marriages) {
        return std::unexpected(marriages.error());
    }

    if (const YAML::Node links = root["parent_child"]; links && !links.IsNull()) {
        if (!links.IsSequence()) {
            return std::unexpected(Error("section 'parent_child' must be a sequence"));
        }
        for (std::size_t i = 0UZ; i < links.size(); ++i) {
            auto link = parseParentChild(i, links[i]);
            if (!link) {
                return std::unexpected(link.error());
            }
            tree.parentChild.push_back(std::move(*link));
        }
    }

    if (const YAML::Node metadata = root["metadata"]; metadata && metadata.IsMap()) {
        for (const auto& kv : metadata) {
            tree.metadata.insert_or_assign(kv.first.as<std::string>(), kv.second.IsScalar() ? kv.second.as<std::string>() : YAML::Dump(kv.second));
        }
    }
    return tree;
} catch (const YAML::Exception& ex) {
    return std::unexpected(Error(fmt::format("malformed family tree document: {}", ex.what())));
}

std::expected<FamilyTree, Error> loadFamilyTreeFile(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return loadFamilyTree(*content);
}

std::string saveFamilyTree(const FamilyTree& tree) {
    YAML::Emitter out;
    {
        detail::YamlMap root(out);
        root.writeFn("persons", [&] {
            detail::YamlMap persons(out);
            for (const Person& person : tree.persons) {
                persons.writeFn(person.id, [&] {
                    detail::YamlMap map(out);
                    map.write("id", person.id);
                    map.write("name", person.name);
                    map.write("gender", genderName(person.gender));
                    map.write("date_of_birth", person.dateOfBirth);
                    map.write("date_of_death", person.dateOfDeath);
                    map.write("photo_path", person.photoPath);
                    map.write("notes", person.notes);
                    map.write("x", person.position.x);
                    map.write("y", person.position.y);
                });
            }
        });
        root.writeFn("marriages", [&] {
            detail::YamlMap marriages(out);
            for (const Marriage& marriage : tree.marriages) {
                marriages.writeFn(marriage.id, [&] {
                    detail::YamlMap map(out);
                    map.write("id", marriage.id);
                    map.write("spouse1_id", marriage.spouse1);
                    map.write("spouse2_id", marriage.spouse2);
                    map.write("marriage_date", marriage.marriageDate);
                    map.write("order", marriage.order);
                });
            }
        });
        root.writeFn("parent_child", [&] {
            detail::YamlSeq links(out);
            for (const ParentChild& link : tree.parentChild) {
                links.writeFn([&] {
                    detail::YamlMap map(out);
                    map.write("parent_id", link.parent);
                    map.write("child_id", link.child);
                    map.write("marriage_id", link.marriage);
                });
            }
        });
        root.writeFn("metadata", [&] {
            detail::YamlMap metadata(out);
            for (const auto& [key, value] : tree.metadata) {
                metadata.write(key, value);
            }
        });
    }
    return out.c_str();
}

std::expected<void, Error> saveFamilyTreeFile(const std::filesystem::path& path, const FamilyTree& tree) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(Error(fmt::format("cannot open '{}' for writing", path.string())));
    }
    file << saveFamilyTree(tree) << '\n';
    if (!file.flush()) {
        return std::unexpected(Error(fmt::format("failed to write '{}'", path.string())));
    }
    return {};
}

std::expected<LayoutOptions, Error> loadLayoutOptions(std::string_view source, LayoutOptions defaults) try {
    const YAML::Node root    = YAML::Load(std::string(source));
    LayoutOptions    options = std::move(defaults);
    if (root && !root.IsNull()) {
        if (!root.IsMap()) {
            return std::unexpected(Error("layout options document must be a map"));
        }
        if (auto direction = detail::optionalValue<std::string>(root, "direction")) {
            auto parsed = parseDirection(*direction);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            options.direction = *parsed;
        }
        options.rootPersonId = detail::optionalValue<std::string>(root, "root_person_id").value_or(options.rootPersonId);
        options.spacingX     = detail::optionalValue<double>(root, "spacing_x").value_or(options.spacingX);
        options.spacingY     = detail::optionalValue<double>(root, "spacing_y").value_or(options.spacingY);
    }
    if (auto valid = options.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return options;
} catch (const YAML::Exception& ex) {
    return std::unexpected(Error(fmt::format("malformed layout options: {}", ex.what())));
}

std::expected<LayoutOptions, Error> loadLayoutOptionsFile(const std::filesystem::path& path, LayoutOptions defaults) {
    auto content = readFile(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return loadLayoutOptions(*content, std::move(defaults));
}

} // namespace kin
