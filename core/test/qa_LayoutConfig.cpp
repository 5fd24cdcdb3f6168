#include <boost/ut.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include <kinship/LayoutConfig.hpp>

namespace {
std::filesystem::path writeConfig(std::string_view name, std::string_view content) {
    const auto    path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::trunc);
    file << content;
    return path;
}

kin::FamilyTree treeWithRootMetadata(std::string rootId) {
    kin::FamilyTree tree;
    tree.persons = {{.id = "A", .name = "A"}, {.id = "B", .name = "B"}, {.id = "C", .name = "C"}};
    tree.metadata.insert_or_assign("root_person_id", std::move(rootId));
    return tree;
}
} // namespace

const boost::ut::suite<"layout option resolution"> layoutConfigTests = [] {
    using namespace boost::ut;
    using namespace std::string_literals;
    using kin::Direction;

    "root falls back to the tree metadata"_test = [] {
        auto options = kin::resolveLayoutOptions(treeWithRootMetadata("B"), {});
        expect(eq(options.has_value(), true) >> fatal);
        expect(eq(options->rootPersonId, "B"s));
        expect(options->direction == Direction::TopDown);
        expect(eq(options->spacingX, 200.0));
        expect(eq(options->spacingY, 150.0));
    };

    "root precedence: override, options file, metadata"_test = [] {
        const auto config = writeConfig("kinship_qa_root.yaml", "root_person_id: C\n");
        const auto tree   = treeWithRootMetadata("B");

        auto fromConfig = kin::resolveLayoutOptions(tree, {.configPath = config});
        expect(eq(fromConfig.has_value(), true) >> fatal);
        expect(eq(fromConfig->rootPersonId, "C"s));

        auto fromOverride = kin::resolveLayoutOptions(tree, {.configPath = config, .root = "A"});
        expect(eq(fromOverride.has_value(), true) >> fatal);
        expect(eq(fromOverride->rootPersonId, "A"s));
        std::filesystem::remove(config);
    };

    "overrides win over the options file"_test = [] {
        const auto config  = writeConfig("kinship_qa_override.yaml", "direction: left-right\nspacing_x: 80\nspacing_y: 40\n");
        auto       options = kin::resolveLayoutOptions(treeWithRootMetadata("A"), {.configPath = config, .direction = "top-down", .spacingX = "12.5"});
        std::filesystem::remove(config);

        expect(eq(options.has_value(), true) >> fatal);
        expect(options->direction == Direction::TopDown);
        expect(eq(options->spacingX, 12.5));
        expect(eq(options->spacingY, 40.0)) << "not overridden";
    };

    "missing root"_test = [] {
        kin::FamilyTree tree;
        tree.persons = {{.id = "A", .name = "A"}};
        auto options = kin::resolveLayoutOptions(tree, {.direction = "left-right"});
        expect(eq(options.has_value(), false) >> fatal);
        expect(options.error().message.starts_with("no root person given"));
    };

    "invalid overrides"_test = [] {
        const auto tree = treeWithRootMetadata("A");

        auto nonNumeric = kin::resolveLayoutOptions(tree, {.spacingX = "wide"});
        expect(eq(nonNumeric.has_value(), false) >> fatal);
        expect(eq(nonNumeric.error().message, "--spacing-x: 'wide' is not a number"s));

        expect(!kin::resolveLayoutOptions(tree, {.spacingX = "10px"}).has_value()) << "trailing characters";
        expect(!kin::resolveLayoutOptions(tree, {.spacingY = ""}).has_value());
        expect(!kin::resolveLayoutOptions(tree, {.spacingY = "0"}).has_value()) << "must be positive";
        expect(!kin::resolveLayoutOptions(tree, {.direction = "upwards"}).has_value());
        expect(!kin::resolveLayoutOptions(tree, {.configPath = std::filesystem::temp_directory_path() / "kinship_qa_missing" / "options.yaml"}).has_value());
    };

    "parseSpacing"_test = [] {
        expect(eq(kin::parseSpacing("spacing", "150").value(), 150.0));
        expect(eq(kin::parseSpacing("spacing", "0.25").value(), 0.25));
        expect(!kin::parseSpacing("spacing", "1e").has_value());
    };
};

int main() { /* not needed for UT */ }
