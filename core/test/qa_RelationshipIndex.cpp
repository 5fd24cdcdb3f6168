#include <boost/ut.hpp>

#include <string>
#include <vector>

#include <kinship/RelationshipIndex.hpp>
#include <kinship/meta/UnitTestHelper.hpp>

namespace {
std::vector<std::string> ids(std::span<const kin::PersonId> span) { return {span.begin(), span.end()}; }

std::vector<std::string> marriageIds(std::span<const kin::Marriage* const> span) {
    std::vector<std::string> result;
    for (const kin::Marriage* marriage : span) {
        result.push_back(marriage->id);
    }
    return result;
}
} // namespace

const boost::ut::suite<"RelationshipIndex"> relationshipIndexTests = [] {
    using namespace boost::ut;
    using kin::test::eq_collections;
    using Ids = std::vector<std::string>;

    "marriages are sorted by order, ties keep snapshot order"_test = [] {
        kin::FamilyTree tree;
        tree.marriages = {
            {.id = "third", .spouse1 = "P", .spouse2 = "Z", .order = 3},
            {.id = "firstA", .spouse1 = "X", .spouse2 = "P", .order = 1},
            {.id = "second", .spouse1 = "P", .spouse2 = "Y", .order = 2},
            {.id = "firstB", .spouse1 = "P", .spouse2 = "W", .order = 1},
        };
        const kin::RelationshipIndex index(tree);

        expect(eq_collections(marriageIds(index.marriagesOf("P")), Ids{"firstA", "firstB", "second", "third"}));
        expect(eq_collections(marriageIds(index.marriagesOf("Y")), Ids{"second"}));
        expect(index.marriagesOf("unknown").empty());
    };

    "self-marriage is listed once"_test = [] {
        kin::FamilyTree tree;
        tree.marriages = {{.id = "m", .spouse1 = "P", .spouse2 = "P"}};
        const kin::RelationshipIndex index(tree);
        expect(eq(index.marriagesOf("P").size(), 1UZ));
    };

    "children of a marriage are unique and keep insertion order"_test = [] {
        kin::FamilyTree tree;
        tree.marriages   = {{.id = "m1", .spouse1 = "A", .spouse2 = "B"}, {.id = "m2", .spouse1 = "A", .spouse2 = "C"}};
        tree.parentChild = {
            {.parent = "A", .child = "K2", .marriage = "m1"},
            {.parent = "B", .child = "K1", .marriage = "m1"},
            {.parent = "B", .child = "K2", .marriage = "m1"},
            {.parent = "A", .child = "K1", .marriage = "m1"},
        };
        const kin::RelationshipIndex index(tree);

        expect(eq_collections(ids(index.childrenOfMarriage("m1")), Ids{"K2", "K1"}));
        expect(index.childrenOfMarriage("m2").empty()) << "known marriage without children";
        expect(index.childrenOfMarriage("m3").empty()) << "unknown marriage";
        expect(index.childrenOfParent("A").empty()) << "all of A's children are recorded against its marriage";
        expect(index.childrenOfParent("B").empty());
    };

    "records without a usable marriage fall back to the parent"_test = [] {
        kin::FamilyTree tree;
        tree.marriages   = {{.id = "m1", .spouse1 = "A", .spouse2 = "B"}};
        tree.parentChild = {
            {.parent = "A", .child = "direct"},
            {.parent = "A", .child = "dangling", .marriage = "no-such-marriage"},
            {.parent = "X", .child = "foreign", .marriage = "m1"},
            {.parent = "A", .child = "direct"},
        };
        const kin::RelationshipIndex index(tree);

        expect(eq_collections(ids(index.childrenOfParent("A")), Ids{"direct", "dangling"}));
        expect(eq_collections(ids(index.childrenOfParent("X")), Ids{"foreign"})) << "X is no participant of m1";
        expect(eq_collections(ids(index.childrenOfMarriage("m1")), Ids{"foreign"}));
        expect(index.childrenOfParent("nobody").empty());
    };

    "empty snapshot"_test = [] {
        const kin::FamilyTree        tree;
        const kin::RelationshipIndex index(tree);
        expect(index.marriagesOf("A").empty());
        expect(index.childrenOfMarriage("m").empty());
        expect(index.childrenOfParent("A").empty());
    };
};

int main() { /* not needed for UT */ }
