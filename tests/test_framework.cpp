#include <gtest/gtest.h>
#include "framework/argumentation_framework.hpp"

using namespace rebut;

// ─── Node operations ───────────────────────────────────────────

TEST(FrameworkTest, AddNodes) {
    ArgumentationFramework af;
    af.addNode(1, "original");
    af.addNode(2);
    ASSERT_EQ(af.nodeCount(), 2);
    EXPECT_TRUE(af.contains(1));
    EXPECT_TRUE(af.contains(2));
    EXPECT_FALSE(af.contains(3));
}

TEST(FrameworkTest, DuplicateNodeThrows) {
    ArgumentationFramework af;
    af.addNode(7);
    try {
        af.addNode(7);
        FAIL() << "expected ArgumentationError";
    } catch (const ArgumentationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DUPLICATE_NODE);
        EXPECT_EQ(e.node(), 7u);
    }
    EXPECT_EQ(af.nodeCount(), 1);
}

TEST(FrameworkTest, EnsureNodeIsIdempotent) {
    ArgumentationFramework af;
    EXPECT_TRUE(af.ensureNode(4, "conclusion"));
    EXPECT_FALSE(af.ensureNode(4, "other"));
    EXPECT_EQ(af.nodeCount(), 1);
    EXPECT_EQ(af.label(4), "conclusion");
}

TEST(FrameworkTest, LabelDefaultsToReference) {
    ArgumentationFramework af;
    af.addNode(42);
    EXPECT_EQ(af.label(42), "42");
}

TEST(FrameworkTest, NodesAreOrdered) {
    ArgumentationFramework af;
    af.addNode(30);
    af.addNode(10);
    af.addNode(20);
    ArgumentSet expected{10, 20, 30};
    EXPECT_EQ(af.nodes(), expected);

    std::vector<ArgumentRef> visited;
    af.forEachNode([&](ArgumentRef ref) { visited.push_back(ref); });
    EXPECT_EQ(visited, (std::vector<ArgumentRef>{10, 20, 30}));
}

// ─── Attack operations ─────────────────────────────────────────

TEST(FrameworkTest, AddAttack) {
    ArgumentationFramework af;
    af.addNode(1);
    af.addNode(2);
    af.addAttack(2, 1);
    EXPECT_EQ(af.attackCount(), 1);
    EXPECT_TRUE(af.attacks(2, 1));
    EXPECT_FALSE(af.attacks(1, 2));
}

TEST(FrameworkTest, UnknownAttackerThrows) {
    ArgumentationFramework af;
    af.addNode(1);
    try {
        af.addAttack(9, 1);
        FAIL() << "expected ArgumentationError";
    } catch (const ArgumentationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNKNOWN_NODE);
        EXPECT_EQ(e.node(), 9u);
    }
    EXPECT_EQ(af.attackCount(), 0);
}

TEST(FrameworkTest, UnknownTargetThrows) {
    ArgumentationFramework af;
    af.addNode(1);
    EXPECT_THROW(af.addAttack(1, 5), ArgumentationError);
}

TEST(FrameworkTest, DuplicateAttacksCollapse) {
    ArgumentationFramework af;
    af.addNode(1);
    af.addNode(2);
    af.addAttack(1, 2);
    af.addAttack(1, 2);
    EXPECT_EQ(af.attackCount(), 1);
    EXPECT_EQ(af.attacks().size(), 1u);
}

TEST(FrameworkTest, SelfAttackPermitted) {
    ArgumentationFramework af;
    af.addNode(1);
    af.addAttack(1, 1);
    EXPECT_TRUE(af.attacks(1, 1));
    EXPECT_EQ(af.attackersOf(1), (ArgumentSet{1}));
}

// ─── Adjacency queries ────────────────────────────────────────

TEST(FrameworkTest, AttackersAndTargets) {
    ArgumentationFramework af;
    for (ArgumentRef r = 1; r <= 4; r++) af.addNode(r);
    af.addAttack(2, 1);
    af.addAttack(3, 1);
    af.addAttack(3, 4);

    EXPECT_EQ(af.attackersOf(1), (ArgumentSet{2, 3}));
    EXPECT_EQ(af.attackedBy(3), (ArgumentSet{1, 4}));
    EXPECT_TRUE(af.attackersOf(2).empty());
    EXPECT_TRUE(af.attackersOf(99).empty());  // unknown reads as empty
}

TEST(FrameworkTest, AttacksListedInOrder) {
    ArgumentationFramework af;
    for (ArgumentRef r = 1; r <= 3; r++) af.addNode(r);
    af.addAttack(3, 1);
    af.addAttack(1, 2);
    af.addAttack(2, 3);

    auto edges = af.attacks();
    ASSERT_EQ(edges.size(), 3u);
    EXPECT_EQ(edges[0], AttackEdge(1, 2));
    EXPECT_EQ(edges[1], AttackEdge(2, 3));
    EXPECT_EQ(edges[2], AttackEdge(3, 1));
}

TEST(FrameworkTest, ErrorKindNames) {
    EXPECT_EQ(toString(ErrorKind::DUPLICATE_NODE), "DuplicateNode");
    EXPECT_EQ(toString(ErrorKind::UNKNOWN_NODE), "UnknownNode");
    EXPECT_EQ(toString(ErrorKind::TOO_LARGE), "TooLarge");
}
