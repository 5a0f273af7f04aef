#include <gtest/gtest.h>
#include "framework/argumentation_framework.hpp"
#include "semantics/extension.hpp"
#include "semantics/extension_calculator.hpp"

#include <utility>
#include <vector>

using namespace rebut;

namespace {

ArgumentationFramework makeFramework(size_t nodes,
                                     const std::vector<std::pair<ArgumentRef, ArgumentRef>>& attacks) {
    ArgumentationFramework af;
    for (ArgumentRef r = 1; r <= nodes; r++) af.addNode(r);
    for (const auto& [from, to] : attacks) af.addAttack(from, to);
    return af;
}

std::vector<ArgumentSet> membersOf(const std::vector<Extension>& extensions) {
    std::vector<ArgumentSet> out;
    for (const auto& e : extensions) out.push_back(e.members);
    return out;
}

} // namespace

// ─── Basic frameworks ──────────────────────────────────────────

TEST(SemanticsTest, EmptyFramework) {
    ArgumentationFramework af;
    ExtensionCalculator calc(af);
    EXPECT_TRUE(calc.grounded().empty());

    auto complete = calc.completeExtensions();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_TRUE(complete[0].empty());
}

TEST(SemanticsTest, IsolatedNode) {
    auto af = makeFramework(1, {});
    ExtensionCalculator calc(af);
    EXPECT_EQ(calc.grounded().members, (ArgumentSet{1}));
    EXPECT_EQ(membersOf(calc.completeExtensions()), (std::vector<ArgumentSet>{{1}}));
}

TEST(SemanticsTest, SingleDirectedAttack) {
    // 2 → 1
    auto af = makeFramework(2, {{2, 1}});
    ExtensionCalculator calc(af);

    Extension g = calc.grounded();
    EXPECT_EQ(g.kind, ExtensionKind::GROUNDED);
    EXPECT_EQ(g.members, (ArgumentSet{2}));

    auto complete = calc.completeExtensions();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].kind, ExtensionKind::COMPLETE);
    EXPECT_EQ(complete[0].members, (ArgumentSet{2}));
}

TEST(SemanticsTest, SymmetricMutualAttack) {
    auto af = makeFramework(2, {{1, 2}, {2, 1}});
    ExtensionCalculator calc(af);
    EXPECT_TRUE(calc.grounded().empty());
    EXPECT_EQ(membersOf(calc.completeExtensions()),
              (std::vector<ArgumentSet>{{}, {1}, {2}}));
}

TEST(SemanticsTest, SelfAttack) {
    auto af = makeFramework(1, {{1, 1}});
    ExtensionCalculator calc(af);
    EXPECT_TRUE(calc.grounded().empty());
    EXPECT_EQ(membersOf(calc.completeExtensions()), (std::vector<ArgumentSet>{{}}));
}

TEST(SemanticsTest, ReinstatementChain) {
    // 1 → 2 → 3: 1 defends 3
    auto af = makeFramework(3, {{1, 2}, {2, 3}});
    ExtensionCalculator calc(af);
    EXPECT_EQ(calc.grounded().members, (ArgumentSet{1, 3}));
    EXPECT_EQ(membersOf(calc.completeExtensions()), (std::vector<ArgumentSet>{{1, 3}}));
}

TEST(SemanticsTest, OddCycle) {
    auto af = makeFramework(3, {{1, 2}, {2, 3}, {3, 1}});
    ExtensionCalculator calc(af);
    EXPECT_TRUE(calc.grounded().empty());
    EXPECT_EQ(membersOf(calc.completeExtensions()), (std::vector<ArgumentSet>{{}}));
}

TEST(SemanticsTest, DisconnectedMutualPairs) {
    // Two independent 2-cycles: 3 × 3 complete extensions
    auto af = makeFramework(4, {{1, 2}, {2, 1}, {3, 4}, {4, 3}});
    ExtensionCalculator calc(af);
    EXPECT_EQ(calc.completeExtensions().size(), 9u);
}

TEST(SemanticsTest, MutualAttackWithUnattackedDefender) {
    // 3 attacks 2 inside the 1 ↔ 2 cycle, so 1 is reinstated
    auto af = makeFramework(3, {{1, 2}, {2, 1}, {3, 2}});
    ExtensionCalculator calc(af);
    EXPECT_EQ(calc.grounded().members, (ArgumentSet{1, 3}));
    EXPECT_EQ(membersOf(calc.completeExtensions()), (std::vector<ArgumentSet>{{1, 3}}));
}

// ─── Laws ─────────────────────────────────────────────────────

TEST(SemanticsTest, GroundedIsDeterministic) {
    auto af = makeFramework(5, {{1, 2}, {2, 3}, {3, 4}, {4, 3}, {5, 5}});
    ExtensionCalculator calc(af);
    EXPECT_EQ(calc.grounded(), calc.grounded());
    EXPECT_EQ(calc.completeExtensions().size(), calc.completeExtensions().size());
}

TEST(SemanticsTest, GroundedIsSubsetOfEveryComplete) {
    std::vector<ArgumentationFramework> frameworks;
    frameworks.push_back(makeFramework(2, {{1, 2}, {2, 1}}));
    frameworks.push_back(makeFramework(4, {{1, 2}, {2, 3}, {3, 2}, {3, 4}}));
    frameworks.push_back(makeFramework(5, {{1, 2}, {2, 1}, {3, 4}, {4, 5}, {5, 3}}));
    frameworks.push_back(makeFramework(6, {{1, 2}, {2, 3}, {3, 4}, {4, 1}, {5, 6}}));

    for (const auto& af : frameworks) {
        ExtensionCalculator calc(af);
        Extension g = calc.grounded();
        auto complete = calc.completeExtensions();
        ASSERT_FALSE(complete.empty());
        for (const auto& e : complete) {
            EXPECT_TRUE(g.isSubsetOf(e));
            EXPECT_TRUE(calc.isComplete(e.members));
            EXPECT_TRUE(Labelling::fromExtension(af, e.members).isLegal(af));
        }
    }
}

TEST(SemanticsTest, CharacteristicFunction) {
    auto af = makeFramework(3, {{1, 2}, {2, 3}});
    ExtensionCalculator calc(af);
    EXPECT_EQ(calc.characteristic({}), (ArgumentSet{1}));
    EXPECT_EQ(calc.characteristic({1}), (ArgumentSet{1, 3}));
    EXPECT_EQ(calc.characteristic({1, 3}), (ArgumentSet{1, 3}));
}

// ─── Labelling ────────────────────────────────────────────────

TEST(SemanticsTest, GroundedLabelling) {
    auto af = makeFramework(5, {{1, 2}, {2, 3}, {4, 5}, {5, 4}});
    ExtensionCalculator calc(af);
    Labelling lab = calc.groundedLabelling();

    EXPECT_EQ(lab.get(1), Label::IN);
    EXPECT_EQ(lab.get(2), Label::OUT);
    EXPECT_EQ(lab.get(3), Label::IN);
    EXPECT_EQ(lab.get(4), Label::UNDEC);
    EXPECT_EQ(lab.get(5), Label::UNDEC);
    EXPECT_TRUE(lab.isLegal(af));
    EXPECT_EQ(lab.toExtension(ExtensionKind::GROUNDED), calc.grounded());
}

TEST(SemanticsTest, IllegalLabellingDetected) {
    auto af = makeFramework(2, {{1, 2}});
    Labelling lab;
    lab.set(1, Label::IN);
    lab.set(2, Label::IN);
    EXPECT_FALSE(lab.isLegal(af));

    lab.set(2, Label::UNDEC);
    EXPECT_FALSE(lab.isLegal(af));

    lab.set(2, Label::OUT);
    EXPECT_TRUE(lab.isLegal(af));
}

// ─── Predicates ───────────────────────────────────────────────

TEST(SemanticsTest, ConflictFreeAndAdmissible) {
    auto af = makeFramework(3, {{1, 2}, {2, 1}, {3, 1}});
    ExtensionCalculator calc(af);

    EXPECT_FALSE(calc.isConflictFree({1, 2}));
    EXPECT_TRUE(calc.isConflictFree({1}));
    EXPECT_FALSE(calc.isAdmissible({1}));     // 3 is undefended against
    EXPECT_TRUE(calc.isAdmissible({2}));
    EXPECT_TRUE(calc.isAdmissible({}));
    EXPECT_FALSE(calc.isComplete({2}));       // misses unattacked 3
    EXPECT_TRUE(calc.isComplete({2, 3}));
}

TEST(SemanticsTest, CredulousAndSkepticalAcceptance) {
    auto af = makeFramework(3, {{1, 2}, {2, 1}});
    ExtensionCalculator calc(af);
    EXPECT_TRUE(calc.isCredulouslyAccepted(1));
    EXPECT_FALSE(calc.isSkepticallyAccepted(1));
    EXPECT_TRUE(calc.isCredulouslyAccepted(3));
    EXPECT_TRUE(calc.isSkepticallyAccepted(3));
}

// ─── Limits ───────────────────────────────────────────────────

TEST(SemanticsTest, EnumerationCapEnforced) {
    auto af = makeFramework(33, {});
    ExtensionCalculator calc(af);
    EXPECT_FALSE(calc.canEnumerate());

    try {
        calc.completeExtensions();
        FAIL() << "expected ArgumentationError";
    } catch (const ArgumentationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TOO_LARGE);
    }

    // Grounded stays available above the cap
    EXPECT_EQ(calc.grounded().size(), 33u);
}

TEST(SemanticsTest, ConfiguredCap) {
    auto af = makeFramework(3, {{1, 2}});
    CalculatorConfig config;
    config.max_enumeration_nodes = 2;
    ExtensionCalculator calc(af, config);
    EXPECT_FALSE(calc.canEnumerate());
    EXPECT_THROW(calc.completeExtensions(), ArgumentationError);
    EXPECT_THROW(calc.isCredulouslyAccepted(1), ArgumentationError);
}

TEST(SemanticsTest, StepBudgetExhaustion) {
    auto af = makeFramework(6, {{1, 2}, {2, 1}, {3, 4}, {4, 3}, {5, 6}, {6, 5}});
    CalculatorConfig config;
    config.max_search_steps = 4;
    ExtensionCalculator calc(af, config);
    ASSERT_TRUE(calc.canEnumerate());

    try {
        calc.completeExtensions();
        FAIL() << "expected ArgumentationError";
    } catch (const ArgumentationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TOO_LARGE);
    }
}

TEST(SemanticsTest, StepBudgetMatchingSearchSucceeds) {
    // One isolated argument: grounded decides it, the search is one leaf
    auto single = makeFramework(1, {});
    CalculatorConfig one_step;
    one_step.max_search_steps = 1;
    EXPECT_EQ(ExtensionCalculator(single, one_step).completeExtensions().size(), 1u);

    // Mutual attack: root, two include/exclude levels, three leaves = 6 steps
    auto pair = makeFramework(2, {{1, 2}, {2, 1}});
    CalculatorConfig exact;
    exact.max_search_steps = 6;
    EXPECT_EQ(ExtensionCalculator(pair, exact).completeExtensions().size(), 3u);

    CalculatorConfig short_by_one;
    short_by_one.max_search_steps = 5;
    ExtensionCalculator starved(pair, short_by_one);
    try {
        starved.completeExtensions();
        FAIL() << "expected ArgumentationError";
    } catch (const ArgumentationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TOO_LARGE);
    }
}

TEST(SemanticsTest, TimeBudgetExhaustion) {
    // 8 independent mutual pairs give 3^8 complete extensions
    std::vector<std::pair<ArgumentRef, ArgumentRef>> attacks;
    for (ArgumentRef a = 1; a <= 16; a += 2) {
        attacks.push_back({a, a + 1});
        attacks.push_back({a + 1, a});
    }
    auto af = makeFramework(16, attacks);
    CalculatorConfig config;
    config.budget_seconds = 1e-9;
    ExtensionCalculator calc(af, config);
    ASSERT_TRUE(calc.canEnumerate());

    try {
        calc.completeExtensions();
        FAIL() << "expected ArgumentationError";
    } catch (const ArgumentationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TOO_LARGE);
    }
    EXPECT_FALSE(calc.tryCompleteExtensions().has_value());
}

TEST(SemanticsTest, TryCompleteExtensionsReportsRefusal) {
    auto pair = makeFramework(2, {{1, 2}, {2, 1}});

    auto complete = ExtensionCalculator(pair).tryCompleteExtensions();
    ASSERT_TRUE(complete.has_value());
    EXPECT_EQ(membersOf(*complete),
              (std::vector<ArgumentSet>{{}, {1}, {2}}));

    CalculatorConfig capped;
    capped.max_enumeration_nodes = 1;
    EXPECT_FALSE(ExtensionCalculator(pair, capped).tryCompleteExtensions().has_value());

    CalculatorConfig starved;
    starved.max_search_steps = 2;
    EXPECT_FALSE(ExtensionCalculator(pair, starved).tryCompleteExtensions().has_value());
}

TEST(SemanticsTest, EnumerationAtCapSucceeds) {
    // 32 isolated arguments are all grounded; nothing left to branch on
    auto af = makeFramework(32, {});
    ExtensionCalculator calc(af);
    ASSERT_TRUE(calc.canEnumerate());
    auto complete = calc.completeExtensions();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].size(), 32u);
}

TEST(SemanticsTest, KindNames) {
    EXPECT_EQ(toString(ExtensionKind::GROUNDED), "grounded");
    EXPECT_EQ(toString(ExtensionKind::COMPLETE), "complete");
    EXPECT_EQ(toString(Label::UNDEC), "UNDEC");
}
