#pragma once

#include "attack/counter_argument.hpp"
#include "framework/argumentation_framework.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rebut {

/// One counter-argument node to place in the attack graph.
struct CounterNode {
    ArgumentRef ref = 0;
    CounterArgumentType type = CounterArgumentType::DIRECT_REFUTATION;
    std::string label;

    CounterNode() = default;
    CounterNode(ArgumentRef ref, CounterArgumentType type, std::string label = "")
        : ref(ref), type(type), label(std::move(label)) {}
};

/// An AF together with the roles of its nodes.
struct AttackGraph {
    ArgumentationFramework framework;
    ArgumentRef original = 0;
    std::vector<ArgumentRef> counters;
    std::optional<ArgumentRef> conclusion;  // set when an alternative explanation was added
};

// ─── AttackGraphBuilder ────────────────────────────────────────
// Translates (original, [(counter, type)]) into an AF using a fixed
// per-type attack pattern:
//
//   direct_refutation, premise_challenge,
//   counter_example, reductio_ad_absurdum   counter → original
//   alternative_explanation                  original → conclusion,
//                                            counter  → conclusion
//
// The alternative-explanation pattern is kept for compatibility with
// existing results. Both sides attack a shared auxiliary "conclusion"
// node instead of competing with each other, so such a counter never
// defeats the original.
//
// Counters never attack each other. Duplicate references surface as
// ArgumentationError(DUPLICATE_NODE) from build().

class AttackGraphBuilder {
public:
    explicit AttackGraphBuilder(ArgumentRef original,
                                const std::string& label = "original");

    AttackGraphBuilder& addCounter(ArgumentRef ref, CounterArgumentType type,
                                   const std::string& label = "");
    AttackGraphBuilder& addCounters(const std::vector<CounterNode>& counters);

    /// Reference for the auxiliary conclusion node. When unset, build()
    /// picks the smallest reference above every node already in use.
    AttackGraphBuilder& setConclusion(ArgumentRef ref);

    AttackGraph build() const;

    /// Adds the edges for one counter of the given type to `af`.
    /// `conclusion` must already be a node when `type` needs it.
    static void addAttackPattern(ArgumentationFramework& af,
                                 ArgumentRef original,
                                 ArgumentRef counter,
                                 CounterArgumentType type,
                                 ArgumentRef conclusion);

private:
    ArgumentRef original_;
    std::string original_label_;
    std::vector<CounterNode> counters_;
    std::optional<ArgumentRef> conclusion_;

    bool needsConclusion() const;
    ArgumentRef freshConclusionRef() const;
};

} // namespace rebut
