#pragma once

#include "attack/attack_graph_builder.hpp"
#include "semantics/extension_calculator.hpp"
#include "validation/validation_result.hpp"

#include <vector>

namespace rebut {

/// Scores how well the original argument holds up under several
/// counters, each attacking it per its type.
class StrengthAssessor {
public:
    explicit StrengthAssessor(CalculatorConfig config = {}) : config_(config) {}

    /// Full formula over complete extensions C and grounded G:
    ///   rate = |{E ∈ C : original ∈ E}| / |C|
    ///   rate = (rate + 1) / 2   if original ∈ G
    /// clamped to [0, 1]; 1.0 with no counters.
    /// Throws ArgumentationError(TOO_LARGE) above the enumeration cap.
    double assess(ArgumentRef original, const std::vector<CounterNode>& counters) const;

    /// Reduced formula from the grounded labelling of the original:
    /// IN → 1.0, UNDEC → 0.5, OUT → 0.0. Polynomial; no cap applies.
    double assessGroundedOnly(ArgumentRef original, const std::vector<CounterNode>& counters) const;

    /// Picks the full formula when enumeration completes, the reduced
    /// one when it is refused by the cap or runs out of budget, and tags
    /// the result accordingly. Never throws TOO_LARGE.
    StrengthReport report(ArgumentRef original, const std::vector<CounterNode>& counters) const;

private:
    CalculatorConfig config_;

    double scoreComplete(const AttackGraph& graph, const ExtensionCalculator& calc,
                         const std::vector<Extension>& complete) const;
    double scoreGrounded(const AttackGraph& graph, const ExtensionCalculator& calc) const;

    static double clamp01(double v);
};

} // namespace rebut
