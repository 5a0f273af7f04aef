#include "validation/strength_assessor.hpp"
#include "logging/logger.hpp"

#include <algorithm>

namespace rebut {

double StrengthAssessor::clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

// ─── Scoring ──────────────────────────────────────────────────

double StrengthAssessor::scoreComplete(const AttackGraph& graph,
                                       const ExtensionCalculator& calc,
                                       const std::vector<Extension>& complete) const
{
    Extension grounded = calc.grounded();

    double rate = 0.0;
    if (!complete.empty()) {
        auto accepted = std::count_if(complete.begin(), complete.end(),
            [&](const Extension& e) { return e.contains(graph.original); });
        rate = static_cast<double>(accepted) / static_cast<double>(complete.size());
    }

    // Grounded acceptance counts as strong corroboration
    if (grounded.contains(graph.original)) {
        rate = (rate + 1.0) / 2.0;
    }

    logger()->debug("strength over {} counters: {} complete extensions, score {:.3f}",
                    graph.counters.size(), complete.size(), rate);
    return clamp01(rate);
}

double StrengthAssessor::scoreGrounded(const AttackGraph& graph,
                                       const ExtensionCalculator& calc) const
{
    switch (calc.groundedLabelling().get(graph.original)) {
        case Label::IN:    return 1.0;
        case Label::UNDEC: return 0.5;
        case Label::OUT:   return 0.0;
    }
    return 0.0;
}

// ─── Public API ───────────────────────────────────────────────

double StrengthAssessor::assess(ArgumentRef original,
                                const std::vector<CounterNode>& counters) const
{
    if (counters.empty()) return 1.0;

    AttackGraph graph = AttackGraphBuilder(original).addCounters(counters).build();
    ExtensionCalculator calc(graph.framework, config_);
    return scoreComplete(graph, calc, calc.completeExtensions());
}

double StrengthAssessor::assessGroundedOnly(ArgumentRef original,
                                            const std::vector<CounterNode>& counters) const
{
    if (counters.empty()) return 1.0;

    AttackGraph graph = AttackGraphBuilder(original).addCounters(counters).build();
    ExtensionCalculator calc(graph.framework, config_);
    return scoreGrounded(graph, calc);
}

StrengthReport StrengthAssessor::report(ArgumentRef original,
                                        const std::vector<CounterNode>& counters) const
{
    StrengthReport out;
    if (counters.empty()) return out;

    AttackGraph graph = AttackGraphBuilder(original).addCounters(counters).build();
    ExtensionCalculator calc(graph.framework, config_);

    auto complete = calc.tryCompleteExtensions();
    if (complete) {
        out.score = scoreComplete(graph, calc, *complete);
        out.mode = EvaluationMode::FORMAL;
    } else {
        logger()->info("complete extensions unavailable for {} arguments (cap {}); "
                       "using grounded-only strength",
                       graph.framework.nodeCount(), config_.max_enumeration_nodes);
        out.score = scoreGrounded(graph, calc);
        out.mode = EvaluationMode::GROUNDED_ONLY;
    }
    return out;
}

} // namespace rebut
