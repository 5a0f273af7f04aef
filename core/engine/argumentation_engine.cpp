#include "engine/argumentation_engine.hpp"
#include "logging/logger.hpp"
#include "semantics/extension_calculator.hpp"
#include "validation/formal_representation.hpp"
#include "validation/heuristic_fallback.hpp"
#include "validation/strength_assessor.hpp"
#include "validation/validator.hpp"

#include <utility>

namespace rebut {

ArgumentationEngine::ArgumentationEngine(EngineConfig config)
    : config_(config) {}

std::vector<CounterNode> ArgumentationEngine::counterNodes(
    const std::vector<CounterArgument>& counters)
{
    std::vector<CounterNode> nodes;
    nodes.reserve(counters.size());
    for (size_t i = 0; i < counters.size(); i++) {
        nodes.emplace_back(kOriginalRef + 1 + i, counters[i].type,
                           "counter_" + std::to_string(i));
    }
    return nodes;
}

// ─── validate ─────────────────────────────────────────────────

ValidationResult ArgumentationEngine::validateCounterArgument(const CounterArgument& counter) const {
    if (!config_.formal_validation) {
        logger()->warn("formal validation disabled; using strength heuristic for {} ({})",
                       toString(counter.type), toString(counter.strength));
        return HeuristicFallback::validate(counter.strength);
    }

    Validator validator(config_.calculator, config_.include_formal_representation);
    auto formal = validator.tryValidate(kOriginalRef, kOriginalRef + 1, counter.type);
    if (!formal) {
        logger()->warn("complete extensions unavailable (cap {}); using strength heuristic for {} ({})",
                       config_.calculator.max_enumeration_nodes,
                       toString(counter.type), toString(counter.strength));
        return HeuristicFallback::validate(counter.strength);
    }
    ValidationResult result = std::move(*formal);

    logger()->info("validation of {}: valid_attack={} original_survives={} counter_succeeds={}",
                   toString(counter.type), result.is_valid_attack,
                   result.original_survives, result.counter_succeeds);
    return result;
}

// ─── assess ───────────────────────────────────────────────────

StrengthReport ArgumentationEngine::assessArgumentStrength(
    const std::vector<CounterArgument>& counters) const
{
    if (!config_.formal_validation) {
        logger()->warn("formal validation disabled; using strength heuristic for {} counters",
                       counters.size());
        std::vector<ArgumentStrength> strengths;
        strengths.reserve(counters.size());
        for (const auto& c : counters) strengths.push_back(c.strength);
        return HeuristicFallback::assess(strengths);
    }

    StrengthAssessor assessor(config_.calculator);
    StrengthReport report = assessor.report(kOriginalRef, counterNodes(counters));

    logger()->info("strength against {} counters: {:.3f} ({})",
                   counters.size(), report.score, toString(report.mode));
    return report;
}

// ─── attack graph ─────────────────────────────────────────────

std::string ArgumentationEngine::generateAttackGraph(
    const std::vector<CounterArgument>& counters) const
{
    if (!config_.formal_validation || counters.empty()) {
        return kGraphUnavailable;
    }

    AttackGraph graph = AttackGraphBuilder(kOriginalRef)
        .addCounters(counterNodes(counters))
        .build();
    ExtensionCalculator calc(graph.framework, config_.calculator);
    Extension grounded = calc.grounded();

    auto complete = calc.tryCompleteExtensions();
    if (!complete) {
        logger()->info("complete extensions unavailable for {} arguments; dumping grounded only",
                       graph.framework.nodeCount());
        return formatFormalRepresentation(graph.framework, grounded, nullptr);
    }
    return formatFormalRepresentation(graph.framework, grounded, &*complete);
}

} // namespace rebut
