#include "validation/validator.hpp"
#include "logging/logger.hpp"
#include "validation/formal_representation.hpp"

#include <algorithm>

namespace rebut {

namespace {

AttackGraph singleCounterGraph(ArgumentRef original, ArgumentRef counter,
                               CounterArgumentType type)
{
    return AttackGraphBuilder(original)
        .addCounter(counter, type, "counter_0")
        .build();
}

} // namespace

ValidationResult Validator::validate(ArgumentRef original,
                                     ArgumentRef counter,
                                     CounterArgumentType type) const
{
    AttackGraph graph = singleCounterGraph(original, counter, type);
    ExtensionCalculator calc(graph.framework, config_);
    Extension grounded = calc.grounded();
    std::vector<Extension> complete = calc.completeExtensions();
    return evaluate(graph, counter, type, grounded, complete);
}

std::optional<ValidationResult> Validator::tryValidate(ArgumentRef original,
                                                       ArgumentRef counter,
                                                       CounterArgumentType type) const
{
    AttackGraph graph = singleCounterGraph(original, counter, type);
    ExtensionCalculator calc(graph.framework, config_);
    auto complete = calc.tryCompleteExtensions();
    if (!complete) return std::nullopt;
    return evaluate(graph, counter, type, calc.grounded(), *complete);
}

ValidationResult Validator::evaluate(const AttackGraph& graph,
                                     ArgumentRef counter,
                                     CounterArgumentType type,
                                     const Extension& grounded,
                                     const std::vector<Extension>& complete) const
{
    const ArgumentationFramework& af = graph.framework;
    ArgumentRef original = graph.original;

    auto in_some = [&](ArgumentRef ref) {
        return std::any_of(complete.begin(), complete.end(),
                           [&](const Extension& e) { return e.contains(ref); });
    };

    ValidationResult result;
    result.mode = EvaluationMode::FORMAL;
    result.is_valid_attack = grounded.contains(counter) && !grounded.contains(original);
    result.original_survives = in_some(original);
    result.counter_succeeds = grounded.contains(counter) || in_some(counter);
    result.logical_consistency = !complete.empty();

    result.grounded_extension = formatArgumentSet(af, grounded.members);
    for (const auto& ext : complete) {
        result.complete_extensions.push_back(formatArgumentSet(af, ext.members));
    }
    if (include_formal_representation_) {
        result.formal_representation = formatFormalRepresentation(af, grounded, &complete);
    }

    logger()->debug("validated {} counter: valid_attack={} original_survives={} counter_succeeds={}",
                    toString(type), result.is_valid_attack,
                    result.original_survives, result.counter_succeeds);
    return result;
}

} // namespace rebut
