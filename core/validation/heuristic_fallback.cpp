#include "validation/heuristic_fallback.hpp"

#include <algorithm>

namespace rebut {

ValidationResult HeuristicFallback::validate(ArgumentStrength strength) {
    ValidationResult result;
    result.mode = EvaluationMode::FALLBACK;
    result.is_valid_attack = true;
    result.original_survives = strength == ArgumentStrength::WEAK ||
                               strength == ArgumentStrength::MODERATE;
    result.counter_succeeds = strength != ArgumentStrength::WEAK;
    result.logical_consistency = true;
    result.formal_representation = kUnavailableRepresentation;
    result.grounded_extension = kUnavailable;
    result.complete_extensions = {kUnavailable};
    return result;
}

StrengthReport HeuristicFallback::assess(const std::vector<ArgumentStrength>& strengths) {
    StrengthReport report;
    report.mode = EvaluationMode::FALLBACK;
    if (strengths.empty()) {
        report.score = 1.0;
        return report;
    }

    auto strong = std::count_if(strengths.begin(), strengths.end(), [](ArgumentStrength s) {
        return s == ArgumentStrength::STRONG || s == ArgumentStrength::DECISIVE;
    });
    double n = static_cast<double>(strengths.size());

    double strength_factor = 1.0 - static_cast<double>(strong) / n;
    double count_factor = std::max(0.2, 1.0 - 0.1 * n);
    report.score = strength_factor * count_factor;
    return report;
}

} // namespace rebut
