#pragma once

#include "attack/counter_argument.hpp"
#include "validation/validation_result.hpp"

#include <vector>

namespace rebut {

/// Degraded mode used when formal evaluation is switched off. Reads
/// only the declared strength of each counter; every result it returns
/// is tagged EvaluationMode::FALLBACK.
class HeuristicFallback {
public:
    /// original_survives = strength ∈ {weak, moderate}
    /// counter_succeeds  = strength ∈ {moderate, strong, decisive}
    /// is_valid_attack and logical_consistency are always true.
    static ValidationResult validate(ArgumentStrength strength);

    /// (1 − k/N) · max(0.2, 1 − 0.1·N), where k counts strong and
    /// decisive counters; 1.0 when N = 0.
    static StrengthReport assess(const std::vector<ArgumentStrength>& strengths);

    static constexpr const char* kUnavailable = "unavailable";
    static constexpr const char* kUnavailableRepresentation = "unavailable (fallback evaluation)";
};

} // namespace rebut
