#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rebut {

/// How a result was obtained. FALLBACK results come from the strength
/// heuristic and must never be presented as formal outcomes.
enum class EvaluationMode {
    FORMAL,          // grounded + complete semantics
    GROUNDED_ONLY,   // AF above the enumeration cap; reduced formula
    FALLBACK         // formal evaluation disabled; strength heuristic
};

std::string toString(EvaluationMode mode);

/// Outcome of judging one counter-argument against the original.
struct ValidationResult {
    bool is_valid_attack = false;
    bool original_survives = false;
    bool counter_succeeds = false;
    bool logical_consistency = false;
    std::optional<std::string> formal_representation;

    std::string grounded_extension;               // e.g. "{counter_0}"
    std::vector<std::string> complete_extensions; // one entry per extension
    EvaluationMode mode = EvaluationMode::FORMAL;
};

/// Strength of the original argument after its counters, in [0, 1].
struct StrengthReport {
    double score = 1.0;
    EvaluationMode mode = EvaluationMode::FORMAL;
};

} // namespace rebut
