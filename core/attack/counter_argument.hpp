#pragma once

#include <optional>
#include <string>

namespace rebut {

/// How a counter-argument engages the original. Drives the attack
/// pattern chosen by AttackGraphBuilder.
enum class CounterArgumentType {
    DIRECT_REFUTATION,
    COUNTER_EXAMPLE,
    ALTERNATIVE_EXPLANATION,
    PREMISE_CHALLENGE,
    REDUCTIO_AD_ABSURDUM
};

/// Ordered strength levels. Only the heuristic fallback reads these.
enum class ArgumentStrength {
    WEAK,
    MODERATE,
    STRONG,
    DECISIVE
};

/// Snake-case wire names, e.g. "direct_refutation", "decisive".
std::string toString(CounterArgumentType type);
std::string toString(ArgumentStrength strength);
std::optional<CounterArgumentType> parseCounterArgumentType(const std::string& name);
std::optional<ArgumentStrength> parseArgumentStrength(const std::string& name);

/// The part of a caller's counter-argument record the engine consumes.
struct CounterArgument {
    CounterArgumentType type = CounterArgumentType::DIRECT_REFUTATION;
    ArgumentStrength strength = ArgumentStrength::MODERATE;

    CounterArgument() = default;
    CounterArgument(CounterArgumentType type, ArgumentStrength strength)
        : type(type), strength(strength) {}
};

} // namespace rebut
