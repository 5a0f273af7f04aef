#pragma once

#include "attack/attack_graph_builder.hpp"
#include "attack/counter_argument.hpp"
#include "engine/engine_config.hpp"
#include "validation/validation_result.hpp"

#include <string>
#include <vector>

namespace rebut {

// ─── ArgumentationEngine ───────────────────────────────────────
// Public entry point used by the debate application. Assigns node
// identities (original, counter_0..counter_{n-1}, conclusion), runs the
// formal semantics, and degrades instead of throwing TOO_LARGE:
//
//   validate  -> strength heuristic (FALLBACK) when formal evaluation
//                is disabled or enumeration is refused or out of budget
//   assess    -> heuristic when disabled; grounded-only (GROUNDED_ONLY)
//                when enumeration is refused or out of budget
//   graph     -> dump without the complete-extension line when
//                enumeration is refused or out of budget
//
// Holds no mutable state; one instance may serve concurrent callers.

class ArgumentationEngine {
public:
    explicit ArgumentationEngine(EngineConfig config = {});

    ValidationResult validateCounterArgument(const CounterArgument& counter) const;

    /// Score in [0, 1]; 1.0 with no counters.
    StrengthReport assessArgumentStrength(const std::vector<CounterArgument>& counters) const;

    /// Text dump of the attack graph, or kGraphUnavailable when there
    /// are no counters or formal evaluation is off.
    std::string generateAttackGraph(const std::vector<CounterArgument>& counters) const;

    const EngineConfig& config() const { return config_; }

    static constexpr ArgumentRef kOriginalRef = 1;
    static constexpr const char* kGraphUnavailable = "Attack graph unavailable.";

private:
    EngineConfig config_;

    static std::vector<CounterNode> counterNodes(const std::vector<CounterArgument>& counters);
};

} // namespace rebut
