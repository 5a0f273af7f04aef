#pragma once

#include "attack/attack_graph_builder.hpp"
#include "attack/counter_argument.hpp"
#include "framework/argument.hpp"
#include "semantics/extension_calculator.hpp"
#include "validation/validation_result.hpp"

#include <optional>
#include <vector>

namespace rebut {

/// Judges a single counter-argument against the original.
///
/// Builds the two-node (three with an alternative explanation) AF,
/// computes grounded extension G and complete extensions C, then:
///   is_valid_attack     = counter ∈ G ∧ original ∉ G
///   original_survives   = original ∈ ⋃C        (credulous)
///   counter_succeeds    = counter ∈ G ∨ counter ∈ ⋃C
///   logical_consistency = |C| > 0              (always true for finite AFs)
///
/// Construction errors propagate as ArgumentationError. validate()
/// also throws TOO_LARGE when enumeration is refused or runs out of
/// budget; tryValidate() reports that case as nullopt.
class Validator {
public:
    explicit Validator(CalculatorConfig config = {},
                       bool include_formal_representation = true)
        : config_(config), include_formal_representation_(include_formal_representation) {}

    ValidationResult validate(ArgumentRef original,
                              ArgumentRef counter,
                              CounterArgumentType type) const;

    std::optional<ValidationResult> tryValidate(ArgumentRef original,
                                                ArgumentRef counter,
                                                CounterArgumentType type) const;

private:
    CalculatorConfig config_;
    bool include_formal_representation_;

    ValidationResult evaluate(const AttackGraph& graph,
                              ArgumentRef counter,
                              CounterArgumentType type,
                              const Extension& grounded,
                              const std::vector<Extension>& complete) const;
};

} // namespace rebut
