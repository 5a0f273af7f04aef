#pragma once

#include "semantics/extension_calculator.hpp"

namespace rebut {

/// Per-engine configuration, fixed at construction.
struct EngineConfig {
    CalculatorConfig calculator;

    // When false, every request is answered by HeuristicFallback.
    bool formal_validation = true;

    // Attach the textual AF dump to validation results.
    bool include_formal_representation = true;
};

} // namespace rebut
