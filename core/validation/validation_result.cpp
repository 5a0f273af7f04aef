#include "validation/validation_result.hpp"

namespace rebut {

std::string toString(EvaluationMode mode) {
    switch (mode) {
        case EvaluationMode::FORMAL:        return "formal";
        case EvaluationMode::GROUNDED_ONLY: return "grounded_only";
        case EvaluationMode::FALLBACK:      return "fallback";
    }
    return "formal";
}

} // namespace rebut
