#pragma once

#include "framework/argumentation_framework.hpp"
#include "semantics/extension.hpp"

#include <string>
#include <vector>

namespace rebut {

// Deterministic text rendering for display. Nodes print by label in
// reference order. Example:
//
//   AF = <{original, counter_0}, {(counter_0, original)}>
//   grounded = {counter_0}
//   complete = [{counter_0}]

std::string formatArgumentSet(const ArgumentationFramework& af, const ArgumentSet& s);
std::string formatFramework(const ArgumentationFramework& af);

/// Full dump. `complete` may be null when enumeration was not performed.
std::string formatFormalRepresentation(const ArgumentationFramework& af,
                                       const Extension& grounded,
                                       const std::vector<Extension>* complete);

} // namespace rebut
