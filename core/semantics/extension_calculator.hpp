#pragma once

#include "framework/argumentation_framework.hpp"
#include "semantics/extension.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace rebut {

/// Limits for complete-extension enumeration.
struct CalculatorConfig {
    size_t max_enumeration_nodes = 32;  // AFs above this may only ask for grounded
    uint64_t max_search_steps = 0;      // 0 = unlimited
    double budget_seconds = 0.0;        // 0 = unlimited
};

// ─── ExtensionCalculator ───────────────────────────────────────
// Computes Dung semantics over a borrowed, read-only AF.
//
// F(S) = { x : every attacker of x is attacked by some member of S }
//
// grounded() is the least fixpoint of F reached from the empty set
// and is always available. completeExtensions() is exponential in
// the worst case and refuses AFs above the configured node cap.

class ExtensionCalculator {
public:
    explicit ExtensionCalculator(const ArgumentationFramework& af,
                                 CalculatorConfig config = {});

    /// The characteristic function F applied to `s`.
    ArgumentSet characteristic(const ArgumentSet& s) const;

    Extension grounded() const;
    Labelling groundedLabelling() const;

    /// Whether completeExtensions() is permitted by the node cap.
    bool canEnumerate() const { return af_.nodeCount() <= config_.max_enumeration_nodes; }

    /// All complete extensions, sorted by size then members.
    /// Throws ArgumentationError(TOO_LARGE) above the node cap or when
    /// the search budget runs out.
    std::vector<Extension> completeExtensions() const;

    /// Same enumeration, but reports a refused or unfinished search as
    /// nullopt instead of throwing. Callers that degrade use this.
    std::optional<std::vector<Extension>> tryCompleteExtensions() const;

    // ── Predicates ──
    bool isConflictFree(const ArgumentSet& s) const;
    bool isAdmissible(const ArgumentSet& s) const;
    bool isComplete(const ArgumentSet& s) const;

    /// Accepted by some complete extension. Requires enumeration.
    bool isCredulouslyAccepted(ArgumentRef ref) const;
    /// Accepted by every complete extension, i.e. by the grounded one.
    bool isSkepticallyAccepted(ArgumentRef ref) const;

    const CalculatorConfig& config() const { return config_; }

private:
    const ArgumentationFramework& af_;
    CalculatorConfig config_;

    ArgumentSet attackedBySet(const ArgumentSet& s) const;
    bool conflictsWith(ArgumentRef candidate, const ArgumentSet& s) const;
    bool enumerateComplete(std::vector<Extension>& found, uint64_t& steps) const;
};

} // namespace rebut
