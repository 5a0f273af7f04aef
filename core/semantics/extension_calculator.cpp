#include "semantics/extension_calculator.hpp"
#include "semantics/enumeration_budget.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <functional>

namespace rebut {

ExtensionCalculator::ExtensionCalculator(const ArgumentationFramework& af,
                                         CalculatorConfig config)
    : af_(af), config_(config) {}

// ─── Characteristic function ──────────────────────────────────

ArgumentSet ExtensionCalculator::attackedBySet(const ArgumentSet& s) const {
    ArgumentSet attacked;
    for (ArgumentRef member : s) {
        const ArgumentSet& targets = af_.attackedBy(member);
        attacked.insert(targets.begin(), targets.end());
    }
    return attacked;
}

ArgumentSet ExtensionCalculator::characteristic(const ArgumentSet& s) const {
    ArgumentSet attacked = attackedBySet(s);
    ArgumentSet defended;
    af_.forEachNode([&](ArgumentRef x) {
        const ArgumentSet& attackers = af_.attackersOf(x);
        if (std::includes(attacked.begin(), attacked.end(),
                          attackers.begin(), attackers.end())) {
            defended.insert(defended.end(), x);
        }
    });
    return defended;
}

// ─── Grounded semantics ───────────────────────────────────────

Extension ExtensionCalculator::grounded() const {
    // F is monotonic, so iterating from ∅ climbs to the least fixpoint
    // in at most |Args| + 1 rounds.
    ArgumentSet current;
    size_t rounds = 0;
    while (true) {
        ArgumentSet next = characteristic(current);
        rounds++;
        if (next == current) break;
        current = std::move(next);
    }
    logger()->debug("grounded extension: {} of {} arguments after {} rounds",
                    current.size(), af_.nodeCount(), rounds);
    return {ExtensionKind::GROUNDED, std::move(current)};
}

Labelling ExtensionCalculator::groundedLabelling() const {
    return Labelling::fromExtension(af_, grounded().members);
}

// ─── Complete semantics ───────────────────────────────────────

bool ExtensionCalculator::conflictsWith(ArgumentRef candidate, const ArgumentSet& s) const {
    if (af_.attacks(candidate, candidate)) return true;
    for (ArgumentRef a : af_.attackersOf(candidate)) {
        if (s.count(a)) return true;
    }
    for (ArgumentRef t : af_.attackedBy(candidate)) {
        if (s.count(t)) return true;
    }
    return false;
}

bool ExtensionCalculator::enumerateComplete(std::vector<Extension>& found,
                                            uint64_t& steps) const {
    // Every complete extension contains the grounded one and rejects
    // whatever it attacks, so only UNDEC arguments need branching.
    Labelling base = groundedLabelling();
    ArgumentSet candidate = base.inSet();
    ArgumentSet undecided = base.undecSet();
    std::vector<ArgumentRef> open(undecided.begin(), undecided.end());

    EnumerationBudget budget(config_.budget_seconds, config_.max_search_steps);
    budget.start();

    // Returns false once the budget is spent; the caller unwinds.
    std::function<bool(size_t)> search = [&](size_t idx) -> bool {
        if (!budget.canContinue()) return false;
        budget.recordStep();

        if (idx == open.size()) {
            if (characteristic(candidate) == candidate) {
                found.emplace_back(ExtensionKind::COMPLETE, candidate);
            }
            return true;
        }

        ArgumentRef x = open[idx];

        // Include branch, pruned as soon as conflict-freeness breaks
        if (!conflictsWith(x, candidate)) {
            candidate.insert(x);
            bool ok = search(idx + 1);
            candidate.erase(x);
            if (!ok) return false;
        }

        // Exclude branch
        return search(idx + 1);
    };
    bool finished = search(0);
    steps = budget.steps();

    if (!finished) {
        logger()->debug("complete extensions: budget spent after {} steps over {} undecided arguments",
                        steps, open.size());
        found.clear();
        return false;
    }

    std::sort(found.begin(), found.end(), [](const Extension& a, const Extension& b) {
        if (a.size() != b.size()) return a.size() < b.size();
        return a.members < b.members;
    });

    logger()->debug("complete extensions: {} found over {} undecided arguments in {} steps",
                    found.size(), open.size(), steps);
    return true;
}

std::vector<Extension> ExtensionCalculator::completeExtensions() const {
    if (!canEnumerate()) {
        throw ArgumentationError(ErrorKind::TOO_LARGE,
            "Complete-extension enumeration refused: " +
            std::to_string(af_.nodeCount()) + " arguments exceed the cap of " +
            std::to_string(config_.max_enumeration_nodes));
    }

    std::vector<Extension> found;
    uint64_t steps = 0;
    if (!enumerateComplete(found, steps)) {
        throw ArgumentationError(ErrorKind::TOO_LARGE,
            "Complete-extension enumeration exhausted its budget after " +
            std::to_string(steps) + " steps");
    }
    return found;
}

std::optional<std::vector<Extension>> ExtensionCalculator::tryCompleteExtensions() const {
    if (!canEnumerate()) return std::nullopt;

    std::vector<Extension> found;
    uint64_t steps = 0;
    if (!enumerateComplete(found, steps)) return std::nullopt;
    return found;
}

// ─── Predicates ───────────────────────────────────────────────

bool ExtensionCalculator::isConflictFree(const ArgumentSet& s) const {
    for (ArgumentRef a : s) {
        for (ArgumentRef t : af_.attackedBy(a)) {
            if (s.count(t)) return false;
        }
    }
    return true;
}

bool ExtensionCalculator::isAdmissible(const ArgumentSet& s) const {
    if (!isConflictFree(s)) return false;
    ArgumentSet defended = characteristic(s);
    return std::includes(defended.begin(), defended.end(), s.begin(), s.end());
}

bool ExtensionCalculator::isComplete(const ArgumentSet& s) const {
    return isConflictFree(s) && characteristic(s) == s;
}

bool ExtensionCalculator::isCredulouslyAccepted(ArgumentRef ref) const {
    auto extensions = completeExtensions();
    return std::any_of(extensions.begin(), extensions.end(),
        [&](const Extension& e) { return e.contains(ref); });
}

bool ExtensionCalculator::isSkepticallyAccepted(ArgumentRef ref) const {
    return grounded().contains(ref);
}

} // namespace rebut
