#pragma once

#include "framework/argument.hpp"
#include "framework/errors.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rebut {

// ─── ArgumentationFramework ────────────────────────────────────
// A Dung-style abstract argumentation framework AF = (Args, Att).
// Ordered containers keep every traversal deterministic.
// Built once per evaluation and treated as read-only afterwards.

class ArgumentationFramework {
public:
    ArgumentationFramework() = default;

    // ── Node operations ──
    /// Throws ArgumentationError(DUPLICATE_NODE) if `ref` is present.
    void addNode(ArgumentRef ref, const std::string& label = "");
    /// Idempotent insert. Returns true if the node was new.
    bool ensureNode(ArgumentRef ref, const std::string& label = "");
    bool contains(ArgumentRef ref) const { return nodes_.count(ref) > 0; }
    ArgumentSet nodes() const;
    size_t nodeCount() const { return nodes_.size(); }

    /// Display label, or the decimal reference when none was given.
    std::string label(ArgumentRef ref) const;

    // ── Attack operations ──
    /// Throws ArgumentationError(UNKNOWN_NODE) if either endpoint is absent.
    /// Adding an existing attack again is a no-op.
    void addAttack(ArgumentRef attacker, ArgumentRef target);
    bool attacks(ArgumentRef attacker, ArgumentRef target) const;
    std::vector<AttackEdge> attacks() const;
    size_t attackCount() const { return attack_count_; }

    // ── Adjacency queries ──
    const ArgumentSet& attackersOf(ArgumentRef ref) const;
    const ArgumentSet& attackedBy(ArgumentRef ref) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(ArgumentRef)>& fn) const;
    void forEachAttack(const std::function<void(const AttackEdge&)>& fn) const;

private:
    std::map<ArgumentRef, std::string> nodes_;

    // node → nodes attacking it / node → nodes it attacks
    std::map<ArgumentRef, ArgumentSet> incoming_;
    std::map<ArgumentRef, ArgumentSet> outgoing_;
    size_t attack_count_ = 0;

    static const ArgumentSet kEmpty;
};

} // namespace rebut
