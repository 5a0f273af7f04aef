#include "framework/argumentation_framework.hpp"

namespace rebut {

const ArgumentSet ArgumentationFramework::kEmpty{};

// ─── Node operations ───────────────────────────────────────────

void ArgumentationFramework::addNode(ArgumentRef ref, const std::string& label) {
    if (nodes_.count(ref)) {
        throw ArgumentationError(ErrorKind::DUPLICATE_NODE,
            "Argument already exists: " + std::to_string(ref), ref);
    }
    nodes_.emplace(ref, label);
    incoming_[ref];  // ensure entry exists
    outgoing_[ref];
}

bool ArgumentationFramework::ensureNode(ArgumentRef ref, const std::string& label) {
    if (nodes_.count(ref)) return false;
    addNode(ref, label);
    return true;
}

ArgumentSet ArgumentationFramework::nodes() const {
    ArgumentSet ids;
    for (const auto& [id, _] : nodes_) {
        ids.insert(ids.end(), id);
    }
    return ids;
}

std::string ArgumentationFramework::label(ArgumentRef ref) const {
    auto it = nodes_.find(ref);
    if (it == nodes_.end() || it->second.empty()) return std::to_string(ref);
    return it->second;
}

// ─── Attack operations ─────────────────────────────────────────

void ArgumentationFramework::addAttack(ArgumentRef attacker, ArgumentRef target) {
    if (!nodes_.count(attacker))
        throw ArgumentationError(ErrorKind::UNKNOWN_NODE,
            "Attacker not found: " + std::to_string(attacker), attacker);
    if (!nodes_.count(target))
        throw ArgumentationError(ErrorKind::UNKNOWN_NODE,
            "Target not found: " + std::to_string(target), target);

    if (outgoing_[attacker].insert(target).second) {
        incoming_[target].insert(attacker);
        attack_count_++;
    }
}

bool ArgumentationFramework::attacks(ArgumentRef attacker, ArgumentRef target) const {
    auto it = outgoing_.find(attacker);
    return it != outgoing_.end() && it->second.count(target) > 0;
}

std::vector<AttackEdge> ArgumentationFramework::attacks() const {
    std::vector<AttackEdge> edges;
    edges.reserve(attack_count_);
    forEachAttack([&](const AttackEdge& e) { edges.push_back(e); });
    return edges;
}

// ─── Adjacency queries ────────────────────────────────────────

const ArgumentSet& ArgumentationFramework::attackersOf(ArgumentRef ref) const {
    auto it = incoming_.find(ref);
    return it != incoming_.end() ? it->second : kEmpty;
}

const ArgumentSet& ArgumentationFramework::attackedBy(ArgumentRef ref) const {
    auto it = outgoing_.find(ref);
    return it != outgoing_.end() ? it->second : kEmpty;
}

// ─── Iteration ─────────────────────────────────────────────────

void ArgumentationFramework::forEachNode(const std::function<void(ArgumentRef)>& fn) const {
    for (const auto& [id, _] : nodes_) {
        fn(id);
    }
}

void ArgumentationFramework::forEachAttack(
    const std::function<void(const AttackEdge&)>& fn) const
{
    for (const auto& [attacker, targets] : outgoing_) {
        for (ArgumentRef target : targets) {
            fn(AttackEdge(attacker, target));
        }
    }
}

} // namespace rebut
