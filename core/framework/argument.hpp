#pragma once

#include <cstdint>
#include <set>
#include <tuple>

namespace rebut {

/// Opaque identifier of a node in an attack graph.
/// Content (text, type, strength) lives with the caller.
using ArgumentRef = uint64_t;

/// A set of arguments, ordered by reference.
using ArgumentSet = std::set<ArgumentRef>;

/// A directed attack: attacker → target.
struct AttackEdge {
    ArgumentRef attacker = 0;
    ArgumentRef target = 0;

    AttackEdge() = default;
    AttackEdge(ArgumentRef attacker, ArgumentRef target)
        : attacker(attacker), target(target) {}

    bool operator==(const AttackEdge& other) const {
        return attacker == other.attacker && target == other.target;
    }
    bool operator!=(const AttackEdge& other) const { return !(*this == other); }
    bool operator<(const AttackEdge& other) const {
        return std::tie(attacker, target) < std::tie(other.attacker, other.target);
    }
};

} // namespace rebut
