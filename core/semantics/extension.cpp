#include "semantics/extension.hpp"

#include <algorithm>

namespace rebut {

std::string toString(ExtensionKind kind) {
    switch (kind) {
        case ExtensionKind::CONFLICT_FREE: return "conflict-free";
        case ExtensionKind::ADMISSIBLE:    return "admissible";
        case ExtensionKind::COMPLETE:      return "complete";
        case ExtensionKind::GROUNDED:      return "grounded";
    }
    return "unknown";
}

std::string toString(Label label) {
    switch (label) {
        case Label::IN:    return "IN";
        case Label::OUT:   return "OUT";
        case Label::UNDEC: return "UNDEC";
    }
    return "UNDEC";
}

bool Extension::isSubsetOf(const Extension& other) const {
    return std::includes(other.members.begin(), other.members.end(),
                         members.begin(), members.end());
}

// ─── Labelling ─────────────────────────────────────────────────

Labelling Labelling::fromExtension(const ArgumentationFramework& af,
                                   const ArgumentSet& extension)
{
    Labelling lab;
    af.forEachNode([&](ArgumentRef ref) {
        if (extension.count(ref)) {
            lab.set(ref, Label::IN);
            return;
        }
        const ArgumentSet& attackers = af.attackersOf(ref);
        bool attacked = std::any_of(attackers.begin(), attackers.end(),
            [&](ArgumentRef a) { return extension.count(a) > 0; });
        lab.set(ref, attacked ? Label::OUT : Label::UNDEC);
    });
    return lab;
}

Label Labelling::get(ArgumentRef ref) const {
    auto it = labels_.find(ref);
    return it != labels_.end() ? it->second : Label::UNDEC;
}

bool Labelling::isLegal(const ArgumentationFramework& af) const {
    bool legal = true;
    af.forEachNode([&](ArgumentRef ref) {
        if (!legal) return;
        bool all_out = true;
        bool some_in = false;
        for (ArgumentRef a : af.attackersOf(ref)) {
            Label l = get(a);
            if (l != Label::OUT) all_out = false;
            if (l == Label::IN) some_in = true;
        }
        switch (get(ref)) {
            case Label::IN:    legal = all_out; break;
            case Label::OUT:   legal = some_in; break;
            case Label::UNDEC: legal = !all_out && !some_in; break;
        }
    });
    return legal;
}

ArgumentSet Labelling::collect(Label label) const {
    ArgumentSet out;
    for (const auto& [ref, l] : labels_) {
        if (l == label) out.insert(out.end(), ref);
    }
    return out;
}

} // namespace rebut
