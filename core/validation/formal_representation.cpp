#include "validation/formal_representation.hpp"

#include <sstream>

namespace rebut {

std::string formatArgumentSet(const ArgumentationFramework& af, const ArgumentSet& s) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (ArgumentRef ref : s) {
        if (!first) out << ", ";
        out << af.label(ref);
        first = false;
    }
    out << "}";
    return out.str();
}

std::string formatFramework(const ArgumentationFramework& af) {
    std::ostringstream out;
    out << "AF = <" << formatArgumentSet(af, af.nodes()) << ", {";
    bool first = true;
    af.forEachAttack([&](const AttackEdge& e) {
        if (!first) out << ", ";
        out << "(" << af.label(e.attacker) << ", " << af.label(e.target) << ")";
        first = false;
    });
    out << "}>";
    return out.str();
}

std::string formatFormalRepresentation(const ArgumentationFramework& af,
                                       const Extension& grounded,
                                       const std::vector<Extension>* complete)
{
    std::ostringstream out;
    out << formatFramework(af) << "\n";
    out << "grounded = " << formatArgumentSet(af, grounded.members);
    if (complete) {
        out << "\ncomplete = [";
        for (size_t i = 0; i < complete->size(); i++) {
            if (i > 0) out << ", ";
            out << formatArgumentSet(af, (*complete)[i].members);
        }
        out << "]";
    }
    return out.str();
}

} // namespace rebut
