#pragma once

#include "framework/argument.hpp"
#include "framework/argumentation_framework.hpp"

#include <map>
#include <string>
#include <utility>

namespace rebut {

/// Which acceptability condition an extension is known to satisfy.
enum class ExtensionKind {
    CONFLICT_FREE,
    ADMISSIBLE,
    COMPLETE,
    GROUNDED
};

std::string toString(ExtensionKind kind);

/// A set of arguments that can be accepted together.
struct Extension {
    ExtensionKind kind = ExtensionKind::CONFLICT_FREE;
    ArgumentSet members;

    Extension() = default;
    Extension(ExtensionKind kind, ArgumentSet members)
        : kind(kind), members(std::move(members)) {}

    bool contains(ArgumentRef ref) const { return members.count(ref) > 0; }
    size_t size() const { return members.size(); }
    bool empty() const { return members.empty(); }

    /// True if every member of this extension is a member of `other`.
    bool isSubsetOf(const Extension& other) const;

    bool operator==(const Extension& other) const { return members == other.members; }
    bool operator!=(const Extension& other) const { return !(*this == other); }
};

// ─── Labelling ─────────────────────────────────────────────────
// IN/OUT/UNDEC assignment. A legal labelling and its IN set carry
// the same information as a complete extension.

enum class Label { IN, OUT, UNDEC };

std::string toString(Label label);

class Labelling {
public:
    Labelling() = default;

    /// IN = extension, OUT = attacked by the extension, UNDEC = the rest.
    static Labelling fromExtension(const ArgumentationFramework& af,
                                   const ArgumentSet& extension);

    void set(ArgumentRef ref, Label label) { labels_[ref] = label; }
    /// Nodes never assigned read as UNDEC.
    Label get(ArgumentRef ref) const;

    ArgumentSet inSet() const { return collect(Label::IN); }
    ArgumentSet outSet() const { return collect(Label::OUT); }
    ArgumentSet undecSet() const { return collect(Label::UNDEC); }

    /// IN iff every attacker is OUT; OUT iff some attacker is IN; else UNDEC.
    bool isLegal(const ArgumentationFramework& af) const;

    Extension toExtension(ExtensionKind kind) const { return {kind, inSet()}; }

    size_t size() const { return labels_.size(); }

private:
    std::map<ArgumentRef, Label> labels_;

    ArgumentSet collect(Label label) const;
};

} // namespace rebut
