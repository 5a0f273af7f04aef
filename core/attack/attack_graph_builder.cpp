#include "attack/attack_graph_builder.hpp"

#include <algorithm>
#include <limits>
#include <set>

namespace rebut {

AttackGraphBuilder::AttackGraphBuilder(ArgumentRef original, const std::string& label)
    : original_(original), original_label_(label) {}

AttackGraphBuilder& AttackGraphBuilder::addCounter(ArgumentRef ref, CounterArgumentType type,
                                                   const std::string& label) {
    counters_.emplace_back(ref, type, label);
    return *this;
}

AttackGraphBuilder& AttackGraphBuilder::addCounters(const std::vector<CounterNode>& counters) {
    counters_.insert(counters_.end(), counters.begin(), counters.end());
    return *this;
}

AttackGraphBuilder& AttackGraphBuilder::setConclusion(ArgumentRef ref) {
    conclusion_ = ref;
    return *this;
}

bool AttackGraphBuilder::needsConclusion() const {
    return std::any_of(counters_.begin(), counters_.end(), [](const CounterNode& c) {
        return c.type == CounterArgumentType::ALTERNATIVE_EXPLANATION;
    });
}

ArgumentRef AttackGraphBuilder::freshConclusionRef() const {
    std::set<ArgumentRef> used{original_};
    for (const auto& c : counters_) used.insert(c.ref);

    ArgumentRef highest = *used.rbegin();
    if (highest < std::numeric_limits<ArgumentRef>::max()) return highest + 1;

    // Top of the range is taken; fall back to the first gap.
    ArgumentRef ref = 0;
    while (used.count(ref)) ref++;
    return ref;
}

AttackGraph AttackGraphBuilder::build() const {
    AttackGraph graph;
    graph.original = original_;
    graph.framework.addNode(original_, original_label_);

    for (const auto& c : counters_) {
        graph.framework.addNode(c.ref, c.label);
        graph.counters.push_back(c.ref);
    }

    ArgumentRef conclusion = 0;
    if (needsConclusion()) {
        conclusion = conclusion_ ? *conclusion_ : freshConclusionRef();
        graph.framework.addNode(conclusion, "conclusion");
        graph.conclusion = conclusion;
    }

    for (const auto& c : counters_) {
        addAttackPattern(graph.framework, original_, c.ref, c.type, conclusion);
    }
    return graph;
}

void AttackGraphBuilder::addAttackPattern(ArgumentationFramework& af,
                                          ArgumentRef original,
                                          ArgumentRef counter,
                                          CounterArgumentType type,
                                          ArgumentRef conclusion)
{
    switch (type) {
        case CounterArgumentType::DIRECT_REFUTATION:
        case CounterArgumentType::PREMISE_CHALLENGE:
        case CounterArgumentType::COUNTER_EXAMPLE:
        case CounterArgumentType::REDUCTIO_AD_ABSURDUM:
            af.addAttack(counter, original);
            return;
        case CounterArgumentType::ALTERNATIVE_EXPLANATION:
            af.addAttack(original, conclusion);
            af.addAttack(counter, conclusion);
            return;
    }
}

} // namespace rebut
