#include "attack/counter_argument.hpp"

#include <algorithm>
#include <cctype>

namespace rebut {

namespace {

std::string normalize(const std::string& name) {
    std::string out = name;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string toString(CounterArgumentType type) {
    switch (type) {
        case CounterArgumentType::DIRECT_REFUTATION:       return "direct_refutation";
        case CounterArgumentType::COUNTER_EXAMPLE:         return "counter_example";
        case CounterArgumentType::ALTERNATIVE_EXPLANATION: return "alternative_explanation";
        case CounterArgumentType::PREMISE_CHALLENGE:       return "premise_challenge";
        case CounterArgumentType::REDUCTIO_AD_ABSURDUM:    return "reductio_ad_absurdum";
    }
    return "direct_refutation";
}

std::string toString(ArgumentStrength strength) {
    switch (strength) {
        case ArgumentStrength::WEAK:     return "weak";
        case ArgumentStrength::MODERATE: return "moderate";
        case ArgumentStrength::STRONG:   return "strong";
        case ArgumentStrength::DECISIVE: return "decisive";
    }
    return "moderate";
}

std::optional<CounterArgumentType> parseCounterArgumentType(const std::string& name) {
    std::string key = normalize(name);
    if (key == "direct_refutation")       return CounterArgumentType::DIRECT_REFUTATION;
    if (key == "counter_example")         return CounterArgumentType::COUNTER_EXAMPLE;
    if (key == "alternative_explanation") return CounterArgumentType::ALTERNATIVE_EXPLANATION;
    if (key == "premise_challenge")       return CounterArgumentType::PREMISE_CHALLENGE;
    if (key == "reductio_ad_absurdum")    return CounterArgumentType::REDUCTIO_AD_ABSURDUM;
    return std::nullopt;
}

std::optional<ArgumentStrength> parseArgumentStrength(const std::string& name) {
    std::string key = normalize(name);
    if (key == "weak")     return ArgumentStrength::WEAK;
    if (key == "moderate") return ArgumentStrength::MODERATE;
    if (key == "strong")   return ArgumentStrength::STRONG;
    if (key == "decisive") return ArgumentStrength::DECISIVE;
    return std::nullopt;
}

} // namespace rebut
