#include <rpclb/governance/weighted_sequence.h>

#include <algorithm>

namespace rpclb::governance {
namespace {

bool DividesAll(int divisor, const WeightTable& weights) {
    return std::all_of(weights.begin(), weights.end(),
                       [divisor](const auto& kv) { return kv.second % divisor == 0; });
}

} // namespace

void FixWeights(WeightTable& weights) {
    for (auto& kv : weights) {
        if (kv.second < kMinWeight) {
            kv.second = kMinWeight;
        }
    }
}

std::vector<int> DescendingDivisors(int value) {
    std::vector<int> divisors;
    if (value <= kMinWeight) {
        return divisors;
    }

    divisors.push_back(value);
    for (int candidate = value / 2; candidate > 0; --candidate) {
        if (value % candidate == 0) {
            divisors.push_back(candidate);
        }
    }
    return divisors;
}

int ReductionFactor(const WeightTable& weights) {
    if (weights.empty()) {
        return kMinWeight;
    }

    auto min_it = std::min_element(weights.begin(), weights.end(),
                                   [](const auto& a, const auto& b) { return a.second < b.second; });
    int min = min_it->second;
    if (min <= kMinWeight) {
        return kMinWeight;
    }

    for (int divisor : DescendingDivisors(min)) {
        if (DividesAll(divisor, weights)) {
            return divisor;
        }
    }
    return kMinWeight;
}

rpclb::Result<std::vector<std::string>> BuildElectionSequence(WeightTable weights, int* factor) {
    if (weights.empty()) {
        return rpclb::Status(rpclb::StatusCode::failed_precondition, "no targets configured");
    }
    if (weights.size() == 1) {
        if (factor != nullptr) {
            *factor = kMinWeight;
        }
        return std::vector<std::string>{weights.begin()->first};
    }

    FixWeights(weights);
    const int base = ReductionFactor(weights);
    if (factor != nullptr) {
        *factor = base;
    }

    std::vector<std::string> sequence;
    for (const auto& [target, weight] : weights) {
        const int count = weight / base;
        for (int i = 0; i < count; ++i) {
            sequence.push_back(target);
        }
    }
    return sequence;
}

} // namespace rpclb::governance
