#pragma once

#include <map>
#include <string>
#include <vector>

#include <rpclb/core/status.h>

namespace rpclb::governance {

// endpoint identifier -> relative weight
using WeightTable = std::map<std::string, int>;

inline constexpr int kMinWeight = 1;

// Clamps every weight below kMinWeight up to kMinWeight.
void FixWeights(WeightTable& weights);

// Divisors of value, largest first: value, then value/2 .. 1.
// Empty when value <= kMinWeight.
std::vector<int> DescendingDivisors(int value);

// Largest divisor of the minimum weight that divides every weight.
// Only divisors of the minimum are considered, so the result is not always
// the GCD of the whole table. Expects fixed weights; returns 1 for an empty
// table.
int ReductionFactor(const WeightTable& weights);

// Expands weights into the round-robin sequence. Each identifier appears
// weight / ReductionFactor() times, its repeats contiguous, in key order.
// A single-entry table yields that identifier once.
// Fails with failed_precondition on an empty table. When factor is set it
// receives the reduction factor used (1 for a single entry).
rpclb::Result<std::vector<std::string>> BuildElectionSequence(WeightTable weights, int* factor = nullptr);

} // namespace rpclb::governance
