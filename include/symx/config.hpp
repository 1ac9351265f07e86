#pragma once
#include <cstddef>

namespace symx {

// Tolerance for every coefficient, exponent and value comparison
inline constexpr double kEpsilon = 1e-10;

// Fixed-point loops (trig rewriting, strategy pipelines)
inline constexpr int kMaxIterations = 10;

// Exponential cancellation re-runs inside one fraction
inline constexpr int kMaxExpCancelPasses = 5;

// Largest integer power of a sum that gets multiplied out
inline constexpr int kMaxExpandPower = 10;

// Below this many distinct forms the orchestrator runs its padding strategies
inline constexpr std::size_t kMinDistinctForms = 3;

// Euclid steps on floating coefficients before giving up on a common divisor
inline constexpr int kMaxGcdSteps = 64;

} // namespace symx
