#ifndef UTILS_H
#define UTILS_H

#include <chrono>
#include <string>
#include <vector>
#include "types.h"

using Clock = std::chrono::high_resolution_clock;

//stopwatch for time it takes
struct Timer {
    Clock::time_point start;

    Timer() : start(Clock::now()) {}

    void reset() {
        start = Clock::now();
    }
    double elapsed() const{
        return std::chrono::duration<double>(Clock::now() - start).count();
    }
};

// Inverse standard normal CDF; u is clamped to [1e-10, 1 - 1e-10] first.
Real uniformToNormal(Real u);

// Argument checks, each throws std::invalid_argument naming the argument.
void requirePositive(const std::string& name, double value);
void requireNonNegative(const std::string& name, double value);
void requireIncreasingTimes(const std::vector<Real>& times);

// t_k = k * dt for k = 1..count
std::vector<Real> uniformTimeVector(Real dt, int count);

#endif
