#ifndef PRICING_H
#define PRICING_H

#include <string>
#include <vector>
#include "types.h"
#include "brownian.h"

// Geometric Brownian motion under the risk-neutral measure
struct AssetPathParams {
    Real initPrice;          // S0
    Real interest;           // risk-free rate
    Real volatility;
    std::vector<Real> timeVector; // monitoring times, strictly increasing
};

enum class OptionType { European, ArithmeticMean, GeometricMean };
enum class PutCallType { Call, Put };

struct PayoffParams {
    OptionType optType;
    PutCallType putCallType;
    Real strike;
};

std::string optionName(const PayoffParams& payoff);

// throw std::invalid_argument on bad parameters
void validateAssetParams(const AssetPathParams& asset);
void validatePayoffParams(const PayoffParams& payoff);

// Turns one point of [0,1)^d into a discounted payoff. Holds scratch buffers,
// so one evaluator serves one thread.
class PayoffEvaluator {
public:
    PayoffEvaluator(const AssetPathParams& asset, const PayoffParams& payoff, PathConstruction construction);

    int dimension() const { return bm_.dimension(); }

    // S(t_1..t_d) for the point u
    void simulatePath(const Real* u, Real* S);

    // discounted option payoff for the point u
    Real payoff(const Real* u);

private:
    void logPath(const Real* u);

    AssetPathParams asset_;
    PayoffParams payoffParams_;
    BrownianMotion bm_;
    std::vector<Real> drift_;   // log S0 + (r - sigma^2/2) t_j
    Real discount_;
    std::vector<Real> z_, B_, logS_;
};

// Discounted payoff of a single monitored path S(t_1..t_d)
Real discountedPayoff(const std::vector<Real>& S, const AssetPathParams& asset, const PayoffParams& payoff);

// Closed-form price: Black-Scholes for European, lognormal formula for discrete geometric mean.
// Arithmetic mean has no closed form and throws std::invalid_argument.
bool hasExactPrice(const PayoffParams& payoff);
Real exactPrice(const AssetPathParams& asset, const PayoffParams& payoff);

#endif
