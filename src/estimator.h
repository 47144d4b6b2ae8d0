#ifndef ESTIMATOR_H
#define ESTIMATOR_H

#include <cstdint>
#include <string>
#include "types.h"
#include "brownian.h"
#include "point_set.h"
#include "pricing.h"

struct ToleranceSpec {
    Real absTol;
    Real relTol;
};

// Everything a pricing run needs. Immutable: the with* members return an updated copy.
class PriceRequest {
public:
    PriceRequest(const AssetPathParams& asset, const PayoffParams& payoff, const ToleranceSpec& tol);

    const AssetPathParams& assetParams() const { return asset_; }
    const PayoffParams& payoffParams() const { return payoff_; }
    const ToleranceSpec& tolerance() const { return tol_; }
    SamplingMethod cubMethod() const { return method_; }
    PathConstruction assembleType() const { return construction_; }
    Real alpha() const { return alpha_; }
    std::uint64_t maxSamples() const { return nMax_; }
    int replicates() const { return replicates_; }
    std::uint64_t seed() const { return seed_; }

    PriceRequest withCubMethod(SamplingMethod method) const;
    PriceRequest withAssembleType(PathConstruction construction) const;
    PriceRequest withTolerance(const ToleranceSpec& tol) const;
    PriceRequest withAlpha(Real alpha) const;
    PriceRequest withMaxSamples(std::uint64_t nMax) const;
    PriceRequest withReplicates(int replicates) const;
    PriceRequest withSeed(std::uint64_t seed) const;

private:
    AssetPathParams asset_;
    PayoffParams payoff_;
    ToleranceSpec tol_;
    SamplingMethod method_ = SamplingMethod::IID;
    PathConstruction construction_ = PathConstruction::Sequential;
    Real alpha_ = ALPHA_DEFAULT;
    std::uint64_t nMax_ = N_MAX_DEFAULT;
    int replicates_ = REPLICATES_DEFAULT;
    std::uint64_t seed_ = SEED_DEFAULT;
};

enum class EstimatorState { Initializing, Sampling, CheckingTolerance, Converged, ExhaustedBudget };
enum class EstimateStatus { Converged, BudgetExhausted };

struct PriceEstimate {
    const Real price;
    const Real errorBound;       // half-width at confidence 1 - alpha
    const std::uint64_t nSamples; // payoff evaluations, all replicates together
    const int rounds;
    const double time;           // seconds
    const EstimateStatus status;
    const SamplingMethod method;

    bool converged() const { return status == EstimateStatus::Converged; }
};

// Rejects bad input with std::invalid_argument before anything is sampled.
void validateRequest(const PriceRequest& request);

// max(absTol, relTol * |price|)
Real toleranceBound(const ToleranceSpec& tol, Real price);

// Adaptive price estimate: keeps adding points until the error bound is within
// tolerance or the sample budget is spent. Budget exhaustion is flagged in the
// result and warned about on std::cerr.
PriceEstimate genOptPrice(const PriceRequest& request);

#endif
