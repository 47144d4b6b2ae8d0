#include "estimator.h"
#include "point_set.h"
#include "pricing.h"
#include "types.h"
#include "utils.h"
#include <cstdio>
#include <exception>
#include <iostream>

static void reportPoints(SamplingMethod method)
{
    PointSet points = generatePoints(method, PLOT_DIM_DEFAULT, PLOT_POINTS_DEFAULT, SEED_DEFAULT);
    std::printf("  %-8s %d points in [0,1)^%d, centered L2 discrepancy %.5f\n",
                methodName(method).c_str(), points.count, points.dim, centeredL2Discrepancy(points));
}

static void reportPrice(const PriceRequest& request, const PriceEstimate& est, const PriceEstimate* iid)
{
    std::printf("The price of the %s option using %s sampling with %s\n",
                optionName(request.payoffParams()).c_str(), methodName(est.method).c_str(),
                constructionName(request.assembleType()).c_str());
    std::printf("   is $%3.3f +/- $%2.3f and this took %3.6f seconds (%llu samples)",
                est.price, request.tolerance().absTol, est.time, static_cast<unsigned long long>(est.nSamples));
    if (iid != nullptr && iid->time > 0.0){
        std::printf(",\n   which is only %1.4f the time required by IID sampling", est.time / iid->time);
    }
    std::printf("\n");
    if (!est.converged()){
        std::printf("   (sample budget exhausted, error bound $%2.4f)\n", est.errorBound);
    }
}

int main()
{
    try
    {
        // Different sampling strategies: IID points have gaps and clusters, Sobol' and lattice points don't
        std::cout << "Sampling the unit square\n";
        reportPoints(SamplingMethod::IID);
        reportPoints(SamplingMethod::Sobol);
        reportPoints(SamplingMethod::Lattice);
        std::cout << "\n";

        // Asian geometric mean call with weekly monitoring for three months
        AssetPathParams asset{S0_DEFAULT, r_DEFAULT, sigma_DEFAULT, uniformTimeVector(DT_DEFAULT, WEEKS_DEFAULT)};
        PayoffParams payoff{OptionType::GeometricMean, PutCallType::Call, K_DEFAULT};
        ToleranceSpec tol{ABS_TOL_DEFAULT, REL_TOL_DEFAULT};

        PriceRequest iidRequest(asset, payoff, tol);
        PriceEstimate iid = genOptPrice(iidRequest);
        reportPrice(iidRequest, iid, nullptr);

        PriceRequest sobolRequest = iidRequest.withCubMethod(SamplingMethod::Sobol);
        reportPrice(sobolRequest, genOptPrice(sobolRequest), &iid);

        // PCA construction lowers the effective dimension
        PriceRequest sobolPcaRequest = sobolRequest.withAssembleType(PathConstruction::PCA);
        reportPrice(sobolPcaRequest, genOptPrice(sobolPcaRequest), &iid);

        PriceRequest latticeRequest = sobolPcaRequest.withCubMethod(SamplingMethod::Lattice);
        reportPrice(latticeRequest, genOptPrice(latticeRequest), &iid);

        std::printf("\nThe exact price is $%3.4f\n", exactPrice(asset, payoff));
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
