#include <gtest/gtest.h>
#include "point_set.h"
#include "pricing.h"
#include "utils.h"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

AssetPathParams tutorialAsset() {
    return AssetPathParams{100.0, 0.02, 0.5, uniformTimeVector(1.0 / 52, 13)};
}

} // namespace

// Call / put ITM and OTM on a single monitored price
TEST(PayoffTest, CallAndPutOnOnePrice) {
    AssetPathParams asset{100.0, 0.0, 0.2, {1.0}};
    PayoffParams call{OptionType::European, PutCallType::Call, 100.0};
    PayoffParams put{OptionType::European, PutCallType::Put, 100.0};

    EXPECT_DOUBLE_EQ(discountedPayoff({80.0}, asset, call), 0.0);
    EXPECT_DOUBLE_EQ(discountedPayoff({100.0}, asset, call), 0.0);
    EXPECT_DOUBLE_EQ(discountedPayoff({120.0}, asset, call), 20.0);
    EXPECT_DOUBLE_EQ(discountedPayoff({80.0}, asset, put), 20.0);
    EXPECT_DOUBLE_EQ(discountedPayoff({120.0}, asset, put), 0.0);
}

TEST(PayoffTest, MeansAndDiscounting) {
    AssetPathParams asset{100.0, 0.05, 0.2, {0.5, 1.0}};
    std::vector<Real> S = {90.0, 160.0};
    PayoffParams arith{OptionType::ArithmeticMean, PutCallType::Call, 100.0};
    PayoffParams geo{OptionType::GeometricMean, PutCallType::Call, 100.0};
    Real df = std::exp(-0.05);
    EXPECT_NEAR(discountedPayoff(S, asset, arith), df * 25.0, 1e-12);
    EXPECT_NEAR(discountedPayoff(S, asset, geo), df * 20.0, 1e-12); // sqrt(90 * 160) = 120
}

TEST(PayoffTest, ZeroVolatilityIsDeterministic) {
    AssetPathParams asset = tutorialAsset();
    asset.volatility = 0.0;
    PayoffParams payoff{OptionType::GeometricMean, PutCallType::Call, 95.0};
    PayoffEvaluator eval(asset, payoff, PathConstruction::PCA);

    // S(t) = S0 e^{rt}, geometric mean over t_1..t_13 is S0 e^{r tbar}
    Real tbar = 7.0 / 52;
    Real expected = std::exp(-0.02 * 0.25) * (100.0 * std::exp(0.02 * tbar) - 95.0);

    PointSet points = generatePoints(SamplingMethod::IID, 13, 200, 4);
    for (int i = 0; i < points.count; ++i) {
        EXPECT_NEAR(eval.payoff(points.row(i)), expected, 1e-10);
    }
}

TEST(PayoffTest, ArithmeticDominatesGeometricPathwise) {
    AssetPathParams asset = tutorialAsset();
    PayoffParams arith{OptionType::ArithmeticMean, PutCallType::Call, 100.0};
    PayoffParams geo{OptionType::GeometricMean, PutCallType::Call, 100.0};
    PayoffEvaluator a(asset, arith, PathConstruction::Sequential);
    PayoffEvaluator g(asset, geo, PathConstruction::Sequential);

    PointSet points = generatePoints(SamplingMethod::Sobol, 13, 512, 6);
    for (int i = 0; i < points.count; ++i) {
        Real pa = a.payoff(points.row(i));
        Real pg = g.payoff(points.row(i));
        EXPECT_GE(pg, 0.0);
        EXPECT_GE(pa + 1e-12, pg);
    }
}

TEST(PayoffTest, EvaluatorMatchesPathPayoff) {
    AssetPathParams asset = tutorialAsset();
    PayoffParams put{OptionType::ArithmeticMean, PutCallType::Put, 105.0};
    for (PathConstruction c : {PathConstruction::Sequential, PathConstruction::PCA}) {
        PayoffEvaluator eval(asset, put, c);
        PointSet points = generatePoints(SamplingMethod::Lattice, 13, 64, 9);
        std::vector<Real> S(13);
        for (int i = 0; i < points.count; ++i) {
            eval.simulatePath(points.row(i), S.data());
            EXPECT_NEAR(eval.payoff(points.row(i)), discountedPayoff(S, asset, put), 1e-9);
        }
    }
}

TEST(PayoffTest, MidpointGivesMedianPath) {
    AssetPathParams asset = tutorialAsset();
    PayoffParams payoff{OptionType::European, PutCallType::Call, 0.0};
    PayoffEvaluator eval(asset, payoff, PathConstruction::Sequential);
    std::vector<Real> u(13, 0.5), S(13);
    eval.simulatePath(u.data(), S.data());
    for (int j = 0; j < 13; ++j) {
        Real t = asset.timeVector[j];
        EXPECT_NEAR(S[j], 100.0 * std::exp((0.02 - 0.125) * t), 1e-9);
    }
}

TEST(PayoffTest, RejectsBadParameters) {
    PayoffParams payoff{OptionType::GeometricMean, PutCallType::Call, 100.0};
    AssetPathParams asset = tutorialAsset();

    AssetPathParams negVol = asset;
    negVol.volatility = -0.1;
    EXPECT_THROW(PayoffEvaluator(negVol, payoff, PathConstruction::PCA), std::invalid_argument);

    AssetPathParams badPrice = asset;
    badPrice.initPrice = 0.0;
    EXPECT_THROW(PayoffEvaluator(badPrice, payoff, PathConstruction::PCA), std::invalid_argument);

    AssetPathParams badTimes = asset;
    badTimes.timeVector = {0.1, 0.3, 0.2};
    EXPECT_THROW(PayoffEvaluator(badTimes, payoff, PathConstruction::Sequential), std::invalid_argument);

    PayoffParams negStrike{OptionType::GeometricMean, PutCallType::Put, -1.0};
    EXPECT_THROW(PayoffEvaluator(asset, negStrike, PathConstruction::PCA), std::invalid_argument);
}

TEST(ExactPriceTest, EuropeanMatchesBlackScholes) {
    AssetPathParams asset{100.0, 0.05, 0.2, {0.5, 1.0}};
    PayoffParams call{OptionType::European, PutCallType::Call, 100.0};
    PayoffParams put{OptionType::European, PutCallType::Put, 100.0};
    EXPECT_NEAR(exactPrice(asset, call), 10.450583572185565, 1e-9);
    // put-call parity
    EXPECT_NEAR(exactPrice(asset, call) - exactPrice(asset, put), 100.0 - 100.0 * std::exp(-0.05), 1e-9);
}

TEST(ExactPriceTest, GeometricAsianTutorialValue) {
    PayoffParams call{OptionType::GeometricMean, PutCallType::Call, 100.0};
    PayoffParams put{OptionType::GeometricMean, PutCallType::Put, 100.0};
    EXPECT_NEAR(exactPrice(tutorialAsset(), call), 5.922987159131077, 1e-9);
    EXPECT_NEAR(exactPrice(tutorialAsset(), put), 6.169961348858172, 1e-9);
}

TEST(ExactPriceTest, GeometricWithOneDateIsEuropean) {
    AssetPathParams asset{100.0, 0.02, 0.5, {0.25}};
    PayoffParams geo{OptionType::GeometricMean, PutCallType::Call, 100.0};
    PayoffParams euro{OptionType::European, PutCallType::Call, 100.0};
    EXPECT_NEAR(exactPrice(asset, geo), exactPrice(asset, euro), 1e-12);
    EXPECT_NEAR(exactPrice(asset, euro), 10.174188145128625, 1e-9);
}

TEST(ExactPriceTest, DegenerateCases) {
    AssetPathParams asset = tutorialAsset();
    asset.volatility = 0.0;
    PayoffParams call{OptionType::GeometricMean, PutCallType::Call, 95.0};
    Real expected = std::exp(-0.02 * 0.25) * (100.0 * std::exp(0.02 * 7.0 / 52) - 95.0);
    EXPECT_NEAR(exactPrice(asset, call), expected, 1e-10);

    PayoffParams zeroStrikePut{OptionType::GeometricMean, PutCallType::Put, 0.0};
    EXPECT_DOUBLE_EQ(exactPrice(tutorialAsset(), zeroStrikePut), 0.0);
}

TEST(ExactPriceTest, ArithmeticHasNoClosedForm) {
    PayoffParams arith{OptionType::ArithmeticMean, PutCallType::Call, 100.0};
    EXPECT_FALSE(hasExactPrice(arith));
    EXPECT_THROW(exactPrice(tutorialAsset(), arith), std::invalid_argument);
}
