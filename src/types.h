// types.h
#ifndef TYPES_H
#define TYPES_H

#include <cstdint>

using Real = double;

// Default parameters: Asian geometric mean call, weekly monitoring for three months
constexpr Real  S0_DEFAULT     = 100.0;   // initial stock price
constexpr Real  K_DEFAULT      = 100.0;   // strike
constexpr Real  r_DEFAULT      = 0.02;    // risk-free rate
constexpr Real  sigma_DEFAULT  = 0.5;     // volatility
constexpr int   WEEKS_DEFAULT  = 13;      // # of monitoring dates
constexpr Real  DT_DEFAULT     = 1.0 / 52; // weekly spacing (years)

// Default stopping parameters
constexpr Real  ABS_TOL_DEFAULT = 0.005;  // half a cent
constexpr Real  REL_TOL_DEFAULT = 0.0;
constexpr Real  ALPHA_DEFAULT   = 0.01;   // 99% confidence
constexpr Real  INFLATE_DEFAULT = 1.2;    // IID std dev inflation

constexpr std::uint64_t N_IID_INIT_DEFAULT = 1u << 13;  // IID pilot batch
constexpr std::uint64_t N_QMC_INIT_DEFAULT = 1u << 10;  // points per replicate, first round
constexpr std::uint64_t N_MAX_DEFAULT      = 1ull << 28; // total sample budget
constexpr int           REPLICATES_DEFAULT = 16;
constexpr std::uint64_t SEED_DEFAULT       = 20160101;

// Demo point plots
constexpr int   PLOT_DIM_DEFAULT    = 2;
constexpr int   PLOT_POINTS_DEFAULT = 256;

#endif // TYPES_H
