#include "utils.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <boost/math/distributions/normal.hpp>

Real uniformToNormal(Real u)
{
    Real uval = std::min(std::max(u, 1e-10), 1.0 - 1e-10);
    static const boost::math::normal_distribution<Real> stdNormal(0.0, 1.0);
    return boost::math::quantile(stdNormal, uval);
}

void requirePositive(const std::string& name, double value)
{
    if (!(value > 0.0)){
        std::ostringstream os;
        os << name << " must be positive, got " << value;
        throw std::invalid_argument(os.str());
    }
}

void requireNonNegative(const std::string& name, double value)
{
    if (!(value >= 0.0)){
        std::ostringstream os;
        os << name << " must be non-negative, got " << value;
        throw std::invalid_argument(os.str());
    }
}

void requireIncreasingTimes(const std::vector<Real>& times)
{
    if (times.empty()){
        throw std::invalid_argument("time vector must not be empty");
    }
    requirePositive("first monitoring time", times[0]);
    for (std::size_t j = 1; j < times.size(); ++j){
        if (!(times[j] > times[j - 1])){
            std::ostringstream os;
            os << "time vector must be strictly increasing, t[" << j << "] = " << times[j]
               << " after t[" << j - 1 << "] = " << times[j - 1];
            throw std::invalid_argument(os.str());
        }
    }
}

std::vector<Real> uniformTimeVector(Real dt, int count)
{
    requirePositive("time step", dt);
    requirePositive("number of monitoring dates", count);
    std::vector<Real> times(count);
    for (int k = 0; k < count; ++k){
        times[k] = dt * (k + 1);
    }
    return times;
}
