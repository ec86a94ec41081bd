#include "StandardNormalDistribution.hh"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace SurvivalEstimation {

StandardNormalDistribution::StandardNormalDistribution()
{
}

StandardNormalDistribution::~StandardNormalDistribution()
{
}

// Cumulative density function, P(Z <= x) via the complementary error function
double StandardNormalDistribution::cdf(const double& x) const {
  return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

// Inverse cumulative distribution function (aka the probit function)
double StandardNormalDistribution::inv_cdf(const double& quantile) const {
  if (!(quantile > 0.0 && quantile < 1.0)) {
    std::stringstream os;
    os << "Invalid input argument (" << quantile
       << "); must be larger than 0 but less than 1.";
    throw std::invalid_argument( os.str() );
  }

  // Beasley-Springer-Moro, see Glasserman [2004]: rational approximation
  // in the central region, Moro's Chebyshev series in the tails
  static const double a[4] = {   2.50662823884,
                               -18.61500062529,
                                41.39119773534,
                               -25.44106049637};

  static const double b[4] = {  -8.47351093090,
                                23.08336743743,
                               -21.06224101826,
                                 3.13082909833};

  static const double c[9] = {0.3374754822726147,
                              0.9761690190917186,
                              0.1607979714918209,
                              0.0276438810333863,
                              0.0038405729373609,
                              0.0003951896511919,
                              0.0000321767881768,
                              0.0000002888167364,
                              0.0000003960315187};

  double y = quantile - 0.5;

  if (std::fabs(y) < 0.42) {
    double r = y * y;
    double num = y * (((a[3]*r + a[2])*r + a[1])*r + a[0]);
    double denom = ((((b[3]*r + b[2])*r + b[1])*r + b[0])*r + 1.0);
    return num/denom;
  }

  double r = (y > 0.0) ? 1.0 - quantile : quantile;
  double s = std::log(-std::log(r));
  double x = c[0];
  double sk = 1.0;
  for (int i=1; i<9; i++) {
    sk *= s;
    x += c[i] * sk;
  }
  return (y > 0.0) ? x : -x;
}

} // namespace SurvivalEstimation
