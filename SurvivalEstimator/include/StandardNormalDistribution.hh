#ifndef SURVIVAL_STANDARD_NORMAL_DISTRIBUTION_HH
#define SURVIVAL_STANDARD_NORMAL_DISTRIBUTION_HH

/**
 * @file StandardNormalDistribution.hh
 * @brief Standard normal N(0,1) distribution functions
 */

namespace SurvivalEstimation {

class StandardNormalDistribution
{
 public:
  StandardNormalDistribution();
  virtual ~StandardNormalDistribution();

  // P(Z <= x)
  virtual double cdf(const double& x) const;

  // Inverse cumulative distribution function (aka the probit function)
  // Throws std::invalid_argument unless 0 < quantile < 1
  virtual double inv_cdf(const double& quantile) const;
};

} // namespace SurvivalEstimation

#endif // SURVIVAL_STANDARD_NORMAL_DISTRIBUTION_HH
