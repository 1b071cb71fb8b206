// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TWO_PROPORTION_MATH_H
#define __TWO_PROPORTION_MATH_H 1

#include <algorithm>
#include <cmath>
#include "NormalQuantile.h"
#include "TestParameters.h"

namespace abplanner
{
  namespace detail
  {
    using analysis::detail::clamp_open_probability;
    using analysis::detail::compute_normal_cdf;
    using analysis::detail::compute_normal_quantile;

    /**
     * @brief Critical value z_alpha for the requested alternative.
     *
     * The two cases are kept as separate branches: a one-tailed test uses
     * the whole alpha in one tail, a two-tailed test uses alpha/2 per tail.
     */
    inline double criticalZ(TestType testType, double significance)
    {
      if (testType == TestType::ONE_TAILED)
        return analysis::detail::compute_one_tailed_critical_value(significance);
      else
        return analysis::detail::compute_two_tailed_critical_value(significance);
    }

    /// z_beta = Phi^-1(power).
    inline double powerZ(double power)
    {
      return compute_normal_quantile(clamp_open_probability(power));
    }

    /// Standard deviation term under H0, sqrt(2 * pbar * (1 - pbar)).
    inline double pooledSigma(double p1, double p2)
    {
      const double pBar = (p1 + p2) / 2.0;
      return std::sqrt(2.0 * pBar * (1.0 - pBar));
    }

    /// Standard deviation term under H1, sqrt(p1 * q1 + p2 * q2).
    inline double unpooledSigma(double p1, double p2)
    {
      return std::sqrt(p1 * (1.0 - p1) + p2 * (1.0 - p2));
    }

    /**
     * @brief Unrounded per-variant sample size of the equal-allocation
     *        two-proportion z-test.
     *
     *   n = (z_alpha * sigma0 + z_beta * sigma1)^2 / (p2 - p1)^2
     *
     * A negative combined term (low power, or a one-tailed alpha above 0.5)
     * means any n already reaches the requested power, so it counts as zero.
     */
    inline double rawSampleSize(double p1, double p2, double zAlpha, double zBeta)
    {
      const double numerator =
        std::max(0.0, zAlpha * pooledSigma(p1, p2) + zBeta * unpooledSigma(p1, p2));
      const double delta = p2 - p1;
      return (numerator * numerator) / (delta * delta);
    }

    /**
     * @brief Power achieved with n subjects per variant against rates p1, p2.
     *
     * Inverts rawSampleSize for z_beta:
     *   z = (|p2 - p1| * sqrt(n) - z_alpha * sigma0) / sigma1
     * and maps it through Phi. The result is clamped into the open interval
     * (0, 1).
     */
    inline double achievedPower(double p1, double p2, double n, double zAlpha)
    {
      const double sigma1 = unpooledSigma(p1, p2);
      const double z = (std::fabs(p2 - p1) * std::sqrt(n) - zAlpha * pooledSigma(p1, p2)) / sigma1;
      return clamp_open_probability(compute_normal_cdf(z));
    }
  }
}

#endif
