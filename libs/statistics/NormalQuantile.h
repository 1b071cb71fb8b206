#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace abplanner
{
  namespace analysis
  {
    namespace detail
    {
      /// Smallest distance from 0 and 1 that probabilities are clamped to
      /// before entering, or after leaving, the normal CDF/quantile.
      constexpr double kProbabilityEpsilon = 1.0e-12;

      /**
       * @brief Clamps a probability into the open interval (0, 1).
       *
       * Values are pulled into [kProbabilityEpsilon, 1 - kProbabilityEpsilon].
       * NaN is mapped to 0.5 so downstream quantile evaluation stays in domain.
       */
      inline double clamp_open_probability(double p) noexcept
      {
        if (std::isnan(p))
          return 0.5;

        return std::min(std::max(p, kProbabilityEpsilon), 1.0 - kProbabilityEpsilon);
      }

      /**
       * @brief Quantile (inverse CDF) of the standard normal distribution.
       *
       * Peter Acklam's rational approximation: one rational function for the
       * central region [0.02425, 0.97575] and a second one, in
       * q = sqrt(-2 log p), for both tails. Relative error is below 1.15e-9
       * over the whole domain.
       *
       * @param p Cumulative probability, strictly inside (0, 1).
       * @return z such that Phi(z) = p.
       * @throws std::domain_error if p is not in (0, 1).
       */
      inline double compute_normal_quantile(double p)
      {
        if (!(p > 0.0 && p < 1.0))
        {
          throw std::domain_error(
            "compute_normal_quantile: probability p must be in (0, 1)");
        }

        if (p == 0.5)
          return 0.0;

        static constexpr double a[6] = {
          -3.969683028665376e+01,  2.209460984245205e+02,
          -2.759285104469687e+02,  1.383577518672690e+02,
          -3.066479806614716e+01,  2.506628277459239e+00
        };
        static constexpr double b[5] = {
          -5.447609879822406e+01,  1.615858368580409e+02,
          -1.556989798598866e+02,  6.680131188771972e+01,
          -1.328068155288572e+01
        };
        static constexpr double c[6] = {
          -7.784894002430226e-03, -3.223964580411365e-01,
          -2.400758277161838e+00, -2.549732539343734e+00,
           4.374664141464968e+00,  2.938163982698783e+00
        };
        static constexpr double d[4] = {
           7.784695709041462e-03,  3.224671290700398e-01,
           2.445134137142996e+00,  3.754408661907416e+00
        };

        static constexpr double pLow  = 0.02425;
        static constexpr double pHigh = 1.0 - pLow;

        if (p < pLow)
        {
          const double q = std::sqrt(-2.0 * std::log(p));
          return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                 ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
        }

        if (p > pHigh)
        {
          const double q = std::sqrt(-2.0 * std::log(1.0 - p));
          return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                  ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
        }

        const double q = p - 0.5;
        const double r = q * q;
        return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
               (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
      }

      /**
       * @brief Standard normal CDF, Phi(z) = 0.5 * (1 + erf(z / sqrt(2))).
       */
      inline double compute_normal_cdf(double z) noexcept
      {
        constexpr double INV_SQRT2 = 0.7071067811865475244;
        return 0.5 * (1.0 + std::erf(z * INV_SQRT2));
      }

      /**
       * @brief Upper critical value for a one-tailed test at level alpha.
       *
       * Returns z with P(Z > z) = alpha, i.e. Phi^-1(1 - alpha). The full
       * alpha sits in a single tail.
       *
       * @example compute_one_tailed_critical_value(0.05) ~= 1.6449
       */
      inline double compute_one_tailed_critical_value(double alpha)
      {
        if (!(alpha > 0.0 && alpha < 1.0))
        {
          throw std::domain_error(
            "compute_one_tailed_critical_value: alpha must be in (0, 1)");
        }

        return compute_normal_quantile(clamp_open_probability(1.0 - alpha));
      }

      /**
       * @brief Critical value for a two-tailed test at level alpha.
       *
       * Returns z with P(|Z| > z) = alpha, i.e. Phi^-1(1 - alpha / 2).
       *
       * @example compute_two_tailed_critical_value(0.05) ~= 1.9600
       */
      inline double compute_two_tailed_critical_value(double alpha)
      {
        if (!(alpha > 0.0 && alpha < 1.0))
        {
          throw std::domain_error(
            "compute_two_tailed_critical_value: alpha must be in (0, 1)");
        }

        return compute_normal_quantile(clamp_open_probability(1.0 - alpha / 2.0));
      }
    } // namespace detail
  } // namespace analysis
} // namespace abplanner
