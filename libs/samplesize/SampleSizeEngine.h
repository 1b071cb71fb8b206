// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __SAMPLE_SIZE_ENGINE_H
#define __SAMPLE_SIZE_ENGINE_H 1

#include <cstdint>
#include <optional>
#include "CalculationResult.h"
#include "PowerCurve.h"
#include "SampleSizeException.h"
#include "TestParameters.h"

namespace abplanner
{
  /**
   * @class SampleSizeEngine
   * @brief Sample size, duration and power curve for a two-proportion z-test.
   *
   * For control rate p1 and variant rate p2 with equal allocation:
   *
   *   pbar = (p1 + p2) / 2
   *   n    = (z_alpha * sqrt(2 pbar (1 - pbar)) + z_beta * sqrt(p1 q1 + p2 q2))^2
   *          / (p2 - p1)^2
   *
   * where z_alpha = Phi^-1(1 - alpha/2) for a two-tailed test and
   * Phi^-1(1 - alpha) for a one-tailed test, and z_beta = Phi^-1(power).
   * The per-variant size is ceil(n): a result is never allowed to
   * under-power the test.
   *
   * The engine keeps nothing between calls except its immutable power curve
   * settings, so a single instance may be shared between threads.
   */
  class SampleSizeEngine
  {
  public:
    /// Largest per-variant sample size the engine will report (2^62).
    static constexpr std::uint64_t kMaxSampleSizePerVariant = std::uint64_t(1) << 62;

    SampleSizeEngine();

    // Throws InvalidParameterException if the settings are unusable.
    explicit SampleSizeEngine(const PowerCurveSettings& curveSettings);

    /**
     * @brief Validates the parameters and computes the full result.
     *
     * @throws InvalidParameterException on the first failing check; nothing
     *         is computed in that case.
     */
    CalculationResult calculate(const TestParameters& parameters) const;

    /**
     * @brief Validation only. Checks run in a fixed order: baseline rate,
     *        MDE, variant rate, power, significance, daily traffic.
     */
    static void validate(const TestParameters& parameters);

    /// Validates, then returns ceil(n) without building a curve.
    static std::uint64_t computeSampleSizePerVariant(const TestParameters& parameters);

    /**
     * @brief Power achieved at a given effect size with a fixed per-variant n.
     *
     * The effect is interpreted with the parameter set's EffectType.
     */
    static double computeAchievedPower(const TestParameters& parameters,
                                       std::uint64_t sampleSizePerVariant,
                                       double effectSize);

    static TestSummary summarize(const TestParameters& parameters);

    /// ceil(total / dailyTraffic); empty when traffic is absent or not positive.
    static std::optional<std::uint64_t> estimateDays(std::uint64_t totalSampleSize,
                                                     const std::optional<std::int64_t>& dailyTraffic);

    const PowerCurveSettings& getCurveSettings() const
    {
      return m_curveSettings;
    }

  private:
    static std::uint64_t sampleSizeFromValidated(const TestParameters& parameters);

  private:
    PowerCurveSettings m_curveSettings;
  };
}

#endif
