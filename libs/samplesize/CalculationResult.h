// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CALCULATION_RESULT_H
#define __CALCULATION_RESULT_H 1

#include <cstdint>
#include <optional>
#include "PowerCurve.h"

namespace abplanner
{
  /**
   * @brief Human facing description of the hypothesis being sized.
   *
   * absoluteEffect is p2 - p1 in rate units; relativeEffect is
   * (p2 - p1) / p1, independent of which EffectType the MDE was given in.
   */
  struct TestSummary
  {
    double controlRate;
    double variantRate;
    double absoluteEffect;
    double relativeEffect;
  };

  /**
   * @class CalculationResult
   * @brief Output of SampleSizeEngine::calculate.
   *
   * The total sample size is derived, never stored independently, so it is
   * always exactly twice the per-variant size (two arms, equal allocation).
   */
  class CalculationResult
  {
  public:
    CalculationResult(std::uint64_t sampleSizePerVariant,
                      std::optional<std::uint64_t> estimatedDays,
                      const PowerCurve& powerCurve,
                      const TestSummary& summary)
      : m_sampleSizePerVariant(sampleSizePerVariant),
        m_estimatedDays(estimatedDays),
        m_powerCurve(powerCurve),
        m_summary(summary)
    {}

    std::uint64_t getSampleSizePerVariant() const
    {
      return m_sampleSizePerVariant;
    }

    std::uint64_t getTotalSampleSize() const
    {
      return 2 * m_sampleSizePerVariant;
    }

    const std::optional<std::uint64_t>& getEstimatedDays() const
    {
      return m_estimatedDays;
    }

    const PowerCurve& getPowerCurve() const
    {
      return m_powerCurve;
    }

    const TestSummary& getSummary() const
    {
      return m_summary;
    }

  private:
    std::uint64_t m_sampleSizePerVariant;
    std::optional<std::uint64_t> m_estimatedDays;
    PowerCurve m_powerCurve;
    TestSummary m_summary;
  };
}

#endif
