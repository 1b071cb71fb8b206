// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TEST_PARAMETERS_H
#define __TEST_PARAMETERS_H 1

#include <cstdint>
#include <optional>
#include <string>

namespace abplanner
{
  /**
   * @brief Alternative hypothesis of the two-proportion z-test.
   *
   * ONE_TAILED puts the full significance level in a single tail
   * (critical value Phi^-1(1 - alpha)); TWO_TAILED splits it
   * (critical value Phi^-1(1 - alpha/2)).
   */
  enum class TestType
  {
    ONE_TAILED,
    TWO_TAILED
  };

  /**
   * @brief How the minimum detectable effect moves the baseline rate.
   *
   * ABSOLUTE: variant rate = baseline + mde (mde in rate units)
   * RELATIVE: variant rate = baseline * (1 + mde) (mde as a relative lift)
   */
  enum class EffectType
  {
    ABSOLUTE,
    RELATIVE
  };

  std::string testTypeToString(TestType type);
  std::string effectTypeToString(EffectType type);

  // Accepts the strings produced by the *ToString functions
  // ("one_tailed", "two_tailed", "absolute", "relative"), case-insensitive.
  // Throws std::invalid_argument on anything else.
  TestType parseTestType(const std::string& text);
  EffectType parseEffectType(const std::string& text);

  /**
   * @class TestParameters
   * @brief Immutable inputs of a single sample size calculation.
   *
   * No validation happens here: the object faithfully carries whatever the
   * caller supplied so that SampleSizeEngine can report exactly which field
   * is wrong. The with*() methods return modified copies.
   */
  class TestParameters
  {
  public:
    TestParameters(double baselineRate,
                   double minimumDetectableEffect,
                   double power = 0.80,
                   double significance = 0.05,
                   TestType testType = TestType::TWO_TAILED,
                   std::optional<std::int64_t> dailyTraffic = std::nullopt,
                   EffectType effectType = EffectType::ABSOLUTE)
      : m_baselineRate(baselineRate),
        m_minimumDetectableEffect(minimumDetectableEffect),
        m_power(power),
        m_significance(significance),
        m_testType(testType),
        m_dailyTraffic(dailyTraffic),
        m_effectType(effectType)
    {}

    double getBaselineRate() const
    {
      return m_baselineRate;
    }

    double getMinimumDetectableEffect() const
    {
      return m_minimumDetectableEffect;
    }

    double getPower() const
    {
      return m_power;
    }

    double getSignificance() const
    {
      return m_significance;
    }

    TestType getTestType() const
    {
      return m_testType;
    }

    EffectType getEffectType() const
    {
      return m_effectType;
    }

    const std::optional<std::int64_t>& getDailyTraffic() const
    {
      return m_dailyTraffic;
    }

    /// Variant conversion rate implied by a given effect under this
    /// parameter set's effect type.
    double variantRateFor(double effect) const
    {
      if (m_effectType == EffectType::RELATIVE)
        return m_baselineRate * (1.0 + effect);

      return m_baselineRate + effect;
    }

    double getVariantRate() const
    {
      return variantRateFor(m_minimumDetectableEffect);
    }

    TestParameters withBaselineRate(double baselineRate) const
    {
      TestParameters copy(*this);
      copy.m_baselineRate = baselineRate;
      return copy;
    }

    TestParameters withMinimumDetectableEffect(double mde) const
    {
      TestParameters copy(*this);
      copy.m_minimumDetectableEffect = mde;
      return copy;
    }

    TestParameters withPower(double power) const
    {
      TestParameters copy(*this);
      copy.m_power = power;
      return copy;
    }

    TestParameters withSignificance(double significance) const
    {
      TestParameters copy(*this);
      copy.m_significance = significance;
      return copy;
    }

    TestParameters withTestType(TestType testType) const
    {
      TestParameters copy(*this);
      copy.m_testType = testType;
      return copy;
    }

    TestParameters withEffectType(EffectType effectType) const
    {
      TestParameters copy(*this);
      copy.m_effectType = effectType;
      return copy;
    }

    TestParameters withDailyTraffic(std::optional<std::int64_t> dailyTraffic) const
    {
      TestParameters copy(*this);
      copy.m_dailyTraffic = dailyTraffic;
      return copy;
    }

    bool operator==(const TestParameters& rhs) const
    {
      return m_baselineRate == rhs.m_baselineRate &&
             m_minimumDetectableEffect == rhs.m_minimumDetectableEffect &&
             m_power == rhs.m_power &&
             m_significance == rhs.m_significance &&
             m_testType == rhs.m_testType &&
             m_dailyTraffic == rhs.m_dailyTraffic &&
             m_effectType == rhs.m_effectType;
    }

    bool operator!=(const TestParameters& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    double m_baselineRate;
    double m_minimumDetectableEffect;
    double m_power;
    double m_significance;
    TestType m_testType;
    std::optional<std::int64_t> m_dailyTraffic;
    EffectType m_effectType;
  };
}

#endif
