// SampleSizeEngineTest.cpp
//
// Unit tests for SampleSizeEngine: parameter validation, the two-proportion
// sample size formula, duration estimates and the monotonicity properties
// the result must satisfy.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include "SampleSizeEngine.h"

using namespace abplanner;
using Catch::Approx;

namespace
{
  TestParameters standardParameters()
  {
    return TestParameters(0.10, 0.02, 0.80, 0.05, TestType::TWO_TAILED, std::int64_t(1000));
  }

  std::string failingField(const TestParameters& parameters)
  {
    try
    {
      SampleSizeEngine().calculate(parameters);
    }
    catch (const InvalidParameterException& e)
    {
      return e.getField();
    }
    return "";
  }
}

TEST_CASE("SampleSizeEngine: worked example", "[SampleSizeEngine]")
{
  SampleSizeEngine engine;
  const CalculationResult result = engine.calculate(standardParameters());

  REQUIRE(result.getSampleSizePerVariant() == 3841);
  REQUIRE(result.getTotalSampleSize() == 7682);
  REQUIRE(result.getEstimatedDays().has_value());
  REQUIRE(*result.getEstimatedDays() == 8);
}

TEST_CASE("SampleSizeEngine: reference sample sizes", "[SampleSizeEngine]")
{
  SampleSizeEngine engine;

  SECTION("One-tailed uses the full alpha in a single tail")
  {
    auto params = standardParameters().withTestType(TestType::ONE_TAILED);
    REQUIRE(engine.calculate(params).getSampleSizePerVariant() == 3026);
  }

  SECTION("Relative effect: 5% baseline, 10% relative lift")
  {
    TestParameters params(0.05, 0.10, 0.80, 0.05, TestType::TWO_TAILED, std::nullopt,
                          EffectType::RELATIVE);
    REQUIRE(engine.calculate(params).getSampleSizePerVariant() == 31234);
  }

  SECTION("Higher power and stricter alpha")
  {
    TestParameters params(0.20, 0.05, 0.90, 0.01);
    REQUIRE(engine.calculate(params).getSampleSizePerVariant() == 2074);
  }

  SECTION("computeSampleSizePerVariant agrees with calculate")
  {
    TestParameters params(0.30, 0.05);
    REQUIRE(SampleSizeEngine::computeSampleSizePerVariant(params) == 1377);
    REQUIRE(engine.calculate(params).getSampleSizePerVariant() == 1377);
  }
}

TEST_CASE("SampleSizeEngine: validation", "[SampleSizeEngine][validation]")
{
  const TestParameters base = standardParameters();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  SECTION("Baseline rate must lie in (0, 1)")
  {
    REQUIRE(failingField(base.withBaselineRate(0.0)) == "baseline_rate");
    REQUIRE(failingField(base.withBaselineRate(1.0)) == "baseline_rate");
    REQUIRE(failingField(base.withBaselineRate(1.5)) == "baseline_rate");
    REQUIRE(failingField(base.withBaselineRate(-0.2)) == "baseline_rate");
    REQUIRE(failingField(base.withBaselineRate(nan)) == "baseline_rate");
  }

  SECTION("MDE must be strictly positive")
  {
    REQUIRE(failingField(base.withMinimumDetectableEffect(0.0)) == "minimum_detectable_effect");
    REQUIRE(failingField(base.withMinimumDetectableEffect(-0.01)) == "minimum_detectable_effect");
    REQUIRE(failingField(base.withMinimumDetectableEffect(nan)) == "minimum_detectable_effect");
  }

  SECTION("Variant rate must stay inside (0, 1)")
  {
    auto params = base.withBaselineRate(0.95).withMinimumDetectableEffect(0.05);
    REQUIRE_THROWS_AS(SampleSizeEngine().calculate(params), InvalidParameterException);
    REQUIRE(failingField(params) == "minimum_detectable_effect");

    auto relative = TestParameters(0.6, 0.7).withEffectType(EffectType::RELATIVE);
    REQUIRE(failingField(relative) == "minimum_detectable_effect");

    try
    {
      SampleSizeEngine().calculate(base.withMinimumDetectableEffect(0.95));
      FAIL("expected InvalidParameterException");
    }
    catch (const InvalidParameterException& e)
    {
      REQUIRE(e.getReason() == "effect pushes conversion rate out of bounds");
    }
  }

  SECTION("Power and significance must lie in (0, 1)")
  {
    REQUIRE(failingField(base.withPower(0.0)) == "power");
    REQUIRE(failingField(base.withPower(1.0)) == "power");
    REQUIRE(failingField(base.withSignificance(0.0)) == "significance");
    REQUIRE(failingField(base.withSignificance(1.2)) == "significance");
  }

  SECTION("Daily traffic must be non-negative")
  {
    REQUIRE(failingField(base.withDailyTraffic(std::int64_t(-5))) == "daily_traffic");
  }

  SECTION("Checks run in a fixed order")
  {
    TestParameters allBad(2.0, -1.0, 3.0, 4.0, TestType::TWO_TAILED, std::int64_t(-1));
    REQUIRE(failingField(allBad) == "baseline_rate");
    REQUIRE(failingField(allBad.withBaselineRate(0.1)) == "minimum_detectable_effect");
    REQUIRE(failingField(allBad.withBaselineRate(0.1).withMinimumDetectableEffect(0.01)) == "power");
  }

  SECTION("An effect too small to size is rejected")
  {
    TestParameters tiny(0.5, 1.0e-12);
    REQUIRE(failingField(tiny) == "minimum_detectable_effect");
  }

  SECTION("validate() accepts sound parameters")
  {
    REQUIRE_NOTHROW(SampleSizeEngine::validate(base));
  }
}

TEST_CASE("SampleSizeEngine: duration estimate", "[SampleSizeEngine][duration]")
{
  SampleSizeEngine engine;
  const TestParameters base = standardParameters();

  SECTION("Absent daily traffic yields no estimate")
  {
    REQUIRE_FALSE(engine.calculate(base.withDailyTraffic(std::nullopt)).getEstimatedDays().has_value());
  }

  SECTION("Zero daily traffic is treated as not provided")
  {
    REQUIRE_FALSE(engine.calculate(base.withDailyTraffic(std::int64_t(0))).getEstimatedDays().has_value());
  }

  SECTION("Days are rounded up")
  {
    REQUIRE(*engine.calculate(base.withDailyTraffic(std::int64_t(7682))).getEstimatedDays() == 1);
    REQUIRE(*engine.calculate(base.withDailyTraffic(std::int64_t(7681))).getEstimatedDays() == 2);
    REQUIRE(*engine.calculate(base.withDailyTraffic(std::int64_t(1))).getEstimatedDays() == 7682);
  }

  SECTION("Days equal ceil(total / traffic) across traffic levels")
  {
    for (std::int64_t traffic : {3, 17, 250, 999, 5000, 100000})
    {
      const auto result = engine.calculate(base.withDailyTraffic(traffic));
      const std::uint64_t total = result.getTotalSampleSize();
      const auto perDay = static_cast<std::uint64_t>(traffic);
      REQUIRE(*result.getEstimatedDays() == (total + perDay - 1) / perDay);
    }
  }
}

TEST_CASE("SampleSizeEngine: structural properties", "[SampleSizeEngine][properties]")
{
  SampleSizeEngine engine;
  const std::vector<double> baselines = {0.01, 0.05, 0.1, 0.3, 0.5, 0.8};

  SECTION("Per-variant size is at least one and total is exactly double")
  {
    for (double baseline : baselines)
    {
      for (double mde : {0.001, 0.01, 0.05, 0.15})
      {
        TestParameters params(baseline, mde);
        if (baseline + mde >= 1.0)
          continue;

        const auto result = engine.calculate(params);
        REQUIRE(result.getSampleSizePerVariant() >= 1);
        REQUIRE(result.getTotalSampleSize() == 2 * result.getSampleSizePerVariant());
      }
    }

    TestParameters huge(0.01, 0.98, 0.51, 0.9);
    REQUIRE(engine.calculate(huge).getSampleSizePerVariant() >= 1);
  }

  SECTION("Increasing power never decreases the sample size")
  {
    for (double baseline : baselines)
    {
      std::uint64_t previous = 0;
      for (double power : {0.5, 0.6, 0.7, 0.8, 0.85, 0.9, 0.95, 0.99})
      {
        const auto n = engine.calculate(TestParameters(baseline, 0.01, power, 0.05)).getSampleSizePerVariant();
        REQUIRE(n >= previous);
        previous = n;
      }
    }
  }

  SECTION("Increasing significance never increases the sample size")
  {
    for (double baseline : baselines)
    {
      for (TestType type : {TestType::ONE_TAILED, TestType::TWO_TAILED})
      {
        std::uint64_t previous = std::numeric_limits<std::uint64_t>::max();
        for (double alpha : {0.001, 0.01, 0.025, 0.05, 0.1, 0.2})
        {
          const auto n = engine.calculate(TestParameters(baseline, 0.01, 0.8, alpha, type)).getSampleSizePerVariant();
          REQUIRE(n <= previous);
          previous = n;
        }
      }
    }
  }

  SECTION("Shrinking the MDE strictly increases the sample size without bound")
  {
    std::uint64_t previous = 0;
    for (double mde : {0.05, 0.02, 0.01, 0.005, 0.001, 0.0001, 0.00001})
    {
      const auto n = engine.calculate(TestParameters(0.1, mde)).getSampleSizePerVariant();
      REQUIRE(n > previous);
      previous = n;
    }
    REQUIRE(previous > 1000000000ULL);
  }

  SECTION("One-tailed never needs more subjects than two-tailed")
  {
    for (double baseline : baselines)
    {
      for (double alpha : {0.01, 0.05, 0.1})
      {
        TestParameters params(baseline, 0.01, 0.8, alpha);
        const auto oneTailed = engine.calculate(params.withTestType(TestType::ONE_TAILED));
        const auto twoTailed = engine.calculate(params.withTestType(TestType::TWO_TAILED));
        REQUIRE(oneTailed.getSampleSizePerVariant() <= twoTailed.getSampleSizePerVariant());
      }
    }
  }
}

TEST_CASE("SampleSizeEngine: achieved power and summary", "[SampleSizeEngine]")
{
  const TestParameters params = standardParameters();

  SECTION("Power at the configured MDE matches the target")
  {
    const auto n = SampleSizeEngine::computeSampleSizePerVariant(params);
    const double achieved = SampleSizeEngine::computeAchievedPower(params, n, 0.02);
    REQUIRE(achieved >= 0.80 - 1e-9);
    REQUIRE(achieved == Approx(0.80).margin(0.005));
  }

  SECTION("Power grows with the sample size")
  {
    REQUIRE(SampleSizeEngine::computeAchievedPower(params, 1000, 0.02) <
            SampleSizeEngine::computeAchievedPower(params, 5000, 0.02));
  }

  SECTION("Out-of-range effect is rejected")
  {
    REQUIRE_THROWS_AS(SampleSizeEngine::computeAchievedPower(params, 3841, 0.95),
                      InvalidParameterException);
  }

  SECTION("Summary reports both effect forms")
  {
    const TestSummary absolute = SampleSizeEngine::summarize(params);
    REQUIRE(absolute.controlRate == Approx(0.10));
    REQUIRE(absolute.variantRate == Approx(0.12));
    REQUIRE(absolute.absoluteEffect == Approx(0.02));
    REQUIRE(absolute.relativeEffect == Approx(0.20));

    const TestSummary relative =
      SampleSizeEngine::summarize(TestParameters(0.05, 0.10).withEffectType(EffectType::RELATIVE));
    REQUIRE(relative.variantRate == Approx(0.055));
    REQUIRE(relative.absoluteEffect == Approx(0.005));
    REQUIRE(relative.relativeEffect == Approx(0.10));
  }

  SECTION("Curve settings are validated at construction")
  {
    REQUIRE_THROWS_AS(SampleSizeEngine(PowerCurveSettings(1, 0.1, 3.0)), InvalidParameterException);
    REQUIRE_NOTHROW(SampleSizeEngine(PowerCurveSettings(10, 0.5, 2.0)));
  }
}

TEST_CASE("SampleSizeEngine: power below one half and one-tailed alpha above one half",
          "[SampleSizeEngine][properties]")
{
  const SampleSizeEngine engine;

  SECTION("Sample size stays monotone in power across the whole range")
  {
    std::uint64_t previous = 0;
    for (double power : {0.01, 0.02, 0.025, 0.05, 0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.8})
    {
      const auto n = engine.calculate(TestParameters(0.10, 0.02, power, 0.05)).getSampleSizePerVariant();
      INFO("power = " << power);
      REQUIRE(n >= previous);
      previous = n;
    }
  }

  SECTION("Sample size stays monotone in significance for one-tailed tests")
  {
    std::uint64_t previous = std::numeric_limits<std::uint64_t>::max();
    for (double alpha : {0.05, 0.2, 0.4, 0.5, 0.6, 0.7, 0.9, 0.99})
    {
      const auto n = engine.calculate(TestParameters(0.10, 0.02, 0.2, alpha, TestType::ONE_TAILED))
                       .getSampleSizePerVariant();
      INFO("alpha = " << alpha);
      REQUIRE(n <= previous);
      previous = n;
    }
  }

  SECTION("A target any sample already reaches needs a single subject")
  {
    REQUIRE(engine.calculate(TestParameters(0.10, 0.02, 0.01, 0.05)).getSampleSizePerVariant() == 1);
    REQUIRE(engine.calculate(TestParameters(0.10, 0.02, 0.2, 0.9, TestType::ONE_TAILED))
              .getSampleSizePerVariant() == 1);
  }

  SECTION("The computed size always reaches the configured power")
  {
    for (double power : {0.01, 0.05, 0.2, 0.4})
    {
      for (double alpha : {0.05, 0.6, 0.9})
      {
        const TestParameters params(0.10, 0.02, power, alpha, TestType::ONE_TAILED);
        const auto n = engine.calculate(params).getSampleSizePerVariant();
        INFO("power = " << power << ", alpha = " << alpha);
        REQUIRE(SampleSizeEngine::computeAchievedPower(params, n, 0.02) >= power - 1e-6);
      }
    }
  }
}
