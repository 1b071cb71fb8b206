#include "SampleSizeEngine.h"
#include <algorithm>
#include <cmath>
#include <string>
#include "TwoProportionMath.h"

namespace abplanner
{
  namespace
  {
    bool isOpenUnitInterval(double value)
    {
      return value > 0.0 && value < 1.0;
    }
  }

  SampleSizeEngine::SampleSizeEngine()
    : m_curveSettings()
  {}

  SampleSizeEngine::SampleSizeEngine(const PowerCurveSettings& curveSettings)
    : m_curveSettings(curveSettings)
  {
    m_curveSettings.validate();
  }

  void SampleSizeEngine::validate(const TestParameters& parameters)
  {
    if (!isOpenUnitInterval(parameters.getBaselineRate()))
      throw InvalidParameterException("baseline_rate", "must be strictly between 0 and 1");

    if (!(parameters.getMinimumDetectableEffect() > 0.0))
      throw InvalidParameterException("minimum_detectable_effect", "must be strictly positive");

    if (!isOpenUnitInterval(parameters.getVariantRate()))
      throw InvalidParameterException("minimum_detectable_effect",
                                      "effect pushes conversion rate out of bounds");

    if (!isOpenUnitInterval(parameters.getPower()))
      throw InvalidParameterException("power", "must be strictly between 0 and 1");

    if (!isOpenUnitInterval(parameters.getSignificance()))
      throw InvalidParameterException("significance", "must be strictly between 0 and 1");

    const auto& dailyTraffic = parameters.getDailyTraffic();
    if (dailyTraffic && *dailyTraffic < 0)
      throw InvalidParameterException("daily_traffic",
                                      "must be non-negative, got " + std::to_string(*dailyTraffic));
  }

  std::uint64_t SampleSizeEngine::sampleSizeFromValidated(const TestParameters& parameters)
  {
    const double p1 = parameters.getBaselineRate();
    const double p2 = parameters.getVariantRate();
    const double zAlpha = detail::criticalZ(parameters.getTestType(), parameters.getSignificance());
    const double zBeta = detail::powerZ(parameters.getPower());

    const double n = detail::rawSampleSize(p1, p2, zAlpha, zBeta);

    if (!std::isfinite(n) || n > static_cast<double>(kMaxSampleSizePerVariant))
      throw InvalidParameterException("minimum_detectable_effect", "effect too small to size a test");

    return std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::ceil(n)));
  }

  std::optional<std::uint64_t>
  SampleSizeEngine::estimateDays(std::uint64_t totalSampleSize,
                                 const std::optional<std::int64_t>& dailyTraffic)
  {
    if (!dailyTraffic || *dailyTraffic <= 0)
      return std::nullopt;

    const auto perDay = static_cast<std::uint64_t>(*dailyTraffic);
    return (totalSampleSize + perDay - 1) / perDay;
  }

  std::uint64_t SampleSizeEngine::computeSampleSizePerVariant(const TestParameters& parameters)
  {
    validate(parameters);
    return sampleSizeFromValidated(parameters);
  }

  double SampleSizeEngine::computeAchievedPower(const TestParameters& parameters,
                                                std::uint64_t sampleSizePerVariant,
                                                double effectSize)
  {
    validate(parameters);

    const double p1 = parameters.getBaselineRate();
    const double p2 = parameters.variantRateFor(effectSize);
    if (!isOpenUnitInterval(p2))
      throw InvalidParameterException("effect_size", "effect pushes conversion rate out of bounds");

    const double zAlpha = detail::criticalZ(parameters.getTestType(), parameters.getSignificance());
    return detail::achievedPower(p1, p2, static_cast<double>(sampleSizePerVariant), zAlpha);
  }

  TestSummary SampleSizeEngine::summarize(const TestParameters& parameters)
  {
    const double p1 = parameters.getBaselineRate();
    const double p2 = parameters.getVariantRate();

    return TestSummary{p1, p2, p2 - p1, (p2 - p1) / p1};
  }

  CalculationResult SampleSizeEngine::calculate(const TestParameters& parameters) const
  {
    validate(parameters);

    const std::uint64_t perVariant = sampleSizeFromValidated(parameters);
    const std::uint64_t total = 2 * perVariant;

    return CalculationResult(perVariant,
                             estimateDays(total, parameters.getDailyTraffic()),
                             PowerCurve(parameters, perVariant, m_curveSettings),
                             summarize(parameters));
  }
}
