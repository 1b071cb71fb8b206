#include "PowerCurve.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include "SampleSizeException.h"
#include "TwoProportionMath.h"

namespace abplanner
{
  namespace
  {
    // Upper sweep limit is kept this far (relatively) below the effect that
    // would make the variant rate exactly 1.
    constexpr double kEffectLimitMargin = 1.0e-6;

    double largestAdmissibleEffect(const TestParameters& parameters)
    {
      const double p1 = parameters.getBaselineRate();

      if (parameters.getEffectType() == EffectType::RELATIVE)
        return (1.0 / p1 - 1.0) * (1.0 - kEffectLimitMargin);

      return (1.0 - p1) * (1.0 - kEffectLimitMargin);
    }
  }

  void PowerCurveSettings::validate() const
  {
    if (numPoints < 2)
      throw InvalidParameterException("power_curve.num_points",
                                      "at least two points are required, got " +
                                      std::to_string(numPoints));

    if (!(minEffectFraction > 0.0) || !std::isfinite(minEffectFraction))
      throw InvalidParameterException("power_curve.min_effect_fraction",
                                      "must be a positive finite number");

    if (!(maxEffectMultiple > minEffectFraction) || !std::isfinite(maxEffectMultiple))
      throw InvalidParameterException("power_curve.max_effect_multiple",
                                      "must be finite and greater than min_effect_fraction");
  }

  PowerCurve::PowerCurve(const TestParameters& parameters,
                         std::uint64_t sampleSizePerVariant,
                         const PowerCurveSettings& settings)
    : m_parameters(parameters),
      m_sampleSizePerVariant(sampleSizePerVariant),
      m_settings(settings),
      m_zAlpha(detail::criticalZ(parameters.getTestType(), parameters.getSignificance())),
      m_minEffect(0.0),
      m_maxEffect(0.0)
  {
    m_settings.validate();

    const double mde = parameters.getMinimumDetectableEffect();
    m_minEffect = m_settings.minEffectFraction * mde;
    m_maxEffect = std::min(m_settings.maxEffectMultiple * mde,
                           largestAdmissibleEffect(parameters));

    if (m_maxEffect < m_minEffect)
      m_maxEffect = m_minEffect;
  }

  double PowerCurve::effectAt(std::size_t index) const
  {
    if (index + 1 == m_settings.numPoints)
      return m_maxEffect;

    const double step = (m_maxEffect - m_minEffect) /
                        static_cast<double>(m_settings.numPoints - 1);
    return m_minEffect + step * static_cast<double>(index);
  }

  PowerCurvePoint PowerCurve::operator[](std::size_t index) const
  {
    const double effect = effectAt(index);
    const double p1 = m_parameters.getBaselineRate();
    const double p2 = m_parameters.variantRateFor(effect);

    return PowerCurvePoint{effect,
                           detail::achievedPower(p1, p2,
                                                 static_cast<double>(m_sampleSizePerVariant),
                                                 m_zAlpha)};
  }

  PowerCurvePoint PowerCurve::at(std::size_t index) const
  {
    if (index >= size())
      throw std::out_of_range("PowerCurve::at: index " + std::to_string(index) +
                              " out of range for curve of " + std::to_string(size()) + " points");

    return (*this)[index];
  }

  double PowerCurve::powerAt(double effectSize) const
  {
    const double p1 = m_parameters.getBaselineRate();
    const double p2 = m_parameters.variantRateFor(effectSize);

    if (!(p2 > 0.0 && p2 < 1.0))
      throw InvalidParameterException("effect_size",
                                      "effect pushes conversion rate out of bounds");

    return detail::achievedPower(p1, p2, static_cast<double>(m_sampleSizePerVariant), m_zAlpha);
  }

  std::vector<PowerCurvePoint> PowerCurve::toVector() const
  {
    return std::vector<PowerCurvePoint>(begin(), end());
  }
}
