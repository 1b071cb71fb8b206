// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __POWER_CURVE_H
#define __POWER_CURVE_H 1

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>
#include "TestParameters.h"

namespace abplanner
{
  /**
   * @brief Display tuning for the power curve sweep.
   *
   * The swept effect sizes are numPoints evenly spaced values from
   * minEffectFraction * mde to maxEffectMultiple * mde (the upper end is
   * pulled in if it would push the variant rate to 1).
   */
  struct PowerCurveSettings
  {
    std::size_t numPoints = 50;
    double minEffectFraction = 0.1;
    double maxEffectMultiple = 3.0;

    PowerCurveSettings() = default;
    PowerCurveSettings(std::size_t points, double minFraction, double maxMultiple)
      : numPoints(points), minEffectFraction(minFraction), maxEffectMultiple(maxMultiple) {}

    // Throws InvalidParameterException naming the offending member.
    void validate() const;

    bool operator==(const PowerCurveSettings& rhs) const
    {
      return numPoints == rhs.numPoints &&
             minEffectFraction == rhs.minEffectFraction &&
             maxEffectMultiple == rhs.maxEffectMultiple;
    }
  };

  struct PowerCurvePoint
  {
    double effectSize;
    double achievedPower;
  };

  /**
   * @class PowerCurve
   * @brief Achieved power as a function of effect size at a fixed sample size.
   *
   * Points are computed on demand: iterating twice (or indexing) recomputes
   * the same deterministic values, so the curve can be restarted freely and
   * copied cheaply. Only SampleSizeEngine and CalculationSerializer build
   * curves; both hand in parameters that already passed validation.
   */
  class PowerCurve
  {
  public:
    class const_iterator
    {
    public:
      // Points are computed on demand, so operator-> hands out a proxy
      // owning a copy of the point.
      class ArrowProxy
      {
      public:
        explicit ArrowProxy(const PowerCurvePoint& point) : m_point(point) {}

        const PowerCurvePoint* operator->() const
        {
          return &m_point;
        }

      private:
        PowerCurvePoint m_point;
      };

      using iterator_category = std::input_iterator_tag;
      using value_type = PowerCurvePoint;
      using difference_type = std::ptrdiff_t;
      using pointer = ArrowProxy;
      using reference = PowerCurvePoint;

      const_iterator() : m_curve(nullptr), m_index(0) {}

      PowerCurvePoint operator*() const
      {
        return (*m_curve)[m_index];
      }

      ArrowProxy operator->() const
      {
        return ArrowProxy((*m_curve)[m_index]);
      }

      PowerCurvePoint operator[](difference_type n) const
      {
        return (*m_curve)[static_cast<std::size_t>(static_cast<difference_type>(m_index) + n)];
      }

      const_iterator& operator++()
      {
        ++m_index;
        return *this;
      }

      const_iterator operator++(int)
      {
        const_iterator tmp(*this);
        ++m_index;
        return tmp;
      }

      const_iterator& operator--()
      {
        --m_index;
        return *this;
      }

      const_iterator operator--(int)
      {
        const_iterator tmp(*this);
        --m_index;
        return tmp;
      }

      const_iterator& operator+=(difference_type n)
      {
        m_index = static_cast<std::size_t>(static_cast<difference_type>(m_index) + n);
        return *this;
      }

      const_iterator& operator-=(difference_type n)
      {
        return *this += -n;
      }

      friend const_iterator operator+(const_iterator it, difference_type n)
      {
        return it += n;
      }

      friend const_iterator operator-(const_iterator it, difference_type n)
      {
        return it -= n;
      }

      friend difference_type operator-(const const_iterator& lhs, const const_iterator& rhs)
      {
        return static_cast<difference_type>(lhs.m_index) - static_cast<difference_type>(rhs.m_index);
      }

      friend bool operator==(const const_iterator& lhs, const const_iterator& rhs)
      {
        return lhs.m_curve == rhs.m_curve && lhs.m_index == rhs.m_index;
      }

      friend bool operator!=(const const_iterator& lhs, const const_iterator& rhs)
      {
        return !(lhs == rhs);
      }

      friend bool operator<(const const_iterator& lhs, const const_iterator& rhs)
      {
        return lhs.m_index < rhs.m_index;
      }

    private:
      friend class PowerCurve;

      const_iterator(const PowerCurve* curve, std::size_t index)
        : m_curve(curve), m_index(index) {}

      const PowerCurve* m_curve;
      std::size_t m_index;
    };

    PowerCurve(const TestParameters& parameters,
               std::uint64_t sampleSizePerVariant,
               const PowerCurveSettings& settings);

    std::size_t size() const
    {
      return m_settings.numPoints;
    }

    bool empty() const
    {
      return m_settings.numPoints == 0;
    }

    const_iterator begin() const
    {
      return const_iterator(this, 0);
    }

    const_iterator end() const
    {
      return const_iterator(this, size());
    }

    // Unchecked
    PowerCurvePoint operator[](std::size_t index) const;

    // Throws std::out_of_range
    PowerCurvePoint at(std::size_t index) const;

    /**
     * @brief Power at an arbitrary effect size (same units as the MDE).
     *
     * @throws InvalidParameterException if the effect pushes the variant
     *         rate outside (0, 1).
     */
    double powerAt(double effectSize) const;

    std::vector<PowerCurvePoint> toVector() const;

    double getMinEffect() const
    {
      return m_minEffect;
    }

    double getMaxEffect() const
    {
      return m_maxEffect;
    }

    std::uint64_t getSampleSizePerVariant() const
    {
      return m_sampleSizePerVariant;
    }

    const PowerCurveSettings& getSettings() const
    {
      return m_settings;
    }

  private:
    double effectAt(std::size_t index) const;

  private:
    TestParameters m_parameters;
    std::uint64_t m_sampleSizePerVariant;
    PowerCurveSettings m_settings;
    double m_zAlpha;
    double m_minEffect;
    double m_maxEffect;
  };
}

#endif
