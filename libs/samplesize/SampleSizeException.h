// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __SAMPLE_SIZE_EXCEPTION_H
#define __SAMPLE_SIZE_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace abplanner
{
  /**
   * @brief Raised when a test parameter (or derived quantity) fails validation.
   *
   * getField() names the offending input using its external spelling
   * (e.g. "baseline_rate", "power_curve.num_points"); getReason() is a short
   * human readable explanation.
   */
  class InvalidParameterException : public std::runtime_error
  {
  public:
    InvalidParameterException(const std::string& field, const std::string& reason)
      : std::runtime_error("Invalid parameter '" + field + "': " + reason),
        m_field(field),
        m_reason(reason)
    {}

    const std::string& getField() const
    {
      return m_field;
    }

    const std::string& getReason() const
    {
      return m_reason;
    }

  private:
    std::string m_field;
    std::string m_reason;
  };

  // Malformed or mistyped JSON documents handed to CalculationSerializer.
  class SerializationException : public std::runtime_error
  {
  public:
    explicit SerializationException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };
}

#endif
