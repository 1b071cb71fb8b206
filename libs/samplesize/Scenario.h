// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __SCENARIO_H
#define __SCENARIO_H 1

#include <string>
#include "TestParameters.h"

namespace abplanner
{
  /**
   * @brief A named parameter set in a comparison.
   *
   * Names are free-form labels; two scenarios may share a name and even
   * identical parameters and remain distinct entries.
   */
  class Scenario
  {
  public:
    Scenario(const std::string& name, const TestParameters& parameters)
      : m_name(name),
        m_parameters(parameters)
    {}

    const std::string& getName() const
    {
      return m_name;
    }

    const TestParameters& getParameters() const
    {
      return m_parameters;
    }

  private:
    std::string m_name;
    TestParameters m_parameters;
  };
}

#endif
