// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __SCENARIO_SET_H
#define __SCENARIO_SET_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "Scenario.h"

namespace abplanner
{
  /**
   * @class ScenarioSet
   * @brief Ordered collection of scenarios owned by one comparison session.
   *
   * Insertion order is preserved and drives the order of comparison output,
   * tables and charts. Nothing is deduplicated.
   */
  class ScenarioSet
  {
  public:
    using ConstIterator = std::vector<Scenario>::const_iterator;

    ScenarioSet() = default;

    /// Appends a scenario and returns its index.
    std::size_t addScenario(const Scenario& scenario);
    std::size_t addScenario(const std::string& name, const TestParameters& parameters);

    // Throws std::out_of_range. Later scenarios shift down by one.
    void removeScenario(std::size_t index);

    void clear();

    // Throws std::out_of_range
    const Scenario& getScenario(std::size_t index) const;

    std::size_t getNumScenarios() const
    {
      return m_scenarios.size();
    }

    bool isEmpty() const
    {
      return m_scenarios.empty();
    }

    ConstIterator beginScenarios() const
    {
      return m_scenarios.begin();
    }

    ConstIterator endScenarios() const
    {
      return m_scenarios.end();
    }

  private:
    std::vector<Scenario> m_scenarios;
  };
}

#endif
