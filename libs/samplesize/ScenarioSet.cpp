#include "ScenarioSet.h"
#include <stdexcept>

namespace abplanner
{
  std::size_t ScenarioSet::addScenario(const Scenario& scenario)
  {
    m_scenarios.push_back(scenario);
    return m_scenarios.size() - 1;
  }

  std::size_t ScenarioSet::addScenario(const std::string& name, const TestParameters& parameters)
  {
    return addScenario(Scenario(name, parameters));
  }

  void ScenarioSet::removeScenario(std::size_t index)
  {
    if (index >= m_scenarios.size())
      throw std::out_of_range("ScenarioSet::removeScenario: index " + std::to_string(index) +
                              " out of range (" + std::to_string(m_scenarios.size()) + " scenarios)");

    m_scenarios.erase(m_scenarios.begin() + static_cast<std::ptrdiff_t>(index));
  }

  void ScenarioSet::clear()
  {
    m_scenarios.clear();
  }

  const Scenario& ScenarioSet::getScenario(std::size_t index) const
  {
    if (index >= m_scenarios.size())
      throw std::out_of_range("ScenarioSet::getScenario: index " + std::to_string(index) +
                              " out of range (" + std::to_string(m_scenarios.size()) + " scenarios)");

    return m_scenarios[index];
  }
}
