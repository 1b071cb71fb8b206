#include "ScenarioComparator.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace abplanner
{
  ScenarioComparator::ScenarioComparator()
    : m_engine(),
      m_executor(std::make_shared<concurrency::SingleThreadExecutor>())
  {}

  ScenarioComparator::ScenarioComparator(const SampleSizeEngine& engine,
                                         std::shared_ptr<concurrency::IParallelExecutor> executor)
    : m_engine(engine),
      m_executor(std::move(executor))
  {
    if (!m_executor)
      throw std::invalid_argument("ScenarioComparator: executor must not be null");
  }

  ScenarioOutcome ScenarioComparator::evaluate(std::size_t index, const Scenario& scenario) const
  {
    try
    {
      return ScenarioOutcome::success(index, scenario.getName(), scenario.getParameters(),
                                      m_engine.calculate(scenario.getParameters()));
    }
    catch (const InvalidParameterException& e)
    {
      return ScenarioOutcome::failure(index, scenario.getName(), scenario.getParameters(),
                                      ScenarioError{index, e.getField(), e.getReason()});
    }
  }

  ComparisonResult ScenarioComparator::compare(const ScenarioSet& scenarios) const
  {
    const std::size_t count = scenarios.getNumScenarios();
    std::vector<std::optional<ScenarioOutcome>> slots(count);

    concurrency::parallel_for(count, *m_executor, [this, &scenarios, &slots](std::size_t i) {
      slots[i].emplace(evaluate(i, scenarios.getScenario(i)));
    });

    std::vector<ScenarioOutcome> outcomes;
    outcomes.reserve(count);
    for (auto& slot : slots)
      outcomes.push_back(std::move(*slot));

    return ComparisonResult(std::move(outcomes));
  }
}
