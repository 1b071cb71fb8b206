#include "ComparisonResult.h"
#include <algorithm>
#include <stdexcept>

namespace abplanner
{
  ScenarioOutcome::ScenarioOutcome(std::size_t index,
                                   const std::string& name,
                                   const TestParameters& parameters,
                                   std::optional<CalculationResult> result,
                                   std::optional<ScenarioError> error)
    : m_index(index),
      m_name(name),
      m_parameters(parameters),
      m_result(std::move(result)),
      m_error(std::move(error))
  {}

  ScenarioOutcome ScenarioOutcome::success(std::size_t index,
                                           const std::string& name,
                                           const TestParameters& parameters,
                                           const CalculationResult& result)
  {
    return ScenarioOutcome(index, name, parameters, result, std::nullopt);
  }

  ScenarioOutcome ScenarioOutcome::failure(std::size_t index,
                                           const std::string& name,
                                           const TestParameters& parameters,
                                           const ScenarioError& error)
  {
    return ScenarioOutcome(index, name, parameters, std::nullopt, error);
  }

  const CalculationResult& ScenarioOutcome::getResult() const
  {
    if (!m_result)
      throw std::logic_error("ScenarioOutcome::getResult: scenario '" + m_name + "' failed: " +
                             m_error->reason);

    return *m_result;
  }

  const ScenarioError& ScenarioOutcome::getError() const
  {
    if (!m_error)
      throw std::logic_error("ScenarioOutcome::getError: scenario '" + m_name + "' succeeded");

    return *m_error;
  }

  ComparisonResult::ComparisonResult(std::vector<ScenarioOutcome> outcomes)
    : m_outcomes(std::move(outcomes))
  {}

  const ScenarioOutcome& ComparisonResult::getOutcome(std::size_t index) const
  {
    if (index >= m_outcomes.size())
      throw std::out_of_range("ComparisonResult::getOutcome: index " + std::to_string(index) +
                              " out of range");

    return m_outcomes[index];
  }

  std::size_t ComparisonResult::getNumSucceeded() const
  {
    return static_cast<std::size_t>(
      std::count_if(m_outcomes.begin(), m_outcomes.end(),
                    [](const ScenarioOutcome& o) { return o.isSuccess(); }));
  }

  std::size_t ComparisonResult::getNumFailed() const
  {
    return m_outcomes.size() - getNumSucceeded();
  }

  std::optional<std::uint64_t> ComparisonResult::getMaxSampleSizePerVariant() const
  {
    std::optional<std::uint64_t> maxSize;
    for (const auto& outcome : m_outcomes)
    {
      if (!outcome.isSuccess())
        continue;

      const std::uint64_t n = outcome.getResult().getSampleSizePerVariant();
      if (!maxSize || n > *maxSize)
        maxSize = n;
    }
    return maxSize;
  }

  std::optional<std::uint64_t> ComparisonResult::getMaxTotalSampleSize() const
  {
    auto maxPerVariant = getMaxSampleSizePerVariant();
    if (!maxPerVariant)
      return std::nullopt;

    return 2 * *maxPerVariant;
  }

  std::optional<std::uint64_t> ComparisonResult::getMaxEstimatedDays() const
  {
    std::optional<std::uint64_t> maxDays;
    for (const auto& outcome : m_outcomes)
    {
      if (!outcome.isSuccess())
        continue;

      const auto& days = outcome.getResult().getEstimatedDays();
      if (days && (!maxDays || *days > *maxDays))
        maxDays = days;
    }
    return maxDays;
  }

  std::optional<std::size_t> ComparisonResult::getSmallestSampleSizeIndex() const
  {
    const auto ranking = rankBySampleSize();
    if (ranking.empty())
      return std::nullopt;

    return ranking.front();
  }

  std::vector<std::size_t> ComparisonResult::rankBySampleSize() const
  {
    std::vector<std::size_t> ranking;
    for (std::size_t i = 0; i < m_outcomes.size(); ++i)
    {
      if (m_outcomes[i].isSuccess())
        ranking.push_back(i);
    }

    std::stable_sort(ranking.begin(), ranking.end(),
                     [this](std::size_t lhs, std::size_t rhs) {
                       return m_outcomes[lhs].getResult().getSampleSizePerVariant() <
                              m_outcomes[rhs].getResult().getSampleSizePerVariant();
                     });
    return ranking;
  }
}
