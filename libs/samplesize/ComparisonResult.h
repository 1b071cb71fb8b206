// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __COMPARISON_RESULT_H
#define __COMPARISON_RESULT_H 1

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "CalculationResult.h"
#include "TestParameters.h"

namespace abplanner
{
  /// Validation failure attributed to one scenario of a comparison.
  struct ScenarioError
  {
    std::size_t scenarioIndex;
    std::string field;
    std::string reason;
  };

  /**
   * @class ScenarioOutcome
   * @brief One row of a comparison: the scenario as supplied plus either its
   *        result or the reason it could not be computed.
   */
  class ScenarioOutcome
  {
  public:
    static ScenarioOutcome success(std::size_t index,
                                   const std::string& name,
                                   const TestParameters& parameters,
                                   const CalculationResult& result);

    static ScenarioOutcome failure(std::size_t index,
                                   const std::string& name,
                                   const TestParameters& parameters,
                                   const ScenarioError& error);

    std::size_t getScenarioIndex() const
    {
      return m_index;
    }

    const std::string& getScenarioName() const
    {
      return m_name;
    }

    const TestParameters& getParameters() const
    {
      return m_parameters;
    }

    bool isSuccess() const
    {
      return m_result.has_value();
    }

    // Throws std::logic_error if this scenario failed.
    const CalculationResult& getResult() const;

    // Throws std::logic_error if this scenario succeeded.
    const ScenarioError& getError() const;

  private:
    ScenarioOutcome(std::size_t index,
                    const std::string& name,
                    const TestParameters& parameters,
                    std::optional<CalculationResult> result,
                    std::optional<ScenarioError> error);

  private:
    std::size_t m_index;
    std::string m_name;
    TestParameters m_parameters;
    std::optional<CalculationResult> m_result;
    std::optional<ScenarioError> m_error;
  };

  /**
   * @class ComparisonResult
   * @brief Outcomes of a ScenarioComparator run, in scenario insertion order.
   *
   * Aggregates (maxima, rankings) only look at successful outcomes; they are
   * empty optionals when nothing succeeded.
   */
  class ComparisonResult
  {
  public:
    using ConstIterator = std::vector<ScenarioOutcome>::const_iterator;

    explicit ComparisonResult(std::vector<ScenarioOutcome> outcomes);

    std::size_t getNumOutcomes() const
    {
      return m_outcomes.size();
    }

    // Throws std::out_of_range
    const ScenarioOutcome& getOutcome(std::size_t index) const;

    ConstIterator beginOutcomes() const
    {
      return m_outcomes.begin();
    }

    ConstIterator endOutcomes() const
    {
      return m_outcomes.end();
    }

    std::size_t getNumSucceeded() const;
    std::size_t getNumFailed() const;

    std::optional<std::uint64_t> getMaxSampleSizePerVariant() const;
    std::optional<std::uint64_t> getMaxTotalSampleSize() const;
    std::optional<std::uint64_t> getMaxEstimatedDays() const;

    /// Index of the successful scenario needing the fewest subjects per
    /// variant; ties go to the earlier scenario.
    std::optional<std::size_t> getSmallestSampleSizeIndex() const;

    /// Indices of successful scenarios ordered by ascending per-variant
    /// sample size, ties in insertion order.
    std::vector<std::size_t> rankBySampleSize() const;

  private:
    std::vector<ScenarioOutcome> m_outcomes;
  };
}

#endif
