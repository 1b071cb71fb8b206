// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __SCENARIO_COMPARATOR_H
#define __SCENARIO_COMPARATOR_H 1

#include <memory>
#include "ComparisonResult.h"
#include "IParallelExecutor.h"
#include "SampleSizeEngine.h"
#include "ScenarioSet.h"

namespace abplanner
{
  /**
   * @class ScenarioComparator
   * @brief Runs SampleSizeEngine over every scenario of a ScenarioSet.
   *
   * An InvalidParameterException raised for one scenario is recorded in that
   * scenario's outcome; the remaining scenarios are still computed. Nothing
   * is cached: every compare() call recomputes from scratch.
   *
   * Scenarios are independent, so they are dispatched through an
   * IParallelExecutor. Each task writes only its own output slot, which keeps
   * the output in insertion order whatever the scheduling.
   */
  class ScenarioComparator
  {
  public:
    // Uses a default engine and a SingleThreadExecutor.
    ScenarioComparator();

    ScenarioComparator(const SampleSizeEngine& engine,
                       std::shared_ptr<concurrency::IParallelExecutor> executor);

    ComparisonResult compare(const ScenarioSet& scenarios) const;

    const SampleSizeEngine& getEngine() const
    {
      return m_engine;
    }

  private:
    ScenarioOutcome evaluate(std::size_t index, const Scenario& scenario) const;

  private:
    SampleSizeEngine m_engine;
    std::shared_ptr<concurrency::IParallelExecutor> m_executor;
  };
}

#endif
