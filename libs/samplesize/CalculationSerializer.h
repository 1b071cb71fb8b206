// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CALCULATION_SERIALIZER_H
#define __CALCULATION_SERIALIZER_H 1

#include <string>
#include "CalculationResult.h"
#include "ComparisonResult.h"
#include "PowerCurve.h"
#include "ScenarioSet.h"
#include "TestParameters.h"

#include <rapidjson/document.h>

namespace abplanner
{
  /**
   * @brief A calculation as read back from an exported document.
   */
  struct CalculationRecord
  {
    std::string name;
    TestParameters parameters;
    CalculationResult result;
  };

  /**
   * @brief JSON export and import of calculations, comparisons and scenario
   *        sets.
   *
   * Documents use snake_case member names. Counts are JSON integers, rates
   * and probabilities are JSON reals, and an absent estimated duration or
   * daily traffic is written as null, so the output for a given input is
   * byte-for-byte deterministic.
   *
   * Import functions throw SerializationException for malformed documents or
   * missing/mistyped members. Parameter values themselves are not range
   * checked: that is SampleSizeEngine's job.
   */
  class CalculationSerializer
  {
  public:
    static std::string exportCalculation(const TestParameters& parameters,
                                         const CalculationResult& result,
                                         const std::string& name = "");

    static std::string exportComparison(const ComparisonResult& comparison);

    static std::string exportScenarioSet(const ScenarioSet& scenarios);

    static TestParameters importParameters(const std::string& jsonStr);

    /**
     * @brief Reads back a document written by exportCalculation.
     *
     * The power curve is rebuilt from the stored parameters, sample size and
     * curve settings; the exported curve points are not needed.
     */
    static CalculationRecord importCalculation(const std::string& jsonStr);

    /**
     * @brief Reads {"scenarios": [{"name": ..., "parameters": {...}}, ...]}.
     *
     * Extra members (such as results in an exported comparison) are ignored,
     * so a comparison export can be fed back in as a scenario file.
     */
    static ScenarioSet importScenarioSet(const std::string& jsonStr);

    /**
     * @brief As above, with members a scenario leaves out taken from base.
     *
     * Only baseline_rate and minimum_detectable_effect are required per
     * scenario; power, significance, test_type, effect_type and
     * daily_traffic default to the values carried by base.
     */
    static ScenarioSet importScenarioSet(const std::string& jsonStr, const TestParameters& base);

    // Building blocks shared with the application's configuration loader.
    static rapidjson::Value serializeParameters(const TestParameters& parameters,
                                                rapidjson::Document::AllocatorType& allocator);
    static TestParameters deserializeParameters(const rapidjson::Value& json,
                                                const std::string& context);
    static TestParameters deserializeParameters(const rapidjson::Value& json,
                                                const std::string& context,
                                                const TestParameters& base);

  private:
    static rapidjson::Value serializeResult(const CalculationResult& result,
                                            rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeCurveSettings(const PowerCurveSettings& settings,
                                                   rapidjson::Document::AllocatorType& allocator);
    static PowerCurveSettings deserializeCurveSettings(const rapidjson::Value& json,
                                                       const std::string& context);
    static void parseDocument(rapidjson::Document& doc, const std::string& jsonStr);
    static std::string toPrettyString(const rapidjson::Document& doc);
  };
}

#endif
