#include "CalculationSerializer.h"
#include <stdexcept>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "SampleSizeEngine.h"
#include "SampleSizeException.h"

using namespace rapidjson;

namespace abplanner
{
  namespace
  {
    const Value& requireMember(const Value& obj, const char* key, const std::string& context)
    {
      if (!obj.IsObject())
        throw SerializationException(context + ": expected a JSON object");

      Value::ConstMemberIterator it = obj.FindMember(key);
      if (it == obj.MemberEnd())
        throw SerializationException(context + ": missing member '" + key + "'");

      return it->value;
    }

    const Value* findMember(const Value& obj, const char* key)
    {
      Value::ConstMemberIterator it = obj.FindMember(key);
      return (it == obj.MemberEnd()) ? nullptr : &it->value;
    }

    double readDouble(const Value& value, const char* key, const std::string& context)
    {
      if (!value.IsNumber())
        throw SerializationException(context + ": member '" + key + "' must be a number");

      return value.GetDouble();
    }

    std::uint64_t readUint64(const Value& value, const char* key, const std::string& context)
    {
      if (!value.IsUint64())
        throw SerializationException(context + ": member '" + key +
                                     "' must be a non-negative integer");

      return value.GetUint64();
    }

    std::string readString(const Value& value, const char* key, const std::string& context)
    {
      if (!value.IsString())
        throw SerializationException(context + ": member '" + key + "' must be a string");

      return std::string(value.GetString(), value.GetStringLength());
    }

    Value optionalUint64(const std::optional<std::uint64_t>& value)
    {
      Value v;
      if (value)
        v.SetUint64(*value);
      return v;
    }
  }

  Value CalculationSerializer::serializeParameters(const TestParameters& parameters,
                                                   Document::AllocatorType& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("baseline_rate", parameters.getBaselineRate(), allocator);
    obj.AddMember("minimum_detectable_effect", parameters.getMinimumDetectableEffect(), allocator);
    obj.AddMember("power", parameters.getPower(), allocator);
    obj.AddMember("significance", parameters.getSignificance(), allocator);
    obj.AddMember("test_type",
                  Value(testTypeToString(parameters.getTestType()).c_str(), allocator),
                  allocator);
    obj.AddMember("effect_type",
                  Value(effectTypeToString(parameters.getEffectType()).c_str(), allocator),
                  allocator);

    Value traffic;
    if (parameters.getDailyTraffic())
      traffic.SetInt64(*parameters.getDailyTraffic());
    obj.AddMember("daily_traffic", traffic, allocator);

    return obj;
  }

  TestParameters CalculationSerializer::deserializeParameters(const Value& json,
                                                              const std::string& context)
  {
    return deserializeParameters(json, context, TestParameters(0.0, 0.0));
  }

  TestParameters CalculationSerializer::deserializeParameters(const Value& json,
                                                              const std::string& context,
                                                              const TestParameters& base)
  {
    const double baseline = readDouble(requireMember(json, "baseline_rate", context),
                                       "baseline_rate", context);
    const double mde = readDouble(requireMember(json, "minimum_detectable_effect", context),
                                  "minimum_detectable_effect", context);

    TestParameters parameters = base.withBaselineRate(baseline).withMinimumDetectableEffect(mde);

    if (const Value* power = findMember(json, "power"))
      parameters = parameters.withPower(readDouble(*power, "power", context));

    if (const Value* significance = findMember(json, "significance"))
      parameters = parameters.withSignificance(readDouble(*significance, "significance", context));

    try
    {
      if (const Value* testType = findMember(json, "test_type"))
        parameters = parameters.withTestType(parseTestType(readString(*testType, "test_type", context)));

      if (const Value* effectType = findMember(json, "effect_type"))
        parameters = parameters.withEffectType(parseEffectType(readString(*effectType, "effect_type", context)));
    }
    catch (const std::invalid_argument& e)
    {
      throw SerializationException(context + ": " + e.what());
    }

    if (const Value* traffic = findMember(json, "daily_traffic"))
    {
      if (traffic->IsInt64())
        parameters = parameters.withDailyTraffic(traffic->GetInt64());
      else if (traffic->IsNull())
        parameters = parameters.withDailyTraffic(std::nullopt);
      else
        throw SerializationException(context + ": member 'daily_traffic' must be an integer or null");
    }

    return parameters;
  }

  Value CalculationSerializer::serializeCurveSettings(const PowerCurveSettings& settings,
                                                      Document::AllocatorType& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("num_points", static_cast<std::uint64_t>(settings.numPoints), allocator);
    obj.AddMember("min_effect_fraction", settings.minEffectFraction, allocator);
    obj.AddMember("max_effect_multiple", settings.maxEffectMultiple, allocator);
    return obj;
  }

  PowerCurveSettings CalculationSerializer::deserializeCurveSettings(const Value& json,
                                                                     const std::string& context)
  {
    PowerCurveSettings settings;
    settings.numPoints = static_cast<std::size_t>(
      readUint64(requireMember(json, "num_points", context), "num_points", context));
    settings.minEffectFraction = readDouble(requireMember(json, "min_effect_fraction", context),
                                            "min_effect_fraction", context);
    settings.maxEffectMultiple = readDouble(requireMember(json, "max_effect_multiple", context),
                                            "max_effect_multiple", context);
    return settings;
  }

  Value CalculationSerializer::serializeResult(const CalculationResult& result,
                                               Document::AllocatorType& allocator)
  {
    Value obj(kObjectType);
    obj.AddMember("sample_size_per_variant", result.getSampleSizePerVariant(), allocator);
    obj.AddMember("total_sample_size", result.getTotalSampleSize(), allocator);
    obj.AddMember("estimated_days", optionalUint64(result.getEstimatedDays()), allocator);

    const TestSummary& summary = result.getSummary();
    Value summaryObj(kObjectType);
    summaryObj.AddMember("control_rate", summary.controlRate, allocator);
    summaryObj.AddMember("variant_rate", summary.variantRate, allocator);
    summaryObj.AddMember("absolute_effect", summary.absoluteEffect, allocator);
    summaryObj.AddMember("relative_effect", summary.relativeEffect, allocator);
    obj.AddMember("summary", summaryObj, allocator);

    const PowerCurve& curve = result.getPowerCurve();
    obj.AddMember("power_curve_settings", serializeCurveSettings(curve.getSettings(), allocator),
                  allocator);

    Value points(kArrayType);
    for (const PowerCurvePoint& point : curve)
    {
      Value p(kObjectType);
      p.AddMember("effect_size", point.effectSize, allocator);
      p.AddMember("achieved_power", point.achievedPower, allocator);
      points.PushBack(p, allocator);
    }
    obj.AddMember("power_curve", points, allocator);

    return obj;
  }

  void CalculationSerializer::parseDocument(Document& doc, const std::string& jsonStr)
  {
    doc.Parse<kParseFullPrecisionFlag>(jsonStr.c_str());

    if (doc.HasParseError())
      throw SerializationException(std::string("JSON parse error at offset ") +
                                   std::to_string(doc.GetErrorOffset()) + ": " +
                                   GetParseError_En(doc.GetParseError()));

    if (!doc.IsObject())
      throw SerializationException("JSON document must be an object");
  }

  std::string CalculationSerializer::toPrettyString(const Document& doc)
  {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
  }

  std::string CalculationSerializer::exportCalculation(const TestParameters& parameters,
                                                       const CalculationResult& result,
                                                       const std::string& name)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("name", Value(name.c_str(), allocator), allocator);
    doc.AddMember("parameters", serializeParameters(parameters, allocator), allocator);
    doc.AddMember("result", serializeResult(result, allocator), allocator);

    return toPrettyString(doc);
  }

  std::string CalculationSerializer::exportComparison(const ComparisonResult& comparison)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value scenarios(kArrayType);
    for (auto it = comparison.beginOutcomes(); it != comparison.endOutcomes(); ++it)
    {
      Value entry(kObjectType);
      entry.AddMember("index", static_cast<std::uint64_t>(it->getScenarioIndex()), allocator);
      entry.AddMember("name", Value(it->getScenarioName().c_str(), allocator), allocator);
      entry.AddMember("parameters", serializeParameters(it->getParameters(), allocator), allocator);

      if (it->isSuccess())
      {
        entry.AddMember("status", "ok", allocator);
        entry.AddMember("result", serializeResult(it->getResult(), allocator), allocator);
      }
      else
      {
        const ScenarioError& error = it->getError();
        Value errorObj(kObjectType);
        errorObj.AddMember("field", Value(error.field.c_str(), allocator), allocator);
        errorObj.AddMember("reason", Value(error.reason.c_str(), allocator), allocator);

        entry.AddMember("status", "failed", allocator);
        entry.AddMember("error", errorObj, allocator);
      }
      scenarios.PushBack(entry, allocator);
    }
    doc.AddMember("scenarios", scenarios, allocator);

    Value aggregates(kObjectType);
    aggregates.AddMember("succeeded", static_cast<std::uint64_t>(comparison.getNumSucceeded()), allocator);
    aggregates.AddMember("failed", static_cast<std::uint64_t>(comparison.getNumFailed()), allocator);
    aggregates.AddMember("max_sample_size_per_variant",
                         optionalUint64(comparison.getMaxSampleSizePerVariant()), allocator);
    aggregates.AddMember("max_total_sample_size",
                         optionalUint64(comparison.getMaxTotalSampleSize()), allocator);
    aggregates.AddMember("max_estimated_days",
                         optionalUint64(comparison.getMaxEstimatedDays()), allocator);

    Value ranking(kArrayType);
    for (std::size_t index : comparison.rankBySampleSize())
      ranking.PushBack(static_cast<std::uint64_t>(index), allocator);
    aggregates.AddMember("ranking", ranking, allocator);

    doc.AddMember("aggregates", aggregates, allocator);

    return toPrettyString(doc);
  }

  std::string CalculationSerializer::exportScenarioSet(const ScenarioSet& scenarios)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value entries(kArrayType);
    for (auto it = scenarios.beginScenarios(); it != scenarios.endScenarios(); ++it)
    {
      Value entry(kObjectType);
      entry.AddMember("name", Value(it->getName().c_str(), allocator), allocator);
      entry.AddMember("parameters", serializeParameters(it->getParameters(), allocator), allocator);
      entries.PushBack(entry, allocator);
    }
    doc.AddMember("scenarios", entries, allocator);

    return toPrettyString(doc);
  }

  TestParameters CalculationSerializer::importParameters(const std::string& jsonStr)
  {
    Document doc;
    parseDocument(doc, jsonStr);

    // Accept either a bare parameter object or a full calculation document.
    if (const Value* nested = findMember(doc, "parameters"))
      return deserializeParameters(*nested, "parameters");

    return deserializeParameters(doc, "parameters");
  }

  CalculationRecord CalculationSerializer::importCalculation(const std::string& jsonStr)
  {
    Document doc;
    parseDocument(doc, jsonStr);

    std::string name;
    if (const Value* nameValue = findMember(doc, "name"))
      name = readString(*nameValue, "name", "calculation");

    TestParameters parameters = deserializeParameters(requireMember(doc, "parameters", "calculation"),
                                                      "parameters");

    const Value& resultJson = requireMember(doc, "result", "calculation");
    const std::uint64_t perVariant =
      readUint64(requireMember(resultJson, "sample_size_per_variant", "result"),
                 "sample_size_per_variant", "result");
    const std::uint64_t total =
      readUint64(requireMember(resultJson, "total_sample_size", "result"),
                 "total_sample_size", "result");

    if (perVariant == 0 || perVariant > SampleSizeEngine::kMaxSampleSizePerVariant)
      throw SerializationException("result: sample_size_per_variant must be between 1 and 2^62");

    if (total != 2 * perVariant)
      throw SerializationException("result: total_sample_size must be twice sample_size_per_variant");

    std::optional<std::uint64_t> estimatedDays;
    const Value& daysJson = requireMember(resultJson, "estimated_days", "result");
    if (!daysJson.IsNull())
      estimatedDays = readUint64(daysJson, "estimated_days", "result");

    if (estimatedDays != SampleSizeEngine::estimateDays(total, parameters.getDailyTraffic()))
      throw SerializationException("result: estimated_days does not match total_sample_size and daily_traffic");

    PowerCurveSettings curveSettings;
    if (const Value* settingsJson = findMember(resultJson, "power_curve_settings"))
      curveSettings = deserializeCurveSettings(*settingsJson, "power_curve_settings");

    try
    {
      SampleSizeEngine::validate(parameters);
      CalculationResult result(perVariant, estimatedDays,
                               PowerCurve(parameters, perVariant, curveSettings),
                               SampleSizeEngine::summarize(parameters));

      return CalculationRecord{name, parameters, result};
    }
    catch (const InvalidParameterException& e)
    {
      throw SerializationException(std::string("calculation holds invalid data: ") + e.what());
    }
  }

  ScenarioSet CalculationSerializer::importScenarioSet(const std::string& jsonStr)
  {
    return importScenarioSet(jsonStr, TestParameters(0.0, 0.0));
  }

  ScenarioSet CalculationSerializer::importScenarioSet(const std::string& jsonStr,
                                                       const TestParameters& base)
  {
    Document doc;
    parseDocument(doc, jsonStr);

    const Value& entries = requireMember(doc, "scenarios", "scenario set");
    if (!entries.IsArray())
      throw SerializationException("scenario set: member 'scenarios' must be an array");

    ScenarioSet scenarios;
    for (SizeType i = 0; i < entries.Size(); ++i)
    {
      const std::string context = "scenarios[" + std::to_string(i) + "]";
      const Value& entry = entries[i];

      std::string name;
      if (const Value* nameValue = entry.IsObject() ? findMember(entry, "name") : nullptr)
        name = readString(*nameValue, "name", context);

      scenarios.addScenario(name,
                            deserializeParameters(requireMember(entry, "parameters", context),
                                                  context + ".parameters", base));
    }

    return scenarios;
  }
}
