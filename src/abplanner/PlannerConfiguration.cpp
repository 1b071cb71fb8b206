#include "PlannerConfiguration.h"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <rapidjson/error/en.h>
#include "SampleSizeException.h"

namespace abplanner {

namespace {

bool isProbability(double value) {
    return std::isfinite(value) && value > 0.0 && value < 1.0;
}

// Each reader returns false and fills 'error' when the member is present but
// has the wrong type. An absent member leaves 'out' alone.
bool readOptionalDouble(const rapidjson::Value& obj, const char* key, const std::string& context,
                        std::optional<double>& out, std::string& error) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd())
        return true;

    if (!it->value.IsNumber()) {
        error = context + ": '" + key + "' must be a number";
        return false;
    }
    out = it->value.GetDouble();
    return true;
}

bool readOptionalString(const rapidjson::Value& obj, const char* key, const std::string& context,
                        std::optional<std::string>& out, std::string& error) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd())
        return true;

    if (!it->value.IsString()) {
        error = context + ": '" + key + "' must be a string";
        return false;
    }
    out = std::string(it->value.GetString(), it->value.GetStringLength());
    return true;
}

bool readTestType(const rapidjson::Value& obj, const std::string& context,
                  std::optional<TestType>& out, std::string& error) {
    std::optional<std::string> text;
    if (!readOptionalString(obj, "test_type", context, text, error))
        return false;
    if (!text)
        return true;

    try {
        out = parseTestType(*text);
    } catch (const std::invalid_argument& e) {
        error = context + ": " + e.what();
        return false;
    }
    return true;
}

bool readEffectType(const rapidjson::Value& obj, const std::string& context,
                    std::optional<EffectType>& out, std::string& error) {
    std::optional<std::string> text;
    if (!readOptionalString(obj, "effect_type", context, text, error))
        return false;
    if (!text)
        return true;

    try {
        out = parseEffectType(*text);
    } catch (const std::invalid_argument& e) {
        error = context + ": " + e.what();
        return false;
    }
    return true;
}

} // anonymous namespace

PlannerConfiguration::PlannerConfiguration()
    : defaults_(), curveSettings_(), templates_() {
}

bool PlannerConfiguration::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return loadFromString(buffer.str());
}

bool PlannerConfiguration::loadFromString(const std::string& jsonContent) {
    return parseJson(jsonContent);
}

bool PlannerConfiguration::addTemplate(const TestTemplate& testTemplate) {
    if (findTemplate(testTemplate.name) != nullptr)
        return false;

    templates_.push_back(testTemplate);
    return true;
}

const TestTemplate* PlannerConfiguration::findTemplate(const std::string& name) const {
    for (const auto& testTemplate : templates_) {
        if (testTemplate.name == name)
            return &testTemplate;
    }
    return nullptr;
}

TestParameters PlannerConfiguration::defaultParameters(double baselineRate,
                                                      double minimumDetectableEffect) const {
    return TestParameters(baselineRate,
                          minimumDetectableEffect,
                          defaults_.power,
                          defaults_.significance,
                          defaults_.testType,
                          std::nullopt,
                          defaults_.effectType);
}

TestParameters PlannerConfiguration::resolveTemplate(const TestTemplate& testTemplate) const {
    TestParameters parameters = defaultParameters(testTemplate.baselineRate,
                                                  testTemplate.minimumDetectableEffect);
    if (testTemplate.power)
        parameters = parameters.withPower(*testTemplate.power);
    if (testTemplate.significance)
        parameters = parameters.withSignificance(*testTemplate.significance);
    if (testTemplate.testType)
        parameters = parameters.withTestType(*testTemplate.testType);
    if (testTemplate.effectType)
        parameters = parameters.withEffectType(*testTemplate.effectType);
    return parameters;
}

bool PlannerConfiguration::parseDefaults(const rapidjson::Value& json,
                                         CalculationDefaults& defaults) const {
    if (!json.IsObject()) {
        setError("defaults: expected a JSON object");
        return false;
    }

    std::string error;
    std::optional<double> power;
    std::optional<double> significance;
    std::optional<TestType> testType;
    std::optional<EffectType> effectType;

    if (!readOptionalDouble(json, "power", "defaults", power, error) ||
        !readOptionalDouble(json, "significance", "defaults", significance, error) ||
        !readTestType(json, "defaults", testType, error) ||
        !readEffectType(json, "defaults", effectType, error)) {
        setError(error);
        return false;
    }

    if (power) {
        if (!isProbability(*power)) {
            setError("defaults: 'power' must be strictly between 0 and 1");
            return false;
        }
        defaults.power = *power;
    }

    if (significance) {
        if (!isProbability(*significance)) {
            setError("defaults: 'significance' must be strictly between 0 and 1");
            return false;
        }
        defaults.significance = *significance;
    }

    if (testType)
        defaults.testType = *testType;
    if (effectType)
        defaults.effectType = *effectType;

    return true;
}

bool PlannerConfiguration::parseCurveSettings(const rapidjson::Value& json,
                                              PowerCurveSettings& settings) const {
    if (!json.IsObject()) {
        setError("power_curve: expected a JSON object");
        return false;
    }

    auto numPoints = json.FindMember("num_points");
    if (numPoints != json.MemberEnd()) {
        if (!numPoints->value.IsUint64()) {
            setError("power_curve: 'num_points' must be a non-negative integer");
            return false;
        }
        settings.numPoints = static_cast<std::size_t>(numPoints->value.GetUint64());
    }

    std::string error;
    std::optional<double> minFraction;
    std::optional<double> maxMultiple;
    if (!readOptionalDouble(json, "min_effect_fraction", "power_curve", minFraction, error) ||
        !readOptionalDouble(json, "max_effect_multiple", "power_curve", maxMultiple, error)) {
        setError(error);
        return false;
    }

    if (minFraction)
        settings.minEffectFraction = *minFraction;
    if (maxMultiple)
        settings.maxEffectMultiple = *maxMultiple;

    try {
        settings.validate();
    } catch (const InvalidParameterException& e) {
        setError(e.what());
        return false;
    }
    return true;
}

bool PlannerConfiguration::parseTemplate(const rapidjson::Value& json, const std::string& context,
                                         TestTemplate& testTemplate) const {
    if (!json.IsObject()) {
        setError(context + ": expected a JSON object");
        return false;
    }

    std::string error;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<double> baseline;
    std::optional<double> mde;

    if (!readOptionalString(json, "name", context, name, error) ||
        !readOptionalString(json, "description", context, description, error) ||
        !readOptionalDouble(json, "baseline_rate", context, baseline, error) ||
        !readOptionalDouble(json, "minimum_detectable_effect", context, mde, error) ||
        !readOptionalDouble(json, "power", context, testTemplate.power, error) ||
        !readOptionalDouble(json, "significance", context, testTemplate.significance, error) ||
        !readTestType(json, context, testTemplate.testType, error) ||
        !readEffectType(json, context, testTemplate.effectType, error)) {
        setError(error);
        return false;
    }

    if (!name || name->empty()) {
        setError(context + ": 'name' is required");
        return false;
    }
    if (!baseline || !mde) {
        setError(context + " (" + *name + "): 'baseline_rate' and 'minimum_detectable_effect' are required");
        return false;
    }

    testTemplate.name = *name;
    testTemplate.description = description.value_or("");
    testTemplate.baselineRate = *baseline;
    testTemplate.minimumDetectableEffect = *mde;
    return true;
}

bool PlannerConfiguration::parseJson(const std::string& jsonContent) {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(jsonContent.c_str());

    if (doc.HasParseError()) {
        setError("JSON parse error at offset " + std::to_string(doc.GetErrorOffset()) + ": " +
                 rapidjson::GetParseError_En(doc.GetParseError()));
        return false;
    }

    if (!doc.IsObject()) {
        setError("Configuration root must be a JSON object");
        return false;
    }

    // Parse into copies so a failed load leaves this object unchanged.
    CalculationDefaults defaults = defaults_;
    PowerCurveSettings curveSettings = curveSettings_;
    std::vector<TestTemplate> templates;

    if (doc.HasMember("defaults") && !parseDefaults(doc["defaults"], defaults))
        return false;

    if (doc.HasMember("power_curve") && !parseCurveSettings(doc["power_curve"], curveSettings))
        return false;

    if (doc.HasMember("templates")) {
        const rapidjson::Value& list = doc["templates"];
        if (!list.IsArray()) {
            setError("templates: expected a JSON array");
            return false;
        }

        for (rapidjson::SizeType i = 0; i < list.Size(); ++i) {
            TestTemplate testTemplate;
            if (!parseTemplate(list[i], "templates[" + std::to_string(i) + "]", testTemplate))
                return false;

            for (const auto& existing : templates) {
                if (existing.name == testTemplate.name) {
                    setError("Duplicate template name: " + testTemplate.name);
                    return false;
                }
            }
            templates.push_back(testTemplate);
        }
    }

    defaults_ = defaults;
    curveSettings_ = curveSettings;
    if (doc.HasMember("templates"))
        templates_ = templates;

    lastError_.clear();
    return true;
}

PlannerConfiguration PlannerConfiguration::createDefault() {
    PlannerConfiguration config;

    TestTemplate checkout("checkout-conversion",
                          "Checkout completion, 10% relative lift on a 3% baseline",
                          0.03, 0.10);
    checkout.effectType = EffectType::RELATIVE;
    config.addTemplate(checkout);

    config.addTemplate(TestTemplate("signup-flow",
                                    "Signup funnel, 2 point absolute lift on a 10% baseline",
                                    0.10, 0.02));

    TestTemplate email("email-click-through",
                       "Email click-through, 5% relative lift at 90% power",
                       0.20, 0.05);
    email.effectType = EffectType::RELATIVE;
    email.power = 0.90;
    config.addTemplate(email);

    TestTemplate landing("landing-page-bounce",
                         "Landing page engagement, one-sided 1 point lift on a 5% baseline",
                         0.05, 0.01);
    landing.testType = TestType::ONE_TAILED;
    config.addTemplate(landing);

    return config;
}

} // namespace abplanner
