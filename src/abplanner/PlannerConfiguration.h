#pragma once

#include <optional>
#include <string>
#include <vector>
#include "PowerCurve.h"
#include "TestParameters.h"

#include <rapidjson/document.h>

namespace abplanner {

/**
 * @brief Values applied to any parameter the user does not supply
 */
struct CalculationDefaults {
    double power = 0.80;
    double significance = 0.05;
    TestType testType = TestType::TWO_TAILED;
    EffectType effectType = EffectType::ABSOLUTE;

    CalculationDefaults() = default;
};

/**
 * @brief A named, reusable starting point for a calculation
 *
 * Baseline and MDE are mandatory. Members left unset fall back to the
 * configuration defaults when the template is resolved.
 */
struct TestTemplate {
    std::string name;
    std::string description;
    double baselineRate = 0.0;
    double minimumDetectableEffect = 0.0;
    std::optional<double> power;
    std::optional<double> significance;
    std::optional<TestType> testType;
    std::optional<EffectType> effectType;

    TestTemplate() = default;
    TestTemplate(const std::string& name, const std::string& description,
                 double baselineRate, double minimumDetectableEffect)
        : name(name), description(description),
          baselineRate(baselineRate), minimumDetectableEffect(minimumDetectableEffect) {}
};

/**
 * @brief Planner settings read from a JSON file
 *
 * Holds calculation defaults, power curve tuning and the template list.
 * Every section of the file is optional; whatever is absent keeps the
 * built-in value. Loading either succeeds completely or leaves the
 * configuration untouched and records the reason in getLastError().
 */
class PlannerConfiguration {
public:
    PlannerConfiguration();

    /**
     * @brief Load configuration from JSON file
     *
     * @param configPath Path to the configuration file
     * @return true if loaded successfully, false otherwise
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * @brief Load configuration from JSON string
     *
     * @param jsonContent JSON content as string
     * @return true if parsed successfully, false otherwise
     */
    bool loadFromString(const std::string& jsonContent);

    const CalculationDefaults& getDefaults() const { return defaults_; }
    void setDefaults(const CalculationDefaults& defaults) { defaults_ = defaults; }

    const PowerCurveSettings& getCurveSettings() const { return curveSettings_; }
    void setCurveSettings(const PowerCurveSettings& settings) { curveSettings_ = settings; }

    const std::vector<TestTemplate>& getTemplates() const { return templates_; }

    /**
     * @brief Add a template; returns false if the name is already taken
     */
    bool addTemplate(const TestTemplate& testTemplate);

    /**
     * @brief Look up a template by exact name
     */
    const TestTemplate* findTemplate(const std::string& name) const;

    /**
     * @brief Parameters for the given rates with every other member taken
     * from the configuration defaults
     */
    TestParameters defaultParameters(double baselineRate, double minimumDetectableEffect) const;

    /**
     * @brief Parameters for a template with the defaults filled in
     */
    TestParameters resolveTemplate(const TestTemplate& testTemplate) const;

    const std::string& getLastError() const { return lastError_; }

    /**
     * @brief Built-in defaults plus a few common test templates
     */
    static PlannerConfiguration createDefault();

private:
    CalculationDefaults defaults_;
    PowerCurveSettings curveSettings_;
    std::vector<TestTemplate> templates_;
    mutable std::string lastError_;

    bool parseJson(const std::string& jsonContent);

    bool parseDefaults(const rapidjson::Value& json, CalculationDefaults& defaults) const;
    bool parseCurveSettings(const rapidjson::Value& json, PowerCurveSettings& settings) const;
    bool parseTemplate(const rapidjson::Value& json, const std::string& context,
                       TestTemplate& testTemplate) const;

    void setError(const std::string& error) const { lastError_ = error; }
};

} // namespace abplanner
