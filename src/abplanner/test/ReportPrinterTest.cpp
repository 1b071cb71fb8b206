#include <catch2/catch_test_macros.hpp>
#include "PlannerConfiguration.h"
#include "ReportPrinter.h"
#include "SampleSizeEngine.h"
#include "ScenarioComparator.h"
#include <sstream>
#include <string>

using namespace abplanner;

namespace {

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

std::size_t countLines(const std::string& text) {
    std::size_t lines = 0;
    for (char c : text) {
        if (c == '\n')
            ++lines;
    }
    return lines;
}

}

TEST_CASE("Report printer shows sizes, duration and summary", "[ReportPrinter]") {
    const TestParameters params(0.10, 0.02, 0.80, 0.05, TestType::TWO_TAILED, std::int64_t(1000));
    const CalculationResult result = SampleSizeEngine().calculate(params);

    std::ostringstream out;
    ReportPrinter printer(out);
    printer.printParameters(params);
    printer.printResult(result);
    printer.printSummary(result.getSummary());

    const std::string text = out.str();
    REQUIRE(contains(text, "Per variant:         3841"));
    REQUIRE(contains(text, "Total:               7682"));
    REQUIRE(contains(text, "Estimated duration:  8 days"));
    REQUIRE(contains(text, "Variant rate:        12.00%"));
    REQUIRE(contains(text, "Relative effect:     20.00%"));
    REQUIRE(contains(text, "two_tailed"));
}

TEST_CASE("Report printer marks a missing duration", "[ReportPrinter]") {
    const CalculationResult result = SampleSizeEngine().calculate(TestParameters(0.10, 0.02));

    std::ostringstream out;
    ReportPrinter(out).printResult(result);
    REQUIRE(contains(out.str(), "Estimated duration:  n/a"));
}

TEST_CASE("Report printer draws one row per curve point", "[ReportPrinter]") {
    SampleSizeEngine engine(PowerCurveSettings(10, 0.1, 3.0));
    const CalculationResult result = engine.calculate(TestParameters(0.10, 0.02));

    std::ostringstream out;
    ReportPrinter(out).printPowerCurve(result.getPowerCurve(), 0.8);

    // Title, column header, ten rows and the trailing blank line.
    REQUIRE(countLines(out.str()) == 13);
    REQUIRE(contains(out.str(), "n = 3841"));
}

TEST_CASE("Report printer lists failures inline in a comparison", "[ReportPrinter]") {
    ScenarioSet scenarios;
    scenarios.addScenario("good", TestParameters(0.10, 0.02));
    scenarios.addScenario("bad", TestParameters(1.5, 0.02));

    std::ostringstream out;
    ReportPrinter(out).printComparison(ScenarioComparator().compare(scenarios));

    const std::string text = out.str();
    REQUIRE(contains(text, "invalid baseline_rate"));
    REQUIRE(contains(text, "Succeeded: 1, failed: 1"));
    REQUIRE(contains(text, "Ranking (smallest first): good [0]"));
}

TEST_CASE("Report printer lists templates", "[ReportPrinter]") {
    std::ostringstream out;
    ReportPrinter(out).printTemplates(PlannerConfiguration::createDefault().getTemplates());
    REQUIRE(contains(out.str(), "signup-flow"));
    REQUIRE(contains(out.str(), "(relative)"));

    std::ostringstream empty;
    ReportPrinter(empty).printTemplates({});
    REQUIRE(contains(empty.str(), "No templates configured."));
}
