#include "ReportPrinter.h"
#include <iomanip>
#include <sstream>
#include <string>
#include "PlannerConfiguration.h"

namespace abplanner {

namespace {

std::string formatPercent(double value, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value * 100.0 << "%";
    return oss.str();
}

std::string formatDays(const std::optional<std::uint64_t>& days) {
    if (!days)
        return "n/a";
    return std::to_string(*days) + (*days == 1 ? " day" : " days");
}

} // anonymous namespace

ReportPrinter::ReportPrinter(std::ostream& out)
    : out_(out) {
}

void ReportPrinter::printParameters(const TestParameters& parameters) const {
    out_ << "Parameters:\n";
    out_ << "  Baseline rate:       " << formatPercent(parameters.getBaselineRate()) << "\n";
    if (parameters.getEffectType() == EffectType::RELATIVE)
        out_ << "  Minimum effect:      " << formatPercent(parameters.getMinimumDetectableEffect())
             << " (relative)\n";
    else
        out_ << "  Minimum effect:      " << formatPercent(parameters.getMinimumDetectableEffect())
             << " (absolute)\n";
    out_ << "  Power:               " << formatPercent(parameters.getPower(), 1) << "\n";
    out_ << "  Significance:        " << formatPercent(parameters.getSignificance(), 1) << "\n";
    out_ << "  Test type:           " << testTypeToString(parameters.getTestType()) << "\n";
    if (parameters.getDailyTraffic())
        out_ << "  Daily traffic:       " << *parameters.getDailyTraffic() << "\n";
    out_ << std::endl;
}

void ReportPrinter::printResult(const CalculationResult& result) const {
    out_ << "Required sample size:\n";
    out_ << "  Per variant:         " << result.getSampleSizePerVariant() << "\n";
    out_ << "  Total:               " << result.getTotalSampleSize() << "\n";
    out_ << "  Estimated duration:  " << formatDays(result.getEstimatedDays()) << "\n";
    out_ << std::endl;
}

void ReportPrinter::printSummary(const TestSummary& summary) const {
    out_ << "Test summary:\n";
    out_ << "  Control rate:        " << formatPercent(summary.controlRate) << "\n";
    out_ << "  Variant rate:        " << formatPercent(summary.variantRate) << "\n";
    out_ << "  Absolute effect:     " << formatPercent(summary.absoluteEffect) << "\n";
    out_ << "  Relative effect:     " << formatPercent(summary.relativeEffect) << "\n";
    out_ << std::endl;
}

void ReportPrinter::printPowerCurve(const PowerCurve& curve, double targetPower) const {
    out_ << "Power curve (n = " << curve.getSampleSizePerVariant() << " per variant):\n";
    out_ << "  " << std::setw(12) << "Effect" << "  " << std::setw(8) << "Power" << "\n";

    const int targetColumn = static_cast<int>(targetPower * kBarWidth + 0.5);

    for (const PowerCurvePoint& point : curve) {
        const int filled = static_cast<int>(point.achievedPower * kBarWidth + 0.5);

        std::string bar(kBarWidth, ' ');
        for (int i = 0; i < filled; ++i)
            bar[i] = '#';
        if (targetColumn > 0 && targetColumn <= kBarWidth)
            bar[targetColumn - 1] = (targetColumn <= filled) ? '+' : '|';

        std::ostringstream effect;
        effect << std::fixed << std::setprecision(5) << point.effectSize;

        out_ << "  " << std::setw(12) << effect.str()
             << "  " << std::setw(8) << formatPercent(point.achievedPower, 1)
             << "  " << bar << "\n";
    }
    out_ << std::endl;
}

void ReportPrinter::printComparison(const ComparisonResult& comparison) const {
    out_ << "Scenario comparison (" << comparison.getNumOutcomes() << " scenarios):\n";
    out_ << "  " << std::left
         << std::setw(4) << "#"
         << std::setw(28) << "Name"
         << std::right
         << std::setw(14) << "Per variant"
         << std::setw(14) << "Total"
         << std::setw(12) << "Days" << "\n";

    for (auto it = comparison.beginOutcomes(); it != comparison.endOutcomes(); ++it) {
        out_ << "  " << std::left
             << std::setw(4) << it->getScenarioIndex()
             << std::setw(28) << it->getScenarioName()
             << std::right;

        if (it->isSuccess()) {
            const CalculationResult& result = it->getResult();
            out_ << std::setw(14) << result.getSampleSizePerVariant()
                 << std::setw(14) << result.getTotalSampleSize()
                 << std::setw(12)
                 << (result.getEstimatedDays() ? std::to_string(*result.getEstimatedDays()) : "-")
                 << "\n";
        } else {
            const ScenarioError& error = it->getError();
            out_ << "  invalid " << error.field << ": " << error.reason << "\n";
        }
    }

    out_ << "\n  Succeeded: " << comparison.getNumSucceeded()
         << ", failed: " << comparison.getNumFailed() << "\n";

    if (auto maxPerVariant = comparison.getMaxSampleSizePerVariant())
        out_ << "  Largest per-variant size: " << *maxPerVariant << "\n";
    if (auto maxTotal = comparison.getMaxTotalSampleSize())
        out_ << "  Largest total size:       " << *maxTotal << "\n";
    if (auto maxDays = comparison.getMaxEstimatedDays())
        out_ << "  Longest duration:         " << formatDays(maxDays) << "\n";

    const std::vector<std::size_t> ranking = comparison.rankBySampleSize();
    if (!ranking.empty()) {
        out_ << "  Ranking (smallest first):";
        for (std::size_t index : ranking)
            out_ << " " << comparison.getOutcome(index).getScenarioName() << " [" << index << "]";
        out_ << "\n";
    }
    out_ << std::endl;
}

void ReportPrinter::printTemplates(const std::vector<TestTemplate>& templates) const {
    if (templates.empty()) {
        out_ << "No templates configured." << std::endl;
        return;
    }

    out_ << "Available templates:\n";
    for (const auto& testTemplate : templates) {
        out_ << "  " << std::left << std::setw(24) << testTemplate.name << std::right
             << " baseline " << formatPercent(testTemplate.baselineRate)
             << ", mde " << formatPercent(testTemplate.minimumDetectableEffect);
        if (testTemplate.effectType)
            out_ << " (" << effectTypeToString(*testTemplate.effectType) << ")";
        out_ << "\n";
        if (!testTemplate.description.empty())
            out_ << "  " << std::string(24, ' ') << " " << testTemplate.description << "\n";
    }
    out_ << std::endl;
}

} // namespace abplanner
