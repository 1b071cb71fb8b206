#pragma once

#include <ostream>
#include <vector>
#include "CalculationResult.h"
#include "ComparisonResult.h"
#include "TestParameters.h"

namespace abplanner {

struct TestTemplate;

/**
 * @brief Plain text rendering of calculations and comparisons
 *
 * Everything is written to the stream given at construction, so the
 * same printer serves the console and tests.
 */
class ReportPrinter {
public:
    explicit ReportPrinter(std::ostream& out);

    void printParameters(const TestParameters& parameters) const;

    /**
     * @brief Sample sizes and estimated duration
     */
    void printResult(const CalculationResult& result) const;

    /**
     * @brief Control and variant rates with the effect in both conventions
     */
    void printSummary(const TestSummary& summary) const;

    /**
     * @brief One line per curve point with a horizontal bar for the power
     *
     * @param targetPower Power requested by the user, marked on each bar
     */
    void printPowerCurve(const PowerCurve& curve, double targetPower) const;

    /**
     * @brief Comparison table in input order followed by the aggregates
     */
    void printComparison(const ComparisonResult& comparison) const;

    void printTemplates(const std::vector<TestTemplate>& templates) const;

private:
    std::ostream& out_;

    static constexpr int kBarWidth = 40;
};

} // namespace abplanner
