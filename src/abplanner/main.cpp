#include <iostream>
#include <memory>
#include <string>
#include <boost/program_options.hpp>
#include "CalculationSerializer.h"
#include "ParallelExecutors.h"
#include "PlannerCommand.h"
#include "PlannerConfiguration.h"
#include "ReportPrinter.h"
#include "SampleSizeEngine.h"
#include "ScenarioComparator.h"

namespace po = boost::program_options;

using namespace abplanner;

namespace {

void printUsage(const po::options_description& desc) {
    std::cout << "A/B Test Planner - sample size, duration and power for two-proportion tests\n\n";
    std::cout << "Usage: abplanner [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # 10% baseline, detect a 2 point lift, 1000 visitors per day\n";
    std::cout << "  abplanner --baseline 0.10 --mde 0.02 --daily-traffic 1000\n\n";
    std::cout << "  # 10% relative lift, one-tailed, with the power curve\n";
    std::cout << "  abplanner --baseline 0.05 --mde 0.10 --relative --one-tailed --curve\n\n";
    std::cout << "  # Start from a configured template and export the result\n";
    std::cout << "  abplanner --config planner.json --template signup-flow --export out/signup.json\n\n";
    std::cout << "  # Compare every scenario in a file using a thread pool\n";
    std::cout << "  abplanner --scenarios scenarios.json --parallel\n";
}

int runComparison(const po::variables_map& vm, const PlannerConfiguration& config,
                  const SampleSizeEngine& engine, bool verbose) {
    const ScenarioSet scenarios = loadScenarios(vm["scenarios"].as<std::string>(), config);

    std::shared_ptr<concurrency::IParallelExecutor> executor;
    if (vm.count("parallel")) {
        auto pool = std::make_shared<concurrency::ThreadPoolExecutor<>>();
        if (verbose)
            std::cout << "Evaluating " << scenarios.getNumScenarios() << " scenarios on "
                      << pool->getNumThreads() << " threads" << std::endl;
        executor = pool;
    } else {
        executor = std::make_shared<concurrency::SingleThreadExecutor>();
    }

    ScenarioComparator comparator(engine, executor);
    const ComparisonResult comparison = comparator.compare(scenarios);

    ReportPrinter printer(std::cout);
    printer.printComparison(comparison);

    if (vm.count("export")) {
        const std::string exportPath = vm["export"].as<std::string>();
        writeTextFile(exportPath, CalculationSerializer::exportComparison(comparison));
        std::cout << "Comparison exported to " << exportPath << std::endl;
    }

    return EXIT_OK;
}

int runCalculation(const po::variables_map& vm, const PlannerConfiguration& config,
                   const SampleSizeEngine& engine, bool verbose) {
    const TestParameters parameters = resolveParameters(vm, config);
    const CalculationResult result = engine.calculate(parameters);

    ReportPrinter printer(std::cout);
    if (verbose)
        printer.printParameters(parameters);
    printer.printResult(result);
    printer.printSummary(result.getSummary());
    if (vm.count("curve"))
        printer.printPowerCurve(result.getPowerCurve(), parameters.getPower());

    if (vm.count("export")) {
        const std::string exportPath = vm["export"].as<std::string>();
        const std::string name = vm.count("template") ? vm["template"].as<std::string>() : "";
        writeTextFile(exportPath, CalculationSerializer::exportCalculation(parameters, result, name));
        std::cout << "Calculation exported to " << exportPath << std::endl;
    }

    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const po::options_description desc = createOptionsDescription();

    po::variables_map vm;
    try {
        vm = parseCommandLine(argc, argv, desc);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(desc);
        return EXIT_PARSE_ERROR;
    }

    if (vm.count("help")) {
        printUsage(desc);
        return EXIT_OK;
    }

    const bool verbose = vm.count("verbose") > 0;

    try {
        const PlannerConfiguration config = loadConfiguration(vm, verbose);

        if (vm.count("list-templates")) {
            ReportPrinter(std::cout).printTemplates(config.getTemplates());
            return EXIT_OK;
        }

        const SampleSizeEngine engine(config.getCurveSettings());

        if (vm.count("scenarios"))
            return runComparison(vm, config, engine, verbose);

        return runCalculation(vm, config, engine, verbose);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return exitCodeFor(std::current_exception());
    }
}
