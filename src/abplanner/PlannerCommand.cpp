#include "PlannerCommand.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <boost/filesystem.hpp>
#include "CalculationSerializer.h"
#include "SampleSizeException.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace abplanner {

po::options_description createOptionsDescription() {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("baseline,b", po::value<double>(), "Baseline conversion rate, e.g. 0.10")
        ("mde,m", po::value<double>(), "Minimum detectable effect, e.g. 0.02 (absolute) or 0.10 with --relative")
        ("power,p", po::value<double>(), "Statistical power (default from configuration, 0.80)")
        ("significance,a", po::value<double>(), "Significance level alpha (default from configuration, 0.05)")
        ("one-tailed", "Use a one-tailed test instead of two-tailed")
        ("relative", "Interpret --mde as a relative lift over the baseline")
        ("daily-traffic,t", po::value<long long>(), "Visitors per day across both variants")
        ("config,c", po::value<std::string>(), "JSON configuration file with defaults and templates")
        ("template", po::value<std::string>(), "Start from a named template")
        ("list-templates", "List configured templates")
        ("scenarios,s", po::value<std::string>(), "Compare the scenarios in a JSON file")
        ("parallel", "Evaluate scenarios on a thread pool")
        ("curve", "Print the power curve")
        ("export,o", po::value<std::string>(), "Export the calculation or comparison to a JSON file")
        ("verbose,v", "Verbose output");
    return desc;
}

po::variables_map parseCommandLine(int argc, const char* const argv[],
                                   const po::options_description& desc) {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
    return vm;
}

PlannerConfiguration loadConfiguration(const po::variables_map& vm, bool verbose) {
    if (!vm.count("config")) {
        if (verbose)
            std::cout << "Using built-in configuration" << std::endl;
        return PlannerConfiguration::createDefault();
    }

    const std::string configPath = vm["config"].as<std::string>();
    if (!fs::exists(configPath))
        throw FileAccessError("Configuration file not found: " + configPath);

    PlannerConfiguration config;
    if (!config.loadFromFile(configPath))
        throw SerializationException("Invalid configuration " + configPath + ": " + config.getLastError());

    if (verbose)
        std::cout << "Loaded configuration from " << configPath
                  << " (" << config.getTemplates().size() << " templates)" << std::endl;
    return config;
}

TestParameters resolveParameters(const po::variables_map& vm, const PlannerConfiguration& config) {
    TestParameters result(0.0, 0.0);

    if (vm.count("template")) {
        const std::string name = vm["template"].as<std::string>();
        const TestTemplate* testTemplate = config.findTemplate(name);
        if (testTemplate == nullptr)
            throw UsageError("Unknown template '" + name + "' (use --list-templates)");

        result = config.resolveTemplate(*testTemplate);
    } else {
        if (!vm.count("baseline") || !vm.count("mde"))
            throw UsageError("--baseline and --mde are required unless --template or --scenarios is given");

        result = config.defaultParameters(vm["baseline"].as<double>(), vm["mde"].as<double>());
    }

    if (vm.count("baseline"))
        result = result.withBaselineRate(vm["baseline"].as<double>());
    if (vm.count("mde"))
        result = result.withMinimumDetectableEffect(vm["mde"].as<double>());
    if (vm.count("power"))
        result = result.withPower(vm["power"].as<double>());
    if (vm.count("significance"))
        result = result.withSignificance(vm["significance"].as<double>());
    if (vm.count("one-tailed"))
        result = result.withTestType(TestType::ONE_TAILED);
    if (vm.count("relative"))
        result = result.withEffectType(EffectType::RELATIVE);
    if (vm.count("daily-traffic"))
        result = result.withDailyTraffic(static_cast<std::int64_t>(vm["daily-traffic"].as<long long>()));

    return result;
}

ScenarioSet loadScenarios(const std::string& path, const PlannerConfiguration& config) {
    return CalculationSerializer::importScenarioSet(readTextFile(path),
                                                    config.defaultParameters(0.0, 0.0));
}

std::string readTextFile(const std::string& path) {
    if (!fs::exists(path) || !fs::is_regular_file(path))
        throw FileAccessError("File not found: " + path);

    std::ifstream file(path);
    if (!file.is_open())
        throw FileAccessError("Could not open file: " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeTextFile(const std::string& path, const std::string& content) {
    fs::path target(path);
    fs::path parentDir = target.parent_path();

    if (!parentDir.empty() && !fs::exists(parentDir)) {
        boost::system::error_code ec;
        fs::create_directories(parentDir, ec);
        if (ec)
            throw FileAccessError("Could not create directory " + parentDir.string() + ": " + ec.message());
    }

    std::ofstream file(path);
    if (!file.is_open())
        throw FileAccessError("Could not open file for writing: " + path);

    file << content << "\n";
    if (!file)
        throw FileAccessError("Failed writing to: " + path);
}

ExitCode exitCodeFor(const std::exception_ptr& error) {
    if (!error)
        return EXIT_OK;

    try {
        std::rethrow_exception(error);
    } catch (const po::error&) {
        return EXIT_PARSE_ERROR;
    } catch (const FileAccessError&) {
        return EXIT_FILE_ERROR;
    } catch (const fs::filesystem_error&) {
        return EXIT_FILE_ERROR;
    } catch (const SerializationException&) {
        return EXIT_PARSE_ERROR;
    } catch (const InvalidParameterException&) {
        return EXIT_INVALID_INPUT;
    } catch (const UsageError&) {
        return EXIT_INVALID_INPUT;
    } catch (const std::exception&) {
        return EXIT_INVALID_INPUT;
    }
}

} // namespace abplanner
