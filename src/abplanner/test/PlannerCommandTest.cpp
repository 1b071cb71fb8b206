#include <catch2/catch_test_macros.hpp>
#include "PlannerCommand.h"
#include "PlannerConfiguration.h"
#include "SampleSizeException.h"
#include <cstdint>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

using namespace abplanner;

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace {

po::variables_map parseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "abplanner");
    return parseCommandLine(static_cast<int>(args.size()), args.data(), createOptionsDescription());
}

PlannerConfiguration tunedConfiguration() {
    PlannerConfiguration config;
    bool loaded = config.loadFromString(R"({
        "defaults": { "power": 0.9, "significance": 0.01,
                      "test_type": "one_tailed", "effect_type": "relative" },
        "templates": [
            { "name": "checkout", "baseline_rate": 0.3, "minimum_detectable_effect": 0.05,
              "power": 0.85, "test_type": "two_tailed" }
        ]
    })");
    INFO("Error loading config: " << config.getLastError());
    REQUIRE(loaded);
    return config;
}

// Scratch directory removed when the test finishes.
class TempDirectory {
public:
    TempDirectory()
        : path_(fs::temp_directory_path() / fs::unique_path("abplanner-%%%%-%%%%-%%%%")) {
        fs::create_directories(path_);
    }

    ~TempDirectory() {
        boost::system::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

template <typename E>
ExitCode exitCodeOf(const E& error) {
    return exitCodeFor(std::make_exception_ptr(error));
}

}

TEST_CASE("Command line parsing", "[PlannerCommand]") {
    SECTION("Values and switches") {
        po::variables_map vm = parseArgs({"--baseline", "0.1", "--mde", "0.02", "--one-tailed",
                                          "-t", "1000", "--export", "out/result.json"});
        REQUIRE(vm["baseline"].as<double>() == 0.1);
        REQUIRE(vm["mde"].as<double>() == 0.02);
        REQUIRE(vm["daily-traffic"].as<long long>() == 1000);
        REQUIRE(vm["export"].as<std::string>() == "out/result.json");
        REQUIRE(vm.count("one-tailed") == 1);
        REQUIRE(vm.count("relative") == 0);
    }

    SECTION("Unknown options and bad values are parse errors") {
        try {
            parseArgs({"--baseline", "0.1", "--sideways"});
            FAIL("expected a program_options error");
        } catch (const po::error&) {
            REQUIRE(exitCodeFor(std::current_exception()) == EXIT_PARSE_ERROR);
        }

        REQUIRE_THROWS_AS(parseArgs({"--baseline", "ten"}), po::error);
        REQUIRE_THROWS_AS(parseArgs({"--mde"}), po::error);
    }
}

TEST_CASE("Parameter precedence", "[PlannerCommand]") {
    const PlannerConfiguration config = tunedConfiguration();

    SECTION("Configuration defaults fill everything the flags leave out") {
        const TestParameters params = resolveParameters(parseArgs({"-b", "0.1", "-m", "0.2"}), config);
        REQUIRE(params == TestParameters(0.1, 0.2, 0.9, 0.01, TestType::ONE_TAILED,
                                         std::nullopt, EffectType::RELATIVE));
    }

    SECTION("Template values win over the defaults") {
        const TestParameters params = resolveParameters(parseArgs({"--template", "checkout"}), config);
        REQUIRE(params == TestParameters(0.3, 0.05, 0.85, 0.01, TestType::TWO_TAILED,
                                         std::nullopt, EffectType::RELATIVE));
    }

    SECTION("Flags win over the template") {
        const TestParameters params = resolveParameters(
            parseArgs({"--template", "checkout", "--mde", "0.1", "--power", "0.95",
                       "--significance", "0.05", "--one-tailed", "--daily-traffic", "2500"}),
            config);
        REQUIRE(params == TestParameters(0.3, 0.1, 0.95, 0.05, TestType::ONE_TAILED,
                                         std::int64_t(2500), EffectType::RELATIVE));
    }

    SECTION("Missing rates without a template") {
        REQUIRE_THROWS_AS(resolveParameters(parseArgs({"--baseline", "0.1"}), config), UsageError);
        REQUIRE_THROWS_AS(resolveParameters(parseArgs({}), config), UsageError);
    }

    SECTION("Unknown template") {
        try {
            resolveParameters(parseArgs({"--template", "nope"}), config);
            FAIL("expected UsageError");
        } catch (const UsageError& e) {
            REQUIRE(std::string(e.what()).find("nope") != std::string::npos);
            REQUIRE(exitCodeFor(std::current_exception()) == EXIT_INVALID_INPUT);
        }
    }
}

TEST_CASE("Exit codes by failure kind", "[PlannerCommand]") {
    REQUIRE(exitCodeFor(std::exception_ptr()) == EXIT_OK);
    REQUIRE(exitCodeOf(FileAccessError("gone")) == EXIT_FILE_ERROR);
    REQUIRE(exitCodeOf(fs::filesystem_error("denied",
                                            boost::system::errc::make_error_code(
                                                boost::system::errc::permission_denied)))
            == EXIT_FILE_ERROR);
    REQUIRE(exitCodeOf(SerializationException("bad json")) == EXIT_PARSE_ERROR);
    REQUIRE(exitCodeOf(po::unknown_option("--sideways")) == EXIT_PARSE_ERROR);
    REQUIRE(exitCodeOf(InvalidParameterException("power", "must be in (0, 1)")) == EXIT_INVALID_INPUT);
    REQUIRE(exitCodeOf(UsageError("missing --mde")) == EXIT_INVALID_INPUT);
    REQUIRE(exitCodeOf(std::runtime_error("other")) == EXIT_INVALID_INPUT);
}

TEST_CASE("Configuration and file access", "[PlannerCommand]") {
    TempDirectory temp;

    SECTION("Built-in configuration without --config") {
        const PlannerConfiguration config = loadConfiguration(parseArgs({}), false);
        REQUIRE(config.findTemplate("signup-flow") != nullptr);
    }

    SECTION("Missing configuration file") {
        const std::string path = temp.file("absent.json");
        REQUIRE_THROWS_AS(loadConfiguration(parseArgs({"--config", path.c_str()}), false),
                          FileAccessError);
    }

    SECTION("Malformed configuration file") {
        const std::string path = temp.file("broken.json");
        writeTextFile(path, R"({ "defaults": )");
        REQUIRE_THROWS_AS(loadConfiguration(parseArgs({"--config", path.c_str()}), false),
                          SerializationException);
    }

    SECTION("Written files read back and parents are created") {
        const std::string path = temp.file("nested/deeper/result.json");
        writeTextFile(path, "{}");
        REQUIRE(fs::exists(path));
        REQUIRE(readTextFile(path) == "{}\n");
    }

    SECTION("Reading a missing file or a directory") {
        REQUIRE_THROWS_AS(readTextFile(temp.file("absent.json")), FileAccessError);
        REQUIRE_THROWS_AS(readTextFile(temp.file("")), FileAccessError);
    }

    SECTION("Scenario files pick up the configuration defaults") {
        const std::string path = temp.file("scenarios.json");
        writeTextFile(path, R"({"scenarios": [
            {"name": "sparse", "parameters": {"baseline_rate": 0.1, "minimum_detectable_effect": 0.2}},
            {"name": "tuned", "parameters": {"baseline_rate": 0.1, "minimum_detectable_effect": 0.02,
                                             "power": 0.8, "effect_type": "absolute"}}]})");

        const ScenarioSet scenarios = loadScenarios(path, tunedConfiguration());
        REQUIRE(scenarios.getNumScenarios() == 2);
        REQUIRE(scenarios.getScenario(0).getParameters() ==
                TestParameters(0.1, 0.2, 0.9, 0.01, TestType::ONE_TAILED,
                               std::nullopt, EffectType::RELATIVE));
        REQUIRE(scenarios.getScenario(1).getParameters() ==
                TestParameters(0.1, 0.02, 0.8, 0.01, TestType::ONE_TAILED,
                               std::nullopt, EffectType::ABSOLUTE));
    }
}
