#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <boost/program_options.hpp>
#include "PlannerConfiguration.h"
#include "ScenarioSet.h"
#include "TestParameters.h"

namespace abplanner {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FILE_ERROR = 1,
    EXIT_PARSE_ERROR = 2,
    EXIT_INVALID_INPUT = 3
};

// Raised for missing or unreadable files; mapped to EXIT_FILE_ERROR.
class FileAccessError : public std::runtime_error {
public:
    explicit FileAccessError(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised for incomplete or contradictory command lines; mapped to EXIT_INVALID_INPUT.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Every option the abplanner tool accepts
 */
boost::program_options::options_description createOptionsDescription();

/**
 * @brief Parse and notify the command line
 *
 * Throws boost::program_options::error for unknown options or bad values.
 */
boost::program_options::variables_map parseCommandLine(int argc, const char* const argv[],
                                                       const boost::program_options::options_description& desc);

/**
 * @brief The --config file, or the built-in configuration without one
 *
 * Throws FileAccessError when the file is missing and SerializationException
 * when it does not load.
 */
PlannerConfiguration loadConfiguration(const boost::program_options::variables_map& vm, bool verbose);

/**
 * @brief Parameters for a single calculation
 *
 * Precedence: command line flags, then the selected template, then the
 * configuration defaults. Throws UsageError for an unknown template or when
 * neither a template nor both --baseline and --mde are given.
 */
TestParameters resolveParameters(const boost::program_options::variables_map& vm,
                                 const PlannerConfiguration& config);

/**
 * @brief Read a scenario file; members a scenario omits come from the
 * configuration defaults
 */
ScenarioSet loadScenarios(const std::string& path, const PlannerConfiguration& config);

std::string readTextFile(const std::string& path);

/**
 * @brief Write content plus a trailing newline, creating missing parent
 * directories
 */
void writeTextFile(const std::string& path, const std::string& content);

/**
 * @brief Exit code for an exception raised while running a command
 *
 * Exceptions not derived from std::exception are rethrown.
 */
ExitCode exitCodeFor(const std::exception_ptr& error);

} // namespace abplanner
