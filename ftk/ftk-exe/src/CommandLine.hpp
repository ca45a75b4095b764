#ifndef FTK_EXE_COMMAND_LINE_HPP
#define FTK_EXE_COMMAND_LINE_HPP

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

namespace ftk_exe
{

/**
 * @brief One tracker package: an activity code and its positional payload
 */
struct Package
{
  std::string code;
  std::vector<double> payload;
};

enum class OutputFormat
{
  Message,  // Fixed human-readable summary message
  Record    // name=value pairs of the summary record
};

/**
 * @brief Driver configuration
 *
 * Precedence: command line > FTK_LOG_LEVEL environment variable > defaults.
 */
struct Config
{
  spdlog::level::level_enum logLevel{spdlog::level::info};
  OutputFormat outputFormat{OutputFormat::Message};
  std::vector<Package> packages;  // Empty runs samplePackages()
  bool showHelp{false};
};

/**
 * @brief Packages processed when none are given on the command line
 */
std::vector<Package> samplePackages();

/**
 * @brief Build the configuration from command line and environment
 *
 * Recognized options:
 *   --log-level LEVEL     trace, debug, info, warn, error, critical, off
 *   --format FORMAT       message (default) or record
 *   --workout CODE:V,...  package to process, repeatable
 *   --help                print usage
 *
 * @param argc Argument count
 * @param argv Argument vector, argv[0] is the program name
 * @param envLogLevel Value of FTK_LOG_LEVEL, or nullptr when unset
 * @throws std::invalid_argument on unknown options or malformed values
 */
Config parseCommandLine(int argc,
                        const char* const* argv,
                        const char* envLogLevel);

/**
 * @brief Parse a "CODE:V1,V2,..." package argument
 *
 * The code is kept verbatim; it is validated by the dispatcher. An empty
 * value list ("CODE:") yields an empty payload.
 *
 * @throws std::invalid_argument if the separator is missing or a value is
 * not a number
 */
Package parsePackage(std::string_view argument);

/**
 * @throws std::invalid_argument for names spdlog does not know
 */
spdlog::level::level_enum parseLogLevel(std::string_view name);

OutputFormat parseOutputFormat(std::string_view name);

std::string usage(std::string_view program);

}  // namespace ftk_exe

#endif  // FTK_EXE_COMMAND_LINE_HPP
