#include "ftk-exe/src/CommandLine.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ftk_exe
{

namespace
{

double parseValue(std::string_view text, std::string_view argument)
{
  double value{0.0};
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last)
  {
    throw std::invalid_argument{fmt::format(
      "Invalid value '{}' in workout argument '{}'", text, argument)};
  }
  return value;
}

std::string_view requireValue(int& index,
                              int argc,
                              const char* const* argv)
{
  const std::string_view option{argv[index]};
  if (index + 1 >= argc)
  {
    throw std::invalid_argument{
      fmt::format("Option '{}' requires a value", option)};
  }
  ++index;
  return argv[index];
}

}  // namespace

std::vector<Package> samplePackages()
{
  return {{"SWM", {720, 1, 80, 25, 40}},
          {"RUN", {15000, 1, 75}},
          {"WLK", {9000, 1, 75, 180}}};
}

Config parseCommandLine(int argc,
                        const char* const* argv,
                        const char* envLogLevel)
{
  Config config;
  if (envLogLevel != nullptr && *envLogLevel != '\0')
  {
    config.logLevel = parseLogLevel(envLogLevel);
  }

  for (int i = 1; i < argc; ++i)
  {
    const std::string_view arg{argv[i]};
    if (arg == "--help" || arg == "-h")
    {
      config.showHelp = true;
    }
    else if (arg == "--log-level")
    {
      config.logLevel = parseLogLevel(requireValue(i, argc, argv));
    }
    else if (arg == "--format")
    {
      config.outputFormat = parseOutputFormat(requireValue(i, argc, argv));
    }
    else if (arg == "--workout")
    {
      config.packages.push_back(parsePackage(requireValue(i, argc, argv)));
    }
    else
    {
      throw std::invalid_argument{fmt::format("Unknown option '{}'", arg)};
    }
  }

  return config;
}

Package parsePackage(std::string_view argument)
{
  const auto colon = argument.find(':');
  if (colon == std::string_view::npos)
  {
    throw std::invalid_argument{fmt::format(
      "Workout argument '{}' must have the form CODE:V1,V2,...", argument)};
  }

  Package package;
  package.code = std::string{argument.substr(0, colon)};

  std::string_view values = argument.substr(colon + 1);
  while (!values.empty())
  {
    const auto comma = values.find(',');
    package.payload.push_back(parseValue(values.substr(0, comma), argument));
    if (comma == std::string_view::npos)
    {
      break;
    }
    values.remove_prefix(comma + 1);
    if (values.empty())
    {
      // Trailing comma
      throw std::invalid_argument{fmt::format(
        "Invalid value '' in workout argument '{}'", argument)};
    }
  }

  return package;
}

spdlog::level::level_enum parseLogLevel(std::string_view name)
{
  const auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off")
  {
    throw std::invalid_argument{fmt::format("Unknown log level '{}'", name)};
  }
  return level;
}

OutputFormat parseOutputFormat(std::string_view name)
{
  if (name == "message")
  {
    return OutputFormat::Message;
  }
  if (name == "record")
  {
    return OutputFormat::Record;
  }
  throw std::invalid_argument{fmt::format(
    "Unknown output format '{}' (expected 'message' or 'record')", name)};
}

std::string usage(std::string_view program)
{
  return fmt::format(
    "Usage: {} [--log-level LEVEL] [--format message|record] "
    "[--workout CODE:V1,V2,...]...\n"
    "\n"
    "Workout codes:\n"
    "  SWM  Swimming     action,duration,weight,poolLength,poolLaps\n"
    "  RUN  Running      action,duration,weight\n"
    "  WLK  RaceWalking  action,duration,weight,height\n"
    "\n"
    "Without --workout the built-in sample packages are processed.\n"
    "FTK_LOG_LEVEL sets the default log level.\n",
    program);
}

}  // namespace ftk_exe
