#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ftk-exe/src/CommandLine.hpp"
#include "ftk-exe/src/SessionRunner.hpp"

int main(int argc, char* argv[])
{
  // Messages go to stdout, diagnostics to stderr
  auto logger = spdlog::stderr_color_mt("ftk");
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  try
  {
    const auto config =
      ftk_exe::parseCommandLine(argc, argv, std::getenv("FTK_LOG_LEVEL"));
    if (config.showHelp)
    {
      std::cout << ftk_exe::usage(argv[0]);
      return ftk_exe::kExitSuccess;
    }

    logger->set_level(config.logLevel);

    ftk_exe::SessionRunner runner{config, logger};
    return runner.run(std::cout);
  }
  catch (const std::invalid_argument& e)
  {
    logger->error("{}", e.what());
    std::cerr << ftk_exe::usage(argv[0]);
    return ftk_exe::kExitUsageError;
  }
  catch (const std::exception& e)
  {
    logger->critical("Unexpected failure: {}", e.what());
    return ftk_exe::kExitUsageError;
  }
}
