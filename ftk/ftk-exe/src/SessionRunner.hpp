#ifndef FTK_EXE_SESSION_RUNNER_HPP
#define FTK_EXE_SESSION_RUNNER_HPP

#include <cstddef>
#include <memory>
#include <ostream>

#include <spdlog/spdlog.h>

#include "ftk-exe/src/CommandLine.hpp"

namespace ftk_exe
{

constexpr int kExitSuccess = 0;
constexpr int kExitUsageError = 1;
constexpr int kExitPackageFailure = 2;

/**
 * @brief Feeds tracker packages through the dispatcher and prints summaries
 *
 * Each package is handled independently: a package that fails (unknown
 * code, wrong payload length, division fault) is logged at error level and
 * the remaining packages are still processed.
 *
 * Thread safety: Not thread-safe
 */
class SessionRunner
{
public:
  /**
   * @param config Driver configuration; empty packages selects the samples
   * @param logger Logger receiving per-package diagnostics
   */
  SessionRunner(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Process all configured packages
   * @param out Sink receiving one rendered line per successful package
   * @return kExitSuccess, or kExitPackageFailure if any package failed
   */
  int run(std::ostream& out);

  [[nodiscard]] std::size_t getProcessedCount() const
  {
    return processedCount_;
  }

  [[nodiscard]] std::size_t getFailureCount() const
  {
    return failureCount_;
  }

private:
  bool processPackage(const Package& package, std::ostream& out);

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  std::size_t processedCount_{0};
  std::size_t failureCount_{0};
};

}  // namespace ftk_exe

#endif  // FTK_EXE_SESSION_RUNNER_HPP
