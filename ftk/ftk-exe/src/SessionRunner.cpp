#include "ftk-exe/src/SessionRunner.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "ftk-core/src/Dispatch/WorkoutDispatcher.hpp"
#include "ftk-core/src/Summary/SummaryFormatter.hpp"
#include "ftk-core/src/Summary/SummaryTransfer.hpp"
#include "ftk-core/src/Workout/WorkoutErrors.hpp"
#include "ftk-transfer/src/RecordFormat.hpp"

namespace ftk_exe
{

SessionRunner::SessionRunner(Config config,
                             std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("SessionRunner requires a logger");
  }
}

int SessionRunner::run(std::ostream& out)
{
  const auto packages =
    config_.packages.empty() ? samplePackages() : config_.packages;

  logger_->debug("Processing {} workout package(s)", packages.size());

  processedCount_ = 0;
  failureCount_ = 0;
  for (const auto& package : packages)
  {
    ++processedCount_;
    if (!processPackage(package, out))
    {
      ++failureCount_;
    }
  }

  if (failureCount_ > 0)
  {
    logger_->warn("{} of {} workout package(s) failed",
                  failureCount_,
                  processedCount_);
    return kExitPackageFailure;
  }
  return kExitSuccess;
}

bool SessionRunner::processPackage(const Package& package, std::ostream& out)
{
  try
  {
    const auto workout =
      ftk_core::workout_dispatcher::resolveWorkout(package.code,
                                                   package.payload);
    const ftk_core::Summary summary = workout->buildSummary();

    if (config_.outputFormat == OutputFormat::Record)
    {
      out << ftk_transfer::formatRecordFields(ftk_core::toRecord(summary))
          << "\n";
    }
    else
    {
      out << ftk_core::renderMessage(summary) << "\n";
    }
    return true;
  }
  catch (const ftk_core::UnknownWorkoutKind& e)
  {
    logger_->error("Package '{}' rejected: {}", e.code(), e.what());
  }
  catch (const ftk_core::ArityMismatch& e)
  {
    logger_->error("Package '{}' rejected: expected {} values, got {}",
                   e.code(),
                   e.expected(),
                   e.actual());
  }
  catch (const ftk_core::ArithmeticFault& e)
  {
    logger_->error("Package '{}' could not be computed: {}",
                   package.code,
                   e.what());
  }
  return false;
}

}  // namespace ftk_exe
