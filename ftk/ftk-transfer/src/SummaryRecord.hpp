#ifndef FTK_TRANSFER_SUMMARY_RECORD_HPP
#define FTK_TRANSFER_SUMMARY_RECORD_HPP

#include <limits>
#include <string>

#include <boost/describe.hpp>

namespace ftk_transfer
{

/**
 * @brief Transfer record for a computed workout summary
 *
 * Field names are the named placeholders of the summary message template, so
 * generic code can pair each value with its label through Boost.Describe.
 */
struct SummaryRecord
{
  std::string training_type;
  double duration{std::numeric_limits<double>::quiet_NaN()};  // [h]
  double distance{std::numeric_limits<double>::quiet_NaN()};  // [km]
  double speed{std::numeric_limits<double>::quiet_NaN()};     // [km/h]
  double calories{std::numeric_limits<double>::quiet_NaN()};  // [kcal]
};

BOOST_DESCRIBE_STRUCT(SummaryRecord,
                      (),
                      (training_type, duration, distance, speed, calories));

}  // namespace ftk_transfer

#endif  // FTK_TRANSFER_SUMMARY_RECORD_HPP
