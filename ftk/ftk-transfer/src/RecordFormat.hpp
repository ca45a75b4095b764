#ifndef FTK_TRANSFER_RECORD_FORMAT_HPP
#define FTK_TRANSFER_RECORD_FORMAT_HPP

#include <iterator>
#include <string>
#include <type_traits>

#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <fmt/format.h>

namespace ftk_transfer
{

/**
 * @brief Render a described record as space-separated name=value pairs
 *
 * Members are visited in declaration order. Floating-point members are
 * printed fixed-point with 3 fractional digits, everything else with its
 * default fmt representation.
 *
 * Example (SummaryRecord):
 *   training_type=Running duration=1.000 distance=9.750 speed=9.750
 *   calories=699.750
 */
template <
  typename T,
  typename Members =
    boost::describe::describe_members<T, boost::describe::mod_public>>
std::string formatRecordFields(const T& record)
{
  std::string out;
  boost::mp11::mp_for_each<Members>(
    [&](auto member)
    {
      if (!out.empty())
      {
        out += ' ';
      }
      const auto& value = record.*member.pointer;
      if constexpr (std::is_floating_point_v<
                      std::remove_cvref_t<decltype(value)>>)
      {
        fmt::format_to(std::back_inserter(out), "{}={:.3f}", member.name, value);
      }
      else
      {
        fmt::format_to(std::back_inserter(out), "{}={}", member.name, value);
      }
    });
  return out;
}

}  // namespace ftk_transfer

#endif  // FTK_TRANSFER_RECORD_FORMAT_HPP
