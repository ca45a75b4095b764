#ifndef FTK_CORE_SUMMARY_SUMMARY_FORMATTER_HPP
#define FTK_CORE_SUMMARY_SUMMARY_FORMATTER_HPP

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ftk-core/src/Summary/Summary.hpp"

namespace ftk_core
{

/**
 * @brief Fixed message template for a workout summary
 *
 * Named fields: training_type, duration, distance, speed, calories. Every
 * numeric field is printed fixed-point with 3 fractional digits.
 */
inline constexpr std::string_view kSummaryMessageTemplate =
  "Тип тренировки: {training_type}; "
  "Длительность: {duration:.3f} ч.; "
  "Дистанция: {distance:.3f} км; "
  "Ср. скорость: {speed:.3f} км/ч; "
  "Потрачено ккал: {calories:.3f}.";

/**
 * @brief Render a summary into the fixed human-readable message
 *
 * Pure function; the caller decides where the message goes.
 *
 * Example:
 *   Тип тренировки: Running; Длительность: 1.000 ч.; Дистанция: 9.750 км;
 *   Ср. скорость: 9.750 км/ч; Потрачено ккал: 699.750.
 */
[[nodiscard]] std::string renderMessage(const Summary& summary);

}  // namespace ftk_core

/// Formats a Summary as its rendered message; no format specifier is accepted.
template <>
struct fmt::formatter<ftk_core::Summary>
{
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() && *it != '}')
    {
      throw fmt::format_error("invalid format specifier for ftk_core::Summary");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const ftk_core::Summary& summary, FormatContext& ctx) const
  {
    return fmt::format_to(ctx.out(), "{}", ftk_core::renderMessage(summary));
  }
};

#endif  // FTK_CORE_SUMMARY_SUMMARY_FORMATTER_HPP
