#ifndef FTK_TRANSFER_RECORDS_HPP
#define FTK_TRANSFER_RECORDS_HPP

// Convenience header including all transfer records

#include "ftk-transfer/src/RecordFormat.hpp"
#include "ftk-transfer/src/SummaryRecord.hpp"

#endif  // FTK_TRANSFER_RECORDS_HPP
