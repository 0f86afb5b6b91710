#pragma once
#include <string>
#include "types.hpp"

// One CSV line (no trailing newline), fields in channel order.
std::string formatCsvRow(const CalibratedVector& values);
std::string formatCsvRow(const SampleVector& values);
