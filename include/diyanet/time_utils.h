#pragma once

#include <string>
#include "diyanet/data_structures.h"

namespace diyanet {

// Parses "HH:MM" or "HH:MM:SS" (surrounding whitespace allowed, seconds dropped).
// Throws TimeFormatError on anything else, including out-of-range fields.
TimeOfDay parse_time_of_day(const std::string& text);

} // namespace diyanet
