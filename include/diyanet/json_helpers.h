#pragma once

#include <string>
#include <vector>
#include "diyanet/data_structures.h"

namespace diyanet {

// Extract states from a GetRegList?ChangeType=country response
bool extract_state_list(const std::string& json_str, const Country& country, std::vector<State>& states);

// Extract regions from a GetRegList?ChangeType=state response
bool extract_region_list(const std::string& json_str, const State& state, std::vector<Region>& regions);

} // namespace diyanet
