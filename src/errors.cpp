#include "diyanet/errors.h"

namespace diyanet {

const char* to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::Country: return "country";
        case UnitKind::State:   return "state";
        case UnitKind::Region:  return "region";
    }
    return "unit";
}

NotFoundError::NotFoundError(UnitKind kind, const std::string& name)
    : Error(std::string("Unknown/unsupported ") + to_string(kind) + ": '" + name + "'"),
      kind_(kind), name_(name) {}

} // namespace diyanet
