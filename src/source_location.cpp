#include "protocheck/source_location.h"
#include <sstream>

namespace protocheck {

std::string SourceLocation::toString() const {
    std::ostringstream oss;
    if (!file_.empty()) {
        oss << file_ << ":";
    }
    oss << line_ << ":" << column_;
    return oss.str();
}

} // namespace protocheck
