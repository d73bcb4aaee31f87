#include "types/SaveCandidate.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>

namespace rs::types {

std::string to_string(const SaveCandidate& candidate) {
    return fmt::format("{} ~ {}", candidate.device, util::timestampToString(candidate.last_modified));
}

}
