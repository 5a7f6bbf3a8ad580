// =============================================================================
// chipscan - Common Type Helpers
// =============================================================================

#include "chipscan/common/types.h"

#include <algorithm>

namespace chipscan {

std::string normalizeAllele(std::string_view allele) {
    std::string result(allele);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return toUpperBase(c); });
    return result;
}

std::string complementAllele(std::string_view allele) {
    std::string result(allele);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return complementBase(c); });
    return result;
}

}  // namespace chipscan
