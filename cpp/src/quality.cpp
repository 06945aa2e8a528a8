#include "d2m/quality.h"

#include <algorithm>

namespace d2m {

double quality_score(const Diagnostics& d) {
    if (d.special_case) {
        switch (*d.special_case) {
            case SpecialCase::ScannedNoOcr:   return kScannedNoOcrScore;
            case SpecialCase::ScannedWithOcr: return kScannedWithOcrScore;
        }
    }

    const double s = 1.0
                   - kWarningPenalty * (double)d.warnings.size()
                   - kErrorPenalty * (double)d.errors.size();
    return std::clamp(s, 0.0, 1.0);
}

} // namespace d2m
