// d2m/cpp/include/d2m/quality.h
#pragma once
#include "d2m/document.h"

namespace d2m {

constexpr double kWarningPenalty = 0.05;
constexpr double kErrorPenalty = 0.2;
constexpr double kScannedNoOcrScore = 0.3;
constexpr double kScannedWithOcrScore = 0.6;

// clamp(1 - 0.05*warnings - 0.2*errors, 0, 1); scanned documents get a fixed score.
double quality_score(const Diagnostics& d);

} // namespace d2m
