// d2m/cpp/include/d2m/report.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "d2m/document.h"

namespace d2m {

struct FileReport {
    std::string source_file;
    std::optional<std::string> output_file; // null when failed
    bool success{false};
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    double quality_score{0.0};
    std::string converter_used;
    double conversion_time_ms{0.0};
};

struct BatchReport {
    std::string start_time;
    std::string end_time;
    uint64_t total{0};
    uint64_t successful{0};
    uint64_t failed{0};
    double average_quality_score{0.0};
    std::vector<FileReport> documents; // ordered by source_file
};

FileReport make_file_report(const Document& d);

// Failed documents count as 0.0 in the average.
BatchReport aggregate_report(const std::vector<Document>& docs,
                             const std::string& start_time,
                             const std::string& end_time);

nlohmann::json to_json(const FileReport& f);
nlohmann::json to_json(const BatchReport& r);

std::string format_report_text(const BatchReport& r);

} // namespace d2m
