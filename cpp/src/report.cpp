// d2m/cpp/src/report.cpp
#include "d2m/report.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace d2m {

FileReport make_file_report(const Document& d) {
    FileReport f;
    f.source_file = d.source_path;
    f.success = d.status == DocStatus::Resolved;
    if (f.success) f.output_file = d.output_path;
    f.warnings = d.diagnostics.warnings;
    f.errors = d.diagnostics.errors;
    if (d.cancelled) f.errors.push_back("cancelled");
    f.quality_score = f.success ? d.quality_score : 0.0;
    f.converter_used = d.converter;
    f.conversion_time_ms = d.conversion_time_ms;
    return f;
}

BatchReport aggregate_report(const std::vector<Document>& docs,
                             const std::string& start_time,
                             const std::string& end_time) {
    BatchReport r;
    r.start_time = start_time;
    r.end_time = end_time;

    r.documents.reserve(docs.size());
    for (const auto& d : docs) r.documents.push_back(make_file_report(d));

    std::stable_sort(r.documents.begin(), r.documents.end(),
                     [](const FileReport& a, const FileReport& b) { return a.source_file < b.source_file; });

    double sum = 0.0;
    for (const auto& f : r.documents) {
        ++r.total;
        if (f.success) ++r.successful;
        else ++r.failed;
        sum += f.quality_score;
    }
    r.average_quality_score = r.total ? sum / (double)r.total : 0.0;
    return r;
}

nlohmann::json to_json(const FileReport& f) {
    nlohmann::json e;
    e["source_file"] = f.source_file;
    if (f.output_file) e["output_file"] = *f.output_file;
    else e["output_file"] = nullptr;
    e["success"] = f.success;
    e["warnings"] = f.warnings;
    e["errors"] = f.errors;
    e["quality_score"] = f.quality_score;
    e["converter_used"] = f.converter_used;
    e["conversion_time_ms"] = f.conversion_time_ms;
    return e;
}

nlohmann::json to_json(const BatchReport& r) {
    nlohmann::json j;
    j["start_time"] = r.start_time;
    if (r.end_time.empty()) j["end_time"] = nullptr;
    else j["end_time"] = r.end_time;
    j["total_files"] = r.total;
    j["successful"] = r.successful;
    j["failed"] = r.failed;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : r.documents) arr.push_back(to_json(f));
    j["files"] = std::move(arr);

    j["average_quality_score"] = r.average_quality_score;
    return j;
}

std::string format_report_text(const BatchReport& r) {
    const std::string rule(80, '=');
    std::ostringstream os;
    os << std::fixed;

    os << rule << "\n"
       << "CONVERSION REPORT\n"
       << rule << "\n"
       << "Started:  " << r.start_time << "\n"
       << "Finished: " << (r.end_time.empty() ? std::string("In progress") : r.end_time) << "\n"
       << "\n"
       << "Total files:     " << r.total << "\n"
       << "Successful:      " << r.successful << "\n"
       << "Failed:          " << r.failed << "\n"
       << "Average quality: " << std::setprecision(2) << r.average_quality_score << "\n"
       << "\n"
       << rule << "\n"
       << "FILE DETAILS\n"
       << rule << "\n";

    for (const auto& f : r.documents) {
        os << "\n" << (f.success ? "SUCCESS" : "FAILED") << " - " << f.source_file << "\n";
        os << "  Output: " << f.output_file.value_or("N/A") << "\n";
        os << "  Quality: " << std::setprecision(2) << f.quality_score << "\n";
        os << "  Converter: " << f.converter_used << "\n";
        os << "  Time: " << std::setprecision(0) << f.conversion_time_ms << "ms\n";

        if (!f.warnings.empty()) {
            os << "  Warnings (" << f.warnings.size() << "):\n";
            for (const auto& w : f.warnings) os << "    - " << w << "\n";
        }
        if (!f.errors.empty()) {
            os << "  Errors (" << f.errors.size() << "):\n";
            for (const auto& e : f.errors) os << "    - " << e << "\n";
        }
    }

    os << "\n" << rule << "\n";
    return os.str();
}

} // namespace d2m
