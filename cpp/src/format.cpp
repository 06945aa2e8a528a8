// d2m/cpp/src/format.cpp
#include "d2m/format.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace d2m {

std::string utc_now_iso() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool write_file_atomic(const std::filesystem::path& fin, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(fin.parent_path(), ec);

    std::filesystem::path tmp = fin;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary);
        if (!out) {
            std::cerr << "[d2m] cannot open " << tmp << "\n";
            return false;
        }
        out.write(content.data(), (std::streamsize)content.size());
        out.flush();
        if (!out) {
            std::cerr << "[d2m] write failed " << tmp << "\n";
            return false;
        }
    }
    return atomic_replace_file_best_effort(tmp, fin);
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::cerr << "[d2m] atomic_replace failed: " << ec.message()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[d2m] atomic_replace exception: " << e.what()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    }
}

} // namespace d2m
