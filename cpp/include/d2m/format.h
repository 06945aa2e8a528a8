// d2m/cpp/include/d2m/format.h
#pragma once

#include <filesystem>
#include <string>

namespace d2m {

std::string utc_now_iso();

bool write_file_atomic(const std::filesystem::path& fin, const std::string& content);

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

} // namespace d2m
