// d2m/cpp/src/options.cpp
#include "d2m/options.h"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace d2m {

namespace {

bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

unsigned env_unsigned(const char* key, unsigned defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    char* end = nullptr;
    const unsigned long v = std::strtoul(s, &end, 10);
    if (end == s || *end != '\0' || v == 0 || v > 1024) {
        std::cerr << "[d2m] ignoring " << key << "=" << s << " (expected 1..1024)\n";
        return defv;
    }
    return (unsigned)v;
}

} // namespace

void apply_env_overrides(BatchOptions& opt) {
    opt.max_threads = env_unsigned("D2M_MAX_THREADS", opt.max_threads);
    opt.verbose = env_bool("D2M_VERBOSE", opt.verbose);
    opt.preserve_directories = env_bool("D2M_PRESERVE_DIRS", opt.preserve_directories);
}

} // namespace d2m
