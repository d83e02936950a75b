#include "cache/cache_config.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

namespace deepclone::cache {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<size_t> parse_cache_setting(std::string_view value) {
    std::string lower(trim(value));
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "off" || lower == "full") {
        return 0;
    }
    if (lower == "limited") {
        return kDefaultLimitedCapacity;
    }

    size_t capacity = 0;
    const char* begin = lower.data();
    const char* end = begin + lower.size();
    auto [ptr, ec] = std::from_chars(begin, end, capacity);
    if (lower.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return capacity;
}

CacheConfig load_cache_config() {
    CacheConfig config;

    const char* env = std::getenv("DEEPCLONE_PLAN_CACHE");
    if (!env) {
        return config;
    }

    if (auto capacity = parse_cache_setting(env)) {
        config.limited_capacity = *capacity;
        DEEPCLONE_LOG_DEBUG("cache", "DEEPCLONE_PLAN_CACHE=" << env << " selects the "
                                                              << (*capacity > 0 ? "limited" : "full")
                                                              << " tier");
    } else {
        DEEPCLONE_LOG_WARN("cache", "Ignoring unrecognized DEEPCLONE_PLAN_CACHE value '"
                                        << env << "', keeping limited capacity "
                                        << config.limited_capacity);
    }
    return config;
}

} // namespace deepclone::cache
