//! # Plan Cache Configuration
//!
//! The plan cache reads its initial tier selection from the
//! `DEEPCLONE_PLAN_CACHE` environment variable:
//!
//! | Value               | Effect                                      |
//! |---------------------|---------------------------------------------|
//! | unset               | Limited tier, capacity 100                  |
//! | `off`, `full`, `0`  | Full (unbounded) tier                       |
//! | `limited`           | Limited tier, capacity 100                  |
//! | positive integer N  | Limited tier, capacity N                    |
//!
//! Anything else keeps the default and logs a warning.

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace deepclone::cache {

inline constexpr size_t kDefaultLimitedCapacity = 100;

struct CacheConfig {
    /// Limited tier capacity. Zero selects the Full tier.
    size_t limited_capacity = kDefaultLimitedCapacity;
};

/// Parses a `DEEPCLONE_PLAN_CACHE` value into a limited tier capacity.
/// Returns nullopt when the value is not recognized.
std::optional<size_t> parse_cache_setting(std::string_view value);

/// Builds the configuration from the environment.
CacheConfig load_cache_config();

} // namespace deepclone::cache
