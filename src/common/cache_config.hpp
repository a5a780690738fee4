#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace kvcache {

// ── CacheConfig ───────────────────────────────────────────────────────────────
// Resolved settings for one cache backend.
// Populated by parse_config() from CLI arguments, or filled in by a host.

struct CacheConfig {
    std::string backend   = "ini";   // "ini", "txt" or "rocksdb"
    std::string base_dir  = ".";     // Host base directory; relative paths resolve here
    std::string path;                // Cache file / directory; empty = default_path(backend)
    std::string log_level = "info";  // spdlog level string
};

// Default location of each backend's data, relative to the base directory.
//   ini     → data/cache/cache.ini
//   txt     → data/cache/cache.txt
//   rocksdb → data/cache/rocksdb
// Throws std::runtime_error for an unknown backend.
[[nodiscard]] std::filesystem::path default_path(std::string_view backend);

// Absolute or base-relative location of the backend's data: `path` (or the
// backend default) resolved against `base_dir`, lexically normalised.
[[nodiscard]] std::filesystem::path resolve_path(const CacheConfig& cfg);

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a CacheConfig.
//
// On success: returns a fully validated CacheConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - backend is one of ini | txt | rocksdb
//   - base_dir is not empty

[[nodiscard]] CacheConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with cache options.
// Exposed so hosts and tools can merge them into their own description.

void add_options(boost::program_options::options_description& desc);

// Fill a CacheConfig from an already parsed variables_map and validate it.
[[nodiscard]] CacheConfig config_from_variables(
    const boost::program_options::variables_map& vm);

} // namespace kvcache
