#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace kvcache {

// ── Whole-file helpers ───────────────────────────────────────────────────────
//
// Both helpers use plain POSIX I/O and retry on EINTR.

// Read the whole file at `path` into `out` (replacing its contents).
// A missing file is reported as std::errc::no_such_file_or_directory so
// callers can tell it apart from real I/O failures.
[[nodiscard]] std::error_code read_file(const std::filesystem::path& path,
                                        std::string& out);

// Replace the file at `path` with `data`.
// Writes to `<path>.tmp`, fsyncs, then renames over `path`; on failure the
// temporary file is removed and the previous contents stay in place.
[[nodiscard]] std::error_code write_file_atomic(
    const std::filesystem::path& path, std::string_view data);

} // namespace kvcache
