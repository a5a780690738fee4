#pragma once

#include "cache/cache.hpp"
#include "common/cache_config.hpp"

#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <spdlog/spdlog.h>

namespace kvcache {

// Construct the backend selected by `cfg.backend`, storing its data at
// resolve_path(cfg).  File-backed backends schedule their flushes on
// `executor`.  The returned cache is not started yet.
// Throws std::runtime_error for an unknown backend.
[[nodiscard]] std::unique_ptr<Cache> make_cache(
    const CacheConfig& cfg,
    boost::asio::any_io_executor executor,
    std::shared_ptr<spdlog::logger> logger = {});

} // namespace kvcache
