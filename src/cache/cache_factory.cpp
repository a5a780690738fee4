#include "cache/cache_factory.hpp"

#include "cache/file_cache.hpp"
#include "cache/rocksdb_cache.hpp"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace kvcache {

std::unique_ptr<Cache> make_cache(const CacheConfig& cfg,
                                  boost::asio::any_io_executor executor,
                                  std::shared_ptr<spdlog::logger> logger)
{
    const auto path = resolve_path(cfg);
    if (cfg.backend == "ini") {
        return make_ini_cache(path, std::move(executor), std::move(logger));
    }
    if (cfg.backend == "txt") {
        return make_text_cache(path, std::move(executor), std::move(logger));
    }
    if (cfg.backend == "rocksdb") {
        return std::make_unique<RocksDBCache>(path, std::move(logger));
    }
    throw std::runtime_error(fmt::format("Unknown cache backend '{}'", cfg.backend));
}

} // namespace kvcache
