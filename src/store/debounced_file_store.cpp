#include "store/debounced_file_store.hpp"

#include "common/file_io.hpp"

#include <stdexcept>
#include <system_error>

namespace kvcache::store {

DebouncedFileStore::DebouncedFileStore(std::filesystem::path path,
                                       std::unique_ptr<StoreCodec> codec,
                                       std::unique_ptr<Scheduler> scheduler,
                                       std::shared_ptr<spdlog::logger> logger,
                                       std::chrono::milliseconds flush_delay)
    : path_(std::move(path))
    , codec_(std::move(codec))
    , scheduler_(std::move(scheduler))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
    , flush_delay_(flush_delay)
{
    if (!codec_ || !scheduler_) {
        throw std::invalid_argument("DebouncedFileStore needs a codec and a scheduler");
    }
}

void DebouncedFileStore::load() {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            logger_->warn("failed to read cache file: cannot create {}: {}",
                          path_.parent_path().string(), ec.message());
            return;
        }
    }

    std::string data;
    if (auto ec = read_file(path_, data)) {
        if (ec != std::errc::no_such_file_or_directory) {
            logger_->warn("failed to read cache file {}: {}",
                          path_.string(), ec.message());
        }
        return;
    }
    if (data.empty()) {
        return;
    }

    store_ = codec_->decode(data, *logger_);
    logger_->debug("loaded {} table(s) from {} ({})",
                   store_.size(), path_.string(), codec_->name());
}

Table& DebouncedFileStore::table(const std::string& name) {
    return store_.get_or_create(name);
}

bool DebouncedFileStore::erase_table(const std::string& name) {
    return store_.erase(name);
}

void DebouncedFileStore::mark_dirty() {
    scheduler_->schedule(flush_delay_, [this] { flush(); });
}

bool DebouncedFileStore::flush() {
    ++flush_count_;
    const auto text = codec_->encode(store_);
    if (auto ec = write_file_atomic(path_, text)) {
        logger_->warn("failed to write cache file {}: {}",
                      path_.string(), ec.message());
        return false;
    }
    logger_->debug("flushed {} table(s) to {} ({} bytes)",
                   store_.size(), path_.string(), text.size());
    return true;
}

void DebouncedFileStore::shutdown() {
    if (scheduler_->cancel()) {
        flush();
    }
}

} // namespace kvcache::store
