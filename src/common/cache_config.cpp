#include "common/cache_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace kvcache {

namespace {

// Validate the fully populated CacheConfig.
void validate(const CacheConfig& cfg) {
    if (cfg.backend != "ini" && cfg.backend != "txt" && cfg.backend != "rocksdb") {
        throw std::runtime_error(
            fmt::format("--backend must be 'ini', 'txt' or 'rocksdb', got '{}'",
                        cfg.backend));
    }
    if (cfg.base_dir.empty()) {
        throw std::runtime_error("--base-dir must not be empty");
    }
}

} // anonymous namespace

// ── Paths ─────────────────────────────────────────────────────────────────────

std::filesystem::path default_path(std::string_view backend) {
    if (backend == "ini")     return "data/cache/cache.ini";
    if (backend == "txt")     return "data/cache/cache.txt";
    if (backend == "rocksdb") return "data/cache/rocksdb";
    throw std::runtime_error(fmt::format("Unknown cache backend '{}'", backend));
}

std::filesystem::path resolve_path(const CacheConfig& cfg) {
    const std::filesystem::path relative =
        cfg.path.empty() ? default_path(cfg.backend)
                         : std::filesystem::path{cfg.path};
    // operator/ keeps `relative` unchanged when it is absolute.
    return (std::filesystem::path{cfg.base_dir} / relative).lexically_normal();
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("backend",
            po::value<std::string>()->default_value("ini"),
            "Cache backend: ini | txt | rocksdb")
        ("base-dir",
            po::value<std::string>()->default_value("."),
            "Base directory that relative cache paths resolve against")
        ("path",
            po::value<std::string>()->default_value(""),
            "Cache file (ini, txt) or database directory (rocksdb); "
            "empty selects the backend default under data/cache/")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

CacheConfig config_from_variables(const po::variables_map& vm) {
    CacheConfig cfg;
    cfg.backend   = vm["backend"].as<std::string>();
    cfg.base_dir  = vm["base-dir"].as<std::string>();
    cfg.path      = vm["path"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

// ── parse_config ──────────────────────────────────────────────────────────────

CacheConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("kvcache options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    return config_from_variables(vm);
}

} // namespace kvcache
