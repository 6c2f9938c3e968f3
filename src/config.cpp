#include "config.hpp"
#include <getopt.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace mediacache {

namespace {

    enum LongOption {
        kOptConfig = 256,
        kOptBucket,
        kOptProject,
        kOptCredentials,
        kOptTimeout,
        kOptDummyStore,
        kOptDummyData,
        kOptCacheDir,
        kOptCacheBudget,
        kOptMetadataCapacity,
        kOptMaxUnboundedRange,
        kOptMaxRangeChunk,
        kOptFullBufferThreshold,
        kOptStreamingChunk,
    };

    bool parseBool(const std::string& value) {
        return value == "true" || value == "1" || value == "yes" || value == "on";
    }

    std::uint64_t parseUnsigned(const std::string& name, const std::string& value) {
        if (value.empty() || value[0] == '-') {
            throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
        }
        try {
            std::size_t consumed = 0;
            unsigned long long parsed = std::stoull(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
        }
    }

    int parseInt(const std::string& name, const std::string& value) {
        try {
            std::size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid value for " + name + ": '" + value + "'");
        }
    }

    template <typename T>
    void readKey(const YAML::Node& root, const char* key, T& target) {
        if (root[key]) {
            target = root[key].as<T>();
        }
    }

}

void MediaCacheConfig::loadDefaults() {
    *this = MediaCacheConfig{};
}

bool MediaCacheConfig::loadFromYAML(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (root.IsNull()) {
            return true;  // empty file
        }
        if (!root.IsMap()) {
            throw std::runtime_error("Config file " + config_path + " must contain a mapping of keys to values");
        }

        readKey(root, "bucket_name", bucket_name);
        readKey(root, "project_id", project_id);
        readKey(root, "credentials_file", credentials_file);
        readKey(root, "remote_timeout_seconds", remote_timeout_seconds);
        readKey(root, "enable_dummy_store", enable_dummy_store);
        readKey(root, "dummy_data_dir", dummy_data_dir);
        readKey(root, "chunk_cache_dir", chunk_cache_dir);
        readKey(root, "chunk_cache_budget_bytes", chunk_cache_budget_bytes);
        readKey(root, "metadata_cache_capacity", metadata_cache_capacity);
        readKey(root, "max_unbounded_range_bytes", max_unbounded_range_bytes);
        readKey(root, "max_range_chunk_bytes", max_range_chunk_bytes);
        readKey(root, "full_buffer_threshold_bytes", full_buffer_threshold_bytes);
        readKey(root, "streaming_chunk_bytes", streaming_chunk_bytes);
        readKey(root, "debug", debug_mode);
        readKey(root, "verbose", verbose_logging);
        // Unknown keys are ignored
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + config_path + ": " + e.what());
    }

    return true;
}

void MediaCacheConfig::loadFromEnv() {
    if (const char* value = std::getenv("MEDIACACHE_BUCKET")) {
        bucket_name = value;
    }
    if (const char* value = std::getenv("MEDIACACHE_PROJECT_ID")) {
        project_id = value;
    }
    if (const char* value = std::getenv("MEDIACACHE_CREDENTIALS_FILE")) {
        credentials_file = value;
    }
    if (const char* value = std::getenv("MEDIACACHE_REMOTE_TIMEOUT")) {
        remote_timeout_seconds = parseInt("MEDIACACHE_REMOTE_TIMEOUT", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_DUMMY_STORE")) {
        enable_dummy_store = parseBool(value);
    }
    if (const char* value = std::getenv("MEDIACACHE_DUMMY_DATA")) {
        dummy_data_dir = value;
    }
    if (const char* value = std::getenv("MEDIACACHE_CACHE_DIR")) {
        chunk_cache_dir = value;
    }
    if (const char* value = std::getenv("MEDIACACHE_CACHE_BUDGET_BYTES")) {
        chunk_cache_budget_bytes = parseUnsigned("MEDIACACHE_CACHE_BUDGET_BYTES", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_METADATA_CAPACITY")) {
        metadata_cache_capacity = parseUnsigned("MEDIACACHE_METADATA_CAPACITY", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_MAX_UNBOUNDED_RANGE_BYTES")) {
        max_unbounded_range_bytes = parseUnsigned("MEDIACACHE_MAX_UNBOUNDED_RANGE_BYTES", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_MAX_RANGE_CHUNK_BYTES")) {
        max_range_chunk_bytes = parseUnsigned("MEDIACACHE_MAX_RANGE_CHUNK_BYTES", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_FULL_BUFFER_THRESHOLD_BYTES")) {
        full_buffer_threshold_bytes = parseUnsigned("MEDIACACHE_FULL_BUFFER_THRESHOLD_BYTES", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_STREAMING_CHUNK_BYTES")) {
        streaming_chunk_bytes = parseUnsigned("MEDIACACHE_STREAMING_CHUNK_BYTES", value);
    }
    if (const char* value = std::getenv("MEDIACACHE_DEBUG")) {
        debug_mode = parseBool(value);
    }
    if (const char* value = std::getenv("MEDIACACHE_VERBOSE")) {
        verbose_logging = parseBool(value);
    }
}

void MediaCacheConfig::parseFromArgs(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",                required_argument, 0, kOptConfig},
        {"bucket",                required_argument, 0, kOptBucket},
        {"project",               required_argument, 0, kOptProject},
        {"credentials",           required_argument, 0, kOptCredentials},
        {"timeout",               required_argument, 0, kOptTimeout},
        {"dummy-store",           no_argument,       0, kOptDummyStore},
        {"dummy-data",            required_argument, 0, kOptDummyData},
        {"cache-dir",             required_argument, 0, kOptCacheDir},
        {"cache-budget",          required_argument, 0, kOptCacheBudget},
        {"metadata-capacity",     required_argument, 0, kOptMetadataCapacity},
        {"max-unbounded-range",   required_argument, 0, kOptMaxUnboundedRange},
        {"max-range-chunk",       required_argument, 0, kOptMaxRangeChunk},
        {"full-buffer-threshold", required_argument, 0, kOptFullBufferThreshold},
        {"streaming-chunk",       required_argument, 0, kOptStreamingChunk},
        {"debug",                 no_argument,       0, 'd'},
        {"verbose",               no_argument,       0, 'v'},
        {"help",                  no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 0 forces glibc to fully reinitialize getopt, including permutation state
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "dvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case kOptConfig:
                // Already applied by load()
                break;
            case kOptBucket:
                bucket_name = optarg;
                break;
            case kOptProject:
                project_id = optarg;
                break;
            case kOptCredentials:
                credentials_file = optarg;
                break;
            case kOptTimeout:
                remote_timeout_seconds = parseInt("--timeout", optarg);
                break;
            case kOptDummyStore:
                enable_dummy_store = true;
                break;
            case kOptDummyData:
                dummy_data_dir = optarg;
                break;
            case kOptCacheDir:
                chunk_cache_dir = optarg;
                break;
            case kOptCacheBudget:
                chunk_cache_budget_bytes = parseUnsigned("--cache-budget", optarg);
                break;
            case kOptMetadataCapacity:
                metadata_cache_capacity = parseUnsigned("--metadata-capacity", optarg);
                break;
            case kOptMaxUnboundedRange:
                max_unbounded_range_bytes = parseUnsigned("--max-unbounded-range", optarg);
                break;
            case kOptMaxRangeChunk:
                max_range_chunk_bytes = parseUnsigned("--max-range-chunk", optarg);
                break;
            case kOptFullBufferThreshold:
                full_buffer_threshold_bytes = parseUnsigned("--full-buffer-threshold", optarg);
                break;
            case kOptStreamingChunk:
                streaming_chunk_bytes = parseUnsigned("--streaming-chunk", optarg);
                break;
            case 'd':
                debug_mode = true;
                break;
            case 'v':
                verbose_logging = true;
                break;
            case 'h':
                printUsage(argv[0]);
                exit(0);
            case '?':
            default:
                throw std::runtime_error(std::string("Unknown or incomplete option: ") + argv[optind - 1]);
        }
    }

    // Positional arguments: command followed by its arguments
    if (optind < argc) {
        command = argv[optind++];
        command_args.clear();
    }
    while (optind < argc) {
        command_args.push_back(argv[optind++]);
    }
}

std::optional<std::string> MediaCacheConfig::extractConfigPath(int argc, char* argv[]) {
    const std::string flag = "--config";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == flag) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--config requires a path");
            }
            return std::string(argv[i + 1]);
        }
        if (arg.rfind(flag + "=", 0) == 0) {
            return arg.substr(flag.size() + 1);
        }
    }
    return std::nullopt;
}

MediaCacheConfig MediaCacheConfig::load(int argc, char* argv[]) {
    MediaCacheConfig config;
    config.loadDefaults();

    if (auto config_path = extractConfigPath(argc, argv)) {
        if (!config.loadFromYAML(*config_path)) {
            throw std::runtime_error("Config file not found: " + *config_path);
        }
    }

    config.loadFromEnv();
    config.parseFromArgs(argc, argv);
    if (!config.dummy_data_dir.empty()) {
        config.enable_dummy_store = true;
    }
    config.validate();
    return config;
}

void MediaCacheConfig::validate() const {
    if (bucket_name.empty() && !enable_dummy_store && dummy_data_dir.empty()) {
        throw std::runtime_error("Missing required setting: bucket_name (or enable the dummy store)");
    }
    if (!dummy_data_dir.empty() && !std::filesystem::is_directory(dummy_data_dir)) {
        throw std::runtime_error("dummy_data_dir is not a directory: " + dummy_data_dir);
    }
    if (chunk_cache_dir.empty()) {
        throw std::runtime_error("chunk_cache_dir must not be empty");
    }
    if (chunk_cache_budget_bytes == 0) {
        throw std::runtime_error("chunk_cache_budget_bytes must be greater than zero");
    }
    if (metadata_cache_capacity == 0) {
        throw std::runtime_error("metadata_cache_capacity must be greater than zero");
    }
    if (max_unbounded_range_bytes == 0 || max_range_chunk_bytes == 0) {
        throw std::runtime_error("Range limits must be greater than zero");
    }
    if (full_buffer_threshold_bytes == 0 || streaming_chunk_bytes == 0) {
        throw std::runtime_error("Streaming sizes must be greater than zero");
    }
    if (streaming_chunk_bytes > full_buffer_threshold_bytes) {
        throw std::runtime_error("streaming_chunk_bytes must not exceed full_buffer_threshold_bytes");
    }
    if (remote_timeout_seconds <= 0) {
        throw std::runtime_error("remote_timeout_seconds must be positive");
    }
}

void MediaCacheConfig::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  get <object> [range]         Write the object (or a range such as bytes=0-1023) to stdout\n";
    std::cout << "  head <object>                Print status and headers\n";
    std::cout << "  stats                        Print chunk and metadata cache statistics\n";
    std::cout << "  health                       Check connectivity to the remote store\n";
    std::cout << "  clear                        Empty the chunk cache\n\n";

    std::cout << "Remote store options:\n";
    std::cout << "  --bucket=NAME                GCS bucket holding the media objects\n";
    std::cout << "  --project=ID                 GCP project id\n";
    std::cout << "  --credentials=FILE           Service account key file (default: application default)\n";
    std::cout << "  --timeout=N                  Remote call timeout in seconds (default: 30)\n";
    std::cout << "  --dummy-store                Serve from an in-memory store instead of GCS\n";
    std::cout << "  --dummy-data=DIR             Seed the in-memory store with the files under DIR\n";
    std::cout << "                               (implies --dummy-store; otherwise it starts empty)\n\n";

    std::cout << "Cache options:\n";
    std::cout << "  --cache-dir=DIR              Chunk cache directory (default: /tmp/video_cache)\n";
    std::cout << "  --cache-budget=BYTES         Chunk cache size budget (default: 1000 MiB)\n";
    std::cout << "  --metadata-capacity=N        Metadata cache entries (default: 1000)\n";
    std::cout << "  --max-unbounded-range=BYTES  Window for open-ended ranges (default: 20 MiB)\n";
    std::cout << "  --max-range-chunk=BYTES      Largest range served at once (default: 10 MiB)\n";
    std::cout << "  --full-buffer-threshold=BYTES  Buffer whole objects below this size (default: 50 MiB)\n";
    std::cout << "  --streaming-chunk=BYTES      Chunk size when streaming large objects (default: 2 MiB)\n\n";

    std::cout << "General options:\n";
    std::cout << "  --config=FILE                YAML config file\n";
    std::cout << "  --debug, -d                  Enable debug logging\n";
    std::cout << "  --verbose, -v                Enable verbose output\n";
    std::cout << "  --help, -h                   Display this help message\n\n";

    std::cout << "Environment variables (MEDIACACHE_BUCKET, MEDIACACHE_CACHE_DIR, ...) override the\n";
    std::cout << "config file; command-line options override both.\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --bucket=my-videos get movie.mp4 bytes=0-1048575 > part.bin\n";
    std::cout << "  " << program_name << " --config=mediacache.yaml stats\n";
}

} // namespace mediacache
