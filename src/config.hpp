#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediacache {

/**
 * MediaCacheConfig - Configuration options for mediacache
 *
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file (--config)
 * 3. Environment variables (MEDIACACHE_*)
 * 4. Command-line arguments (highest priority)
 */
struct MediaCacheConfig {
    // Remote store
    std::string bucket_name;
    std::string project_id;
    std::string credentials_file;  // empty = application default credentials
    int remote_timeout_seconds = 30;
    bool enable_dummy_store = false;
    std::string dummy_data_dir;  // seeds the dummy store; implies enable_dummy_store

    // Chunk cache
    std::string chunk_cache_dir = "/tmp/video_cache";
    std::uint64_t chunk_cache_budget_bytes = 1000ULL * 1024 * 1024;

    // Metadata cache
    std::uint64_t metadata_cache_capacity = 1000;

    // Range and streaming limits
    std::uint64_t max_unbounded_range_bytes = 20ULL * 1024 * 1024;
    std::uint64_t max_range_chunk_bytes = 10ULL * 1024 * 1024;
    std::uint64_t full_buffer_threshold_bytes = 50ULL * 1024 * 1024;
    std::uint64_t streaming_chunk_bytes = 2ULL * 1024 * 1024;

    // Logging settings
    bool debug_mode = false;
    bool verbose_logging = false;

    // Command to run and its arguments (positional)
    std::string command;
    std::vector<std::string> command_args;

    /**
     * Load configuration from all sources in priority order
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed and validated configuration
     * @throws std::runtime_error if arguments are missing or invalid
     */
    static MediaCacheConfig load(int argc, char* argv[]);

    /**
     * Apply command-line overrides to an existing config
     *
     * @throws std::runtime_error on unknown options or bad values
     */
    void parseFromArgs(int argc, char* argv[]);

    /**
     * Load configuration from YAML file
     *
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);

    /**
     * Load configuration from environment variables
     * Recognizes: MEDIACACHE_* variables
     */
    void loadFromEnv();

    void loadDefaults();

    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    static void printUsage(const char* program_name);

private:
    // Extract --config flag from arguments before full parsing
    static std::optional<std::string> extractConfigPath(int argc, char* argv[]);
};

} // namespace mediacache
