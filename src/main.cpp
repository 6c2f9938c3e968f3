// mediacache command-line entry point

#include "chunk_cache.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "gcs/gcs_client.hpp"
#include "metadata_cache.hpp"
#include "stream_service.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

using namespace mediacache;

namespace {

ConnectionManager::ClientFactory makeFactory(const MediaCacheConfig& config)
{
    if (config.enable_dummy_store) {
        std::cout << "Using in-memory dummy store" << std::endl;
        auto store = std::make_shared<DummyObjectStore>();
        if (!config.dummy_data_dir.empty()) {
            std::size_t loaded = store->loadDirectory(config.dummy_data_dir);
            std::cout << "Loaded " << loaded << " objects from " << config.dummy_data_dir << std::endl;
        }
        return [store]() { return store; };
    }

    GCSConnectionSettings settings;
    settings.project_id = config.project_id;
    settings.credentials_file = config.credentials_file;
    settings.timeout = std::chrono::seconds(config.remote_timeout_seconds);

    return [bucket = config.bucket_name, settings, debug = config.debug_mode]() {
        return makeGCSObjectStore(bucket, settings, debug);
    };
}

void printHeaders(const StreamResponse& response)
{
    std::cerr << "HTTP " << response.status << "\n";
    for (const auto& [name, value] : response.headers) {
        std::cerr << name << ": " << value << "\n";
    }
    std::cerr.flush();
}

int runGet(StreamService& service, const MediaCacheConfig& config, std::ostream& body_out)
{
    if (config.command_args.empty()) {
        throw std::runtime_error("get requires an object name");
    }
    std::optional<std::string> range;
    if (config.command_args.size() > 1) {
        range = config.command_args[1];
    }

    StreamResponse response = service.serve(config.command_args[0], range);
    printHeaders(response);
    while (auto piece = response.body->next()) {
        body_out.write(piece->data(), static_cast<std::streamsize>(piece->size()));
        if (!body_out) {
            // Reader went away
            response.body->cancel();
            return 1;
        }
    }
    body_out.flush();
    return 0;
}

int runHead(StreamService& service, const MediaCacheConfig& config)
{
    if (config.command_args.empty()) {
        throw std::runtime_error("head requires an object name");
    }
    StreamResponse response = service.head(config.command_args[0]);
    printHeaders(response);
    return 0;
}

int runStats(const ChunkCache& chunks, const MetadataCache& metadata)
{
    auto detailed = chunks.detailedStats();
    const auto& summary = detailed.summary;
    auto meta = metadata.stats();

    std::cout << std::fixed << std::setprecision(1);
    std::cout << "Chunk cache: " << summary.cache_dir << "\n";
    std::cout << "  entries:     " << summary.items << "\n";
    std::cout << "  bytes used:  " << summary.bytes_used << " / " << summary.budget_bytes
              << " (" << summary.utilization() << "%)\n";
    std::cout << "  hit rate:    " << summary.hitRate() * 100.0 << "% ("
              << summary.hits << " hits, " << summary.misses << " misses)\n";
    std::cout << "Metadata cache:\n";
    std::cout << "  entries:     " << meta.size << " / " << meta.capacity << "\n";
    std::cout << "  hit rate:    " << meta.hitRate() * 100.0 << "%\n";

    if (!detailed.top_entries.empty()) {
        const auto now = std::chrono::system_clock::now();
        auto secondsSince = [&now](std::chrono::system_clock::time_point tp) {
            return std::chrono::duration_cast<std::chrono::seconds>(now - tp).count();
        };

        std::cout << "Top chunks:\n";
        for (const auto& entry : detailed.top_entries) {
            std::cout << "  " << entry.key.substr(0, 16) << "... " << entry.object_id
                      << " [" << entry.start << "-" << entry.end << "] "
                      << entry.size_bytes << " bytes, " << entry.hit_count << " hits, age "
                      << secondsSince(entry.created_at) << "s, idle "
                      << secondsSince(entry.last_access_at) << "s\n";
        }
    }
    return 0;
}

int runHealth(StreamService& service)
{
    auto report = service.health();
    std::cout << "status:     " << (report.healthy ? "healthy" : "unhealthy") << "\n";
    if (!report.error.empty()) {
        std::cout << "error:      " << report.error << "\n";
    }
    std::cout << "location:   " << report.connection.location << "\n";
    std::cout << "handles:    " << report.connection.handles_created
              << " created, " << report.connection.resets << " resets\n";
    std::cout << "chunks:     " << report.chunks.items << " entries, "
              << report.chunks.bytes_used << " bytes\n";
    std::cout << "metadata:   " << report.metadata.size << " entries\n";
    return report.healthy ? 0 : 1;
}

}

int main(int argc, char *argv[])
{
    try {
        MediaCacheConfig config = MediaCacheConfig::load(argc, argv);
        if (config.command.empty()) {
            MediaCacheConfig::printUsage(argv[0]);
            return 1;
        }

        // Object bytes own stdout during get; log output moves to stderr
        std::ostream body_out(std::cout.rdbuf());
        if (config.command == "get") {
            std::cout.rdbuf(std::cerr.rdbuf());
        }

        ConnectionManager connection(makeFactory(config), config.debug_mode);
        MetadataCache metadata(connection, config.metadata_cache_capacity, config.debug_mode);
        ChunkCache chunks(config.chunk_cache_dir, config.chunk_cache_budget_bytes,
                          config.debug_mode, config.verbose_logging);

        StreamOptions options;
        options.range_limits.max_unbounded_range_bytes = config.max_unbounded_range_bytes;
        options.range_limits.max_range_chunk_bytes = config.max_range_chunk_bytes;
        options.full_buffer_threshold_bytes = config.full_buffer_threshold_bytes;
        options.streaming_chunk_bytes = config.streaming_chunk_bytes;
        StreamService service(connection, metadata, chunks, options, config.debug_mode, config.verbose_logging);

        if (config.command == "get") {
            return runGet(service, config, body_out);
        }
        if (config.command == "head") {
            return runHead(service, config);
        }
        if (config.command == "stats") {
            return runStats(chunks, metadata);
        }
        if (config.command == "health") {
            return runHealth(service);
        }
        if (config.command == "clear") {
            chunks.clear();
            return 0;
        }
        throw std::runtime_error("Unknown command: " + config.command);
    } catch (const NotFoundError& e) {
        std::cerr << "HTTP 404\n" << e.what() << std::endl;
        return 2;
    } catch (const RemoteUnavailableError& e) {
        std::cerr << "HTTP 503\n" << e.what() << std::endl;
        return 3;
    } catch (const MediaCacheError& e) {
        std::cerr << "HTTP 500\n" << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
