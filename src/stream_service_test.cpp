#include "stream_service.hpp"
#include "testing/mock_object_store.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <unistd.h>

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using namespace mediacache;
using mediacache::mocks::MockObjectStore;
using mediacache::mocks::makeRecord;
namespace fs = std::filesystem;

namespace {

std::string pattern(std::size_t size) {
    std::string content(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>('a' + i % 26);
    }
    return content;
}

}

// Fixture wiring the full stack over a configurable store
class StreamServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        cache_dir = fs::temp_directory_path() /
                    ("mediacache_stream_test_" + std::to_string(getpid()) + "_" + info->name());
        fs::remove_all(cache_dir);
    }

    void TearDown() override {
        service.reset();
        chunks.reset();
        metadata.reset();
        manager.reset();
        fs::remove_all(cache_dir);
    }

    void build(std::shared_ptr<IObjectStore> store, const StreamOptions& options = StreamOptions{}) {
        // Dependents first; the caches hold references into the manager
        service.reset();
        chunks.reset();
        metadata.reset();
        manager.reset();

        manager = std::make_unique<ConnectionManager>([store]() { return store; });
        metadata = std::make_unique<MetadataCache>(*manager);
        chunks = std::make_unique<ChunkCache>(cache_dir, 1024 * 1024);
        service = std::make_unique<StreamService>(*manager, *metadata, *chunks, options);
    }

    std::shared_ptr<DummyObjectStore> buildWithDummy(const StreamOptions& options = StreamOptions{}) {
        auto store = std::make_shared<DummyObjectStore>();
        build(store, options);
        return store;
    }

    std::shared_ptr<NiceMock<MockObjectStore>> buildWithMock(std::uint64_t object_size,
                                                              const StreamOptions& options = StreamOptions{}) {
        auto store = std::make_shared<NiceMock<MockObjectStore>>();
        ON_CALL(*store, fetchMetadata("movie.mp4")).WillByDefault(Return(makeRecord("movie.mp4", object_size)));
        build(store, options);
        return store;
    }

    static StreamOptions smallStreamingOptions() {
        StreamOptions options;
        options.full_buffer_threshold_bytes = 100;
        options.streaming_chunk_bytes = 30;
        return options;
    }

    fs::path cache_dir;
    std::unique_ptr<ConnectionManager> manager;
    std::unique_ptr<MetadataCache> metadata;
    std::unique_ptr<ChunkCache> chunks;
    std::unique_ptr<StreamService> service;
};

TEST_F(StreamServiceTest, RangeBeyondEndIsClampedToObject) {
    auto store = buildWithDummy();
    const std::string content = pattern(1000);
    store->setMockData("movie.mp4", content);

    StreamResponse response = service->serve("movie.mp4", std::string("bytes=0-1023"));

    EXPECT_EQ(response.status, 206);
    EXPECT_EQ(response.headers["Content-Range"], "bytes 0-999/1000");
    EXPECT_EQ(response.headers["Content-Length"], "1000");
    EXPECT_EQ(response.headers["X-Cache"], "MISS");
    EXPECT_EQ(response.readBody(), content);
}

TEST_F(StreamServiceTest, OpenEndedRange) {
    auto store = buildWithDummy();
    const std::string content = pattern(2000);
    store->setMockData("movie.mp4", content);

    StreamResponse response = service->serve("movie.mp4", std::string("bytes=500-"));

    EXPECT_EQ(response.status, 206);
    EXPECT_EQ(response.headers["Content-Range"], "bytes 500-1999/2000");
    EXPECT_EQ(response.readBody(), content.substr(500));
}

TEST_F(StreamServiceTest, SecondRequestIsServedFromChunkCache) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 100, 199)).Times(1).WillOnce(Return(std::string(100, 'x')));

    StreamResponse first = service->serve("movie.mp4", std::string("bytes=100-199"));
    StreamResponse second = service->serve("movie.mp4", std::string("bytes=100-199"));

    EXPECT_EQ(first.headers["X-Cache"], "MISS");
    EXPECT_EQ(second.headers["X-Cache"], "HIT");
    EXPECT_EQ(second.headers["Content-Range"], "bytes 100-199/1000");
    EXPECT_EQ(first.readBody(), second.readBody());
    EXPECT_EQ(chunks->stats().hits, 1u);
}

TEST_F(StreamServiceTest, CommonHeaders) {
    auto store = buildWithDummy();
    store->setMockData("clip.webm", pattern(10), "video/webm");

    StreamResponse response = service->serve("clip.webm", std::string("bytes=0-4"));

    EXPECT_EQ(response.headers["Content-Type"], "video/webm");
    EXPECT_EQ(response.headers["Accept-Ranges"], "bytes");
    EXPECT_EQ(response.headers["Cache-Control"], "public, max-age=3600");
    EXPECT_EQ(response.headers["ETag"], "\"clip.webm-1\"");
}

TEST_F(StreamServiceTest, MissingContentTypeDefaultsToMp4) {
    auto store = buildWithMock(10);
    ON_CALL(*store, fetchMetadata("movie.mp4")).WillByDefault(Return(makeRecord("movie.mp4", 10, "")));
    ON_CALL(*store, fetchFull("movie.mp4")).WillByDefault(Return(pattern(10)));

    StreamResponse response = service->serve("movie.mp4", std::nullopt);
    EXPECT_EQ(response.headers["Content-Type"], "video/mp4");
}

TEST_F(StreamServiceTest, MissingObjectIsNotFound) {
    buildWithDummy();
    EXPECT_THROW(service->serve("missing.mp4", std::string("bytes=0-10")), NotFoundError);
    EXPECT_THROW(service->head("missing.mp4"), NotFoundError);
}

TEST_F(StreamServiceTest, MalformedRangeFallsBackToWholeObject) {
    auto store = buildWithDummy();
    const std::string content = pattern(300);
    store->setMockData("movie.mp4", content);

    StreamResponse response = service->serve("movie.mp4", std::string("bytes=-500"));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers.count("Content-Range"), 0u);
    EXPECT_EQ(response.readBody(), content);
}

TEST_F(StreamServiceTest, SmallWholeObjectIsBuffered) {
    auto store = buildWithDummy(smallStreamingOptions());
    const std::string content = pattern(99);
    store->setMockData("movie.mp4", content);

    StreamResponse response = service->serve("movie.mp4", std::nullopt);

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers["Content-Length"], "99");
    EXPECT_NE(dynamic_cast<BufferedBody*>(response.body.get()), nullptr);
    EXPECT_EQ(response.readBody(), content);
    // Whole-object reads never populate the chunk cache
    EXPECT_EQ(chunks->stats().items, 0u);
}

TEST_F(StreamServiceTest, EmptyObjectServedAsEmptyBody) {
    auto store = buildWithDummy();
    store->setMockData("empty.mp4", "");

    StreamResponse response = service->serve("empty.mp4", std::string("bytes=0-100"));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers["Content-Length"], "0");
    EXPECT_EQ(response.readBody(), "");
}

TEST_F(StreamServiceTest, LargeWholeObjectIsStreamedInChunks) {
    auto store = buildWithDummy(smallStreamingOptions());
    const std::string content = pattern(250);
    store->setMockData("movie.mp4", content);

    StreamResponse response = service->serve("movie.mp4", std::nullopt);

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers["Content-Length"], "250");
    auto* stream = dynamic_cast<ChunkedObjectStream*>(response.body.get());
    ASSERT_NE(stream, nullptr);

    std::vector<std::string> pieces;
    while (auto piece = stream->next()) {
        pieces.push_back(*piece);
    }
    ASSERT_EQ(pieces.size(), 9u);  // 8 x 30 + 10
    EXPECT_EQ(pieces.front().size(), 30u);
    EXPECT_EQ(pieces.back().size(), 10u);

    std::string joined;
    for (const auto& piece : pieces) {
        joined += piece;
    }
    EXPECT_EQ(joined, content);
    EXPECT_EQ(stream->position(), 250u);
    EXPECT_EQ(chunks->stats().items, 0u);
}

TEST_F(StreamServiceTest, StreamFetchesLazilyAndStopsOnCancel) {
    auto store = buildWithMock(250, smallStreamingOptions());
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 29)).Times(1).WillOnce(Return(std::string(30, 'a')));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 30, 59)).Times(0);

    StreamResponse response = service->serve("movie.mp4", std::nullopt);
    ASSERT_NE(response.body, nullptr);

    auto first = response.body->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), 30u);

    response.body->cancel();
    EXPECT_FALSE(response.body->next().has_value());
}

TEST_F(StreamServiceTest, StreamDiscardsChunkWhenCancelledDuringFetch) {
    auto store = buildWithMock(250, smallStreamingOptions());
    StreamResponse response = service->serve("movie.mp4", std::nullopt);
    BodyProducer* body = response.body.get();

    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 29))
        .WillOnce(Invoke([body](const std::string&, std::uint64_t, std::uint64_t) {
            body->cancel();
            return std::string(30, 'a');
        }));

    EXPECT_FALSE(body->next().has_value());
    EXPECT_EQ(static_cast<ChunkedObjectStream*>(body)->position(), 0u);
}

TEST_F(StreamServiceTest, StreamEndsEarlyOnEmptyChunk) {
    auto store = buildWithMock(250, smallStreamingOptions());
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 29)).WillOnce(Return(std::string(30, 'a')));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 30, 59)).WillOnce(Return(std::string()));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 60, 89)).Times(0);

    StreamResponse response = service->serve("movie.mp4", std::nullopt);
    EXPECT_EQ(response.readBody(), std::string(30, 'a'));
    EXPECT_FALSE(response.body->next().has_value());
}

TEST_F(StreamServiceTest, StreamTrimsOversizedChunk) {
    auto store = buildWithMock(40, smallStreamingOptions());
    StreamOptions options = smallStreamingOptions();
    options.full_buffer_threshold_bytes = 40;
    build(store, options);

    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 29)).WillOnce(Return(std::string(31, 'a')));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 30, 39)).WillOnce(Return(std::string(10, 'b')));

    StreamResponse response = service->serve("movie.mp4", std::nullopt);
    EXPECT_EQ(response.readBody(), std::string(30, 'a') + std::string(10, 'b'));
}

TEST_F(StreamServiceTest, OneExtraByteIsTrimmed) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 99)).WillOnce(Return(std::string(101, 'x')));

    StreamResponse response = service->serve("movie.mp4", std::string("bytes=0-99"));

    EXPECT_EQ(response.headers["Content-Range"], "bytes 0-99/1000");
    EXPECT_EQ(response.headers["Content-Length"], "100");
    EXPECT_EQ(response.readBody().size(), 100u);
    EXPECT_EQ(chunks->lookup("movie.mp4", 0, 99)->size_bytes, 100u);
}

TEST_F(StreamServiceTest, OneMissingByteAdjustsEnd) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 99)).WillOnce(Return(std::string(99, 'x')));

    StreamResponse response = service->serve("movie.mp4", std::string("bytes=0-99"));
    EXPECT_EQ(response.headers["Content-Range"], "bytes 0-98/1000");
    EXPECT_EQ(response.headers["Content-Length"], "99");

    // The cached window keeps the adjusted length
    StreamResponse cached = service->serve("movie.mp4", std::string("bytes=0-99"));
    EXPECT_EQ(cached.headers["X-Cache"], "HIT");
    EXPECT_EQ(cached.headers["Content-Range"], "bytes 0-98/1000");
}

TEST_F(StreamServiceTest, LargerLengthMismatchIsAnError) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 99))
        .WillOnce(Return(std::string(98, 'x')))
        .WillOnce(Return(std::string(102, 'x')));

    EXPECT_THROW(service->serve("movie.mp4", std::string("bytes=0-99")), ContentLengthMismatchError);
    EXPECT_THROW(service->serve("movie.mp4", std::string("bytes=0-99")), ContentLengthMismatchError);
    EXPECT_EQ(chunks->stats().items, 0u);
}

TEST_F(StreamServiceTest, EmptyRangeReadIsShortRead) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 0)).WillOnce(Return(std::string()));

    EXPECT_THROW(service->serve("movie.mp4", std::string("bytes=0-0")), ShortReadError);
    EXPECT_EQ(chunks->stats().items, 0u);
}

TEST_F(StreamServiceTest, ObjectDeletedDuringRangeFetchInvalidatesCaches) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 9))
        .WillOnce(Return(std::string(10, 'x')));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 10, 19))
        .WillOnce(Throw(RemoteError(RemoteErrorKind::kNotFound, "movie.mp4", "no such object")));

    service->serve("movie.mp4", std::string("bytes=0-9"));
    ASSERT_EQ(chunks->stats().items, 1u);
    ASSERT_EQ(metadata->stats().size, 1u);

    EXPECT_THROW(service->serve("movie.mp4", std::string("bytes=10-19")), NotFoundError);
    EXPECT_EQ(chunks->stats().items, 0u);
    EXPECT_EQ(metadata->stats().size, 0u);
}

TEST_F(StreamServiceTest, ObjectDeletedBeforeWholeObjectReadIsNotFound) {
    auto store = buildWithDummy();
    store->setMockData("movie.mp4", pattern(50));

    EXPECT_EQ(service->serve("movie.mp4", std::nullopt).readBody(), pattern(50));
    ASSERT_EQ(metadata->stats().size, 1u);

    store->remove("movie.mp4");

    EXPECT_THROW(service->serve("movie.mp4", std::nullopt), NotFoundError);
    EXPECT_EQ(metadata->stats().size, 0u);
    // Metadata is refetched and the object is now absent
    EXPECT_THROW(service->serve("movie.mp4", std::nullopt), NotFoundError);
    EXPECT_EQ(metadata->stats().size, 0u);
}

TEST_F(StreamServiceTest, ObjectDeletedWhileStreamingIsNotFound) {
    auto store = buildWithMock(250, smallStreamingOptions());
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 29)).WillOnce(Return(std::string(30, 'a')));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 30, 59))
        .WillOnce(Throw(RemoteError(RemoteErrorKind::kNotFound, "movie.mp4", "no such object")));
    EXPECT_CALL(*store, fetchRange("movie.mp4", 60, 89)).Times(0);

    StreamResponse response = service->serve("movie.mp4", std::nullopt);
    ASSERT_EQ(metadata->stats().size, 1u);

    ASSERT_TRUE(response.body->next().has_value());
    EXPECT_THROW(response.body->next(), NotFoundError);
    EXPECT_EQ(metadata->stats().size, 0u);
    EXPECT_FALSE(response.body->next().has_value());
}

TEST_F(StreamServiceTest, TransientRangeFailureIsUnavailable) {
    auto store = buildWithMock(1000);
    EXPECT_CALL(*store, fetchRange("movie.mp4", 0, 9))
        .WillOnce(Throw(RemoteError(RemoteErrorKind::kTransient, "movie.mp4", "timeout")));

    EXPECT_THROW(service->serve("movie.mp4", std::string("bytes=0-9")), RemoteUnavailableError);
}

TEST_F(StreamServiceTest, HeadReturnsHeadersOnly) {
    auto store = buildWithDummy();
    store->setMockData("movie.mp4", pattern(1234));

    StreamResponse response = service->head("movie.mp4");

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers["Content-Length"], "1234");
    EXPECT_EQ(response.headers["Accept-Ranges"], "bytes");
    EXPECT_EQ(response.body, nullptr);
}

TEST_F(StreamServiceTest, UploadInvalidatesCachedData) {
    auto store = buildWithDummy();
    store->setMockData("movie.mp4", std::string(100, 'a'));

    EXPECT_EQ(service->serve("movie.mp4", std::string("bytes=0-9")).readBody(), std::string(10, 'a'));

    service->upload("movie.mp4", std::string(200, 'b'), "video/mp4");

    StreamResponse response = service->serve("movie.mp4", std::string("bytes=0-9"));
    EXPECT_EQ(response.headers["X-Cache"], "MISS");
    EXPECT_EQ(response.headers["Content-Range"], "bytes 0-9/200");
    EXPECT_EQ(response.readBody(), std::string(10, 'b'));
}

TEST_F(StreamServiceTest, OutOfBandChangeVisibleAfterOnObjectChanged) {
    auto store = buildWithDummy();
    store->setMockData("movie.mp4", std::string(100, 'a'));
    service->serve("movie.mp4", std::string("bytes=0-9"));

    store->setMockData("movie.mp4", std::string(50, 'c'));
    // Still served from cache until told otherwise
    EXPECT_EQ(service->serve("movie.mp4", std::string("bytes=0-9")).headers["X-Cache"], "HIT");

    service->onObjectChanged("movie.mp4");
    StreamResponse response = service->serve("movie.mp4", std::string("bytes=0-9"));
    EXPECT_EQ(response.headers["Content-Range"], "bytes 0-9/50");
    EXPECT_EQ(response.readBody(), std::string(10, 'c'));
}

TEST_F(StreamServiceTest, RemoveDeletesAndInvalidates) {
    auto store = buildWithDummy();
    store->setMockData("movie.mp4", pattern(100));
    service->serve("movie.mp4", std::string("bytes=0-9"));

    service->remove("movie.mp4");

    EXPECT_FALSE(store->exists("movie.mp4"));
    EXPECT_EQ(chunks->stats().items, 0u);
    EXPECT_THROW(service->serve("movie.mp4", std::string("bytes=0-9")), NotFoundError);
    EXPECT_THROW(service->remove("movie.mp4"), NotFoundError);
}

TEST_F(StreamServiceTest, HealthReportsHealthyStore) {
    auto store = buildWithDummy();
    store->setMockData("movie.mp4", pattern(100));
    service->serve("movie.mp4", std::string("bytes=0-9"));

    StreamService::HealthReport report = service->health();

    EXPECT_TRUE(report.healthy);
    EXPECT_TRUE(report.error.empty());
    EXPECT_TRUE(report.connection.connected);
    EXPECT_EQ(report.connection.location, "dummy");
    EXPECT_EQ(report.metadata.size, 1u);
    EXPECT_EQ(report.chunks.items, 1u);
}

TEST_F(StreamServiceTest, HealthReportsFailureWithoutThrowing) {
    auto store = buildWithMock(100);
    EXPECT_CALL(*store, ping()).WillOnce(Throw(RemoteError(RemoteErrorKind::kTransient, "", "unavailable")));

    StreamService::HealthReport report;
    ASSERT_NO_THROW(report = service->health());
    EXPECT_FALSE(report.healthy);
    EXPECT_FALSE(report.error.empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
