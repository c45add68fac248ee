#include <gtest/gtest.h>

#include <rangeio/errors.hpp>
#include <rangeio/seekable_stream.hpp>

#include "../support/fake_range_client.hpp"

#include <algorithm>
#include <memory>
#include <vector>

using namespace rangeio;
using rangeio::test::FakeRangeClient;
using rangeio::test::MakePattern;
using rangeio::test::PatternByte;

namespace {

StreamOptions Options(std::uint32_t window_size, std::uint64_t cache_bytes = 0) {
    StreamOptions o;
    o.window_size = window_size;
    o.max_cache_bytes = cache_bytes;
    return o;
}

} // namespace

TEST(SeekableStreamTest, ProbingConstructorReadsLength) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(1234));
    SeekableStream stream(client, Options(100));

    EXPECT_EQ(stream.Length(), 1234u);
    EXPECT_EQ(client->probe_calls, 1);
    EXPECT_TRUE(client->fetches.empty());
}

TEST(SeekableStreamTest, KnownLengthSkipsProbe) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(50));
    SeekableStream stream(client, 50, Options(16));

    EXPECT_EQ(client->probe_calls, 0);
    EXPECT_EQ(stream.Length(), 50u);
    EXPECT_EQ(stream.WindowSize(), 16u);
}

TEST(SeekableStreamTest, DefaultWindowSizeIsHalfMebibyte) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(10));
    SeekableStream stream(client, 10);
    EXPECT_EQ(stream.WindowSize(), 524288u);
    EXPECT_EQ(stream.MaxCacheEntries(), 0u);
}

TEST(SeekableStreamTest, RangesNotSupportedFailsConstructionWithoutGets) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    client->probe_response().headers.erase("accept-ranges");

    EXPECT_THROW(SeekableStream(client, Options(10)), RangesNotSupportedError);
    EXPECT_EQ(client->probe_calls, 1);
    EXPECT_TRUE(client->fetches.empty());
}

TEST(SeekableStreamTest, SingleByteReadFetchesOnlyItsWindow) {
    const std::uint64_t length = 1500000;
    auto client = std::make_shared<FakeRangeClient>(MakePattern(length));
    SeekableStream stream(client, length, Options(524288));

    stream.Seek(1000000);
    auto b = stream.ReadByte();

    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, PatternByte(1000000));
    ASSERT_EQ(client->fetches.size(), 1u);
    EXPECT_EQ(client->fetches[0].start, 524288u);
    EXPECT_EQ(client->fetches[0].end, 1048575u);
    EXPECT_EQ(stream.Stats().bytes_downloaded, 524288u);
    EXPECT_EQ(stream.Tell(), 1000001);
}

TEST(SeekableStreamTest, EveryByteMatchesSequentialContent) {
    const std::uint64_t length = 1000;
    auto client = std::make_shared<FakeRangeClient>(MakePattern(length));
    SeekableStream stream(client, length, Options(64));

    // Visit offsets out of order to force window switches in both directions.
    std::vector<std::int64_t> offsets;
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(length); ++i) {
        offsets.push_back((i * 389) % static_cast<std::int64_t>(length));
    }
    for (auto pos : offsets) {
        stream.Seek(pos);
        auto b = stream.ReadByte();
        ASSERT_TRUE(b.has_value()) << pos;
        ASSERT_EQ(*b, PatternByte(static_cast<std::uint64_t>(pos))) << pos;
    }
}

TEST(SeekableStreamTest, SequentialByteReadsDrainTheStream) {
    const std::uint64_t length = 100;
    auto client = std::make_shared<FakeRangeClient>(MakePattern(length));
    SeekableStream stream(client, length, Options(30));

    Bytes out;
    while (auto b = stream.ReadByte()) {
        out.push_back(*b);
    }
    EXPECT_EQ(out, client->data());
    EXPECT_EQ(client->fetches.size(), 4u);
    EXPECT_EQ(stream.Tell(), 100);
}

TEST(SeekableStreamTest, ReadIntoNeverCrossesWindowBoundary) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(10));

    std::vector<std::uint8_t> buf(50, 0);
    stream.Seek(7);
    EXPECT_EQ(stream.ReadInto(buf, 0, 20), 3);
    EXPECT_EQ(stream.Tell(), 10);
    EXPECT_EQ(stream.ReadInto(buf, 3, 20), 10);
    EXPECT_EQ(stream.Tell(), 20);

    for (int i = 0; i < 13; ++i) {
        EXPECT_EQ(buf[i], PatternByte(7 + i)) << i;
    }
    EXPECT_EQ(buf[13], 0);
}

TEST(SeekableStreamTest, ReadIntoClampsAtEndOfResource) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(25));
    SeekableStream stream(client, 25, Options(10));

    std::vector<std::uint8_t> buf(10);
    stream.Seek(22);
    EXPECT_EQ(stream.ReadInto(buf, 0, 10), 3);
    EXPECT_EQ(client->fetches.back().end, 24u);
    EXPECT_EQ(stream.Tell(), 25);
    EXPECT_EQ(stream.ReadInto(buf, 0, 10), kEndOfStream);
}

TEST(SeekableStreamTest, ReadIntoBoundsViolations) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(10));

    std::vector<std::uint8_t> buf(10);
    EXPECT_THROW(stream.ReadInto(buf, 5, 8), BoundsError);
    EXPECT_THROW(stream.ReadInto(buf, -1, 2), BoundsError);
    EXPECT_THROW(stream.ReadInto(buf, 0, -2), BoundsError);
    EXPECT_EQ(stream.Tell(), 0);
    EXPECT_TRUE(client->fetches.empty());

    EXPECT_EQ(stream.ReadInto(buf, 5, 5), 5);
}

TEST(SeekableStreamTest, ZeroLengthReadDoesNotFetch) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(10));

    std::vector<std::uint8_t> buf(4);
    EXPECT_EQ(stream.ReadInto(buf, 0, 0), 0);
    EXPECT_TRUE(client->fetches.empty());
}

TEST(SeekableStreamTest, EndOfStreamSignals) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(40));
    SeekableStream stream(client, 40, Options(16));

    stream.Seek(40);
    EXPECT_FALSE(stream.ReadByte().has_value());
    std::vector<std::uint8_t> buf(8);
    EXPECT_EQ(stream.ReadInto(buf, 0, 8), kEndOfStream);
    EXPECT_EQ(stream.Tell(), 40);
    EXPECT_TRUE(client->fetches.empty());
}

TEST(SeekableStreamTest, EmptyResourceIsImmediatelyAtEnd) {
    auto client = std::make_shared<FakeRangeClient>(Bytes{});
    SeekableStream stream(client, Options(16));

    EXPECT_EQ(stream.Length(), 0u);
    EXPECT_FALSE(stream.ReadByte().has_value());
    EXPECT_TRUE(client->fetches.empty());
}

TEST(SeekableStreamTest, SeeksAreLazy) {
    const std::uint64_t length = 1500000;
    auto client = std::make_shared<FakeRangeClient>(MakePattern(length));
    SeekableStream stream(client, length, Options(524288));

    stream.Seek(100000);
    stream.Seek(600000);
    EXPECT_TRUE(client->fetches.empty());

    auto b = stream.ReadByte();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, PatternByte(600000));
    ASSERT_EQ(client->fetches.size(), 1u);
    EXPECT_EQ(client->fetches[0].start, 524288u);
}

TEST(SeekableStreamTest, SeekWithinLoadedWindowReusesIt) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(20));

    ASSERT_TRUE(stream.ReadByte().has_value());
    stream.Seek(15);
    EXPECT_EQ(*stream.ReadByte(), PatternByte(15));
    stream.Seek(3);
    EXPECT_EQ(*stream.ReadByte(), PatternByte(3));
    EXPECT_EQ(client->fetches.size(), 1u);
}

TEST(SeekableStreamTest, NegativeSeekThrowsAndKeepsCursor) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(20));

    stream.Seek(42);
    EXPECT_THROW(stream.Seek(-1), BoundsError);
    EXPECT_EQ(stream.Tell(), 42);
    EXPECT_EQ(*stream.ReadByte(), PatternByte(42));
}

TEST(SeekableStreamTest, SeekPastEndReadsAsEndOfStream) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(10));

    EXPECT_NO_THROW(stream.Seek(101));
    EXPECT_FALSE(stream.ReadByte().has_value());

    EXPECT_NO_THROW(stream.Seek(150));
    EXPECT_EQ(stream.Tell(), 100);
    std::vector<std::uint8_t> buf(4);
    EXPECT_EQ(stream.ReadInto(buf, 0, 4), kEndOfStream);
    EXPECT_TRUE(client->fetches.empty());

    stream.Seek(99);
    EXPECT_EQ(*stream.ReadByte(), PatternByte(99));
}

TEST(SeekableStreamTest, ReadFullyLoopsAcrossWindows) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(16));

    std::vector<std::uint8_t> buf(40);
    stream.Seek(10);
    stream.ReadFully(buf, 0, 40);

    for (int i = 0; i < 40; ++i) {
        ASSERT_EQ(buf[i], PatternByte(10 + i)) << i;
    }
    EXPECT_EQ(stream.Tell(), 50);
    EXPECT_EQ(client->fetches.size(), 4u); // windows 0..3
}

TEST(SeekableStreamTest, ReadFullyPastEndThrows) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(30));
    SeekableStream stream(client, 30, Options(16));

    std::vector<std::uint8_t> buf(20);
    stream.Seek(20);
    EXPECT_THROW(stream.ReadFully(buf, 0, 20), EndOfStreamError);
}

TEST(SeekableStreamTest, SkipBytesIsClampedAndFetchFree) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(16));

    EXPECT_EQ(stream.SkipBytes(30), 30);
    EXPECT_EQ(stream.SkipBytes(500), 70);
    EXPECT_EQ(stream.Tell(), 100);
    EXPECT_THROW(stream.SkipBytes(-1), BoundsError);
    EXPECT_TRUE(client->fetches.empty());
}

TEST(SeekableStreamTest, CachedReadsInOneWindowDownloadOnce) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(1000));
    SeekableStream stream(client, 1000, Options(100, 400));
    ASSERT_EQ(stream.MaxCacheEntries(), 4u);

    // Bounce between two windows so window 2 is re-resolved each time.
    const std::int64_t in_window[] = {250, 210, 299, 200, 233};
    for (auto pos : in_window) {
        stream.Seek(pos);
        EXPECT_EQ(*stream.ReadByte(), PatternByte(pos));
        stream.Seek(950);
        EXPECT_EQ(*stream.ReadByte(), PatternByte(950));
    }

    auto stats = stream.Stats();
    EXPECT_EQ(stats.downloads, 2u);
    EXPECT_EQ(stats.cache_hits, 8u);
    EXPECT_EQ(client->fetches.size(), 2u);
}

TEST(SeekableStreamTest, CacheBudgetBelowOneWindowDisablesCache) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(64, 63));
    EXPECT_EQ(stream.MaxCacheEntries(), 0u);
}

TEST(SeekableStreamTest, SharedCacheServesSecondStream) {
    auto data = MakePattern(500);
    auto cache = std::make_shared<LruWindowCache>(8);
    auto a_client = std::make_shared<FakeRangeClient>(data, "mem://shared");
    auto b_client = std::make_shared<FakeRangeClient>(data, "mem://shared");

    SeekableStream a(a_client, 500, Options(100), cache);
    SeekableStream b(b_client, 500, Options(100), cache);

    a.Seek(321);
    EXPECT_EQ(*a.ReadByte(), PatternByte(321));
    b.Seek(399);
    EXPECT_EQ(*b.ReadByte(), PatternByte(399));

    EXPECT_EQ(a_client->fetches.size(), 1u);
    EXPECT_TRUE(b_client->fetches.empty());
    EXPECT_EQ(b.Stats().cache_hits, 1u);
    EXPECT_EQ(b.MaxCacheEntries(), 8u);
}

TEST(SeekableStreamTest, SharedCacheKeepsResourcesApart) {
    auto cache = std::make_shared<LruWindowCache>(8);
    auto a_client = std::make_shared<FakeRangeClient>(MakePattern(100), "mem://a");
    Bytes other(100, 0xEE);
    auto b_client = std::make_shared<FakeRangeClient>(other, "mem://b");

    SeekableStream a(a_client, 100, Options(50), cache);
    SeekableStream b(b_client, 100, Options(50), cache);

    EXPECT_EQ(*a.ReadByte(), PatternByte(0));
    EXPECT_EQ(*b.ReadByte(), 0xEE);
    EXPECT_EQ(b_client->fetches.size(), 1u);
}

TEST(SeekableStreamTest, TransportErrorPropagatesAndReadIsRetryable) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(10));

    client->fail_next_fetches = 1;
    stream.Seek(44);
    try {
        stream.ReadByte();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.status(), 503);
    }
    EXPECT_EQ(stream.Tell(), 44);

    EXPECT_EQ(*stream.ReadByte(), PatternByte(44));
    EXPECT_EQ(client->fetches.size(), 2u);
}

TEST(SeekableStreamTest, CloseIsIdempotentAndTerminal) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(100));
    SeekableStream stream(client, 100, Options(10));
    ASSERT_TRUE(stream.ReadByte().has_value());

    stream.Close();
    EXPECT_NO_THROW(stream.Close());
    EXPECT_TRUE(stream.IsClosed());
    EXPECT_EQ(client.use_count(), 1);

    EXPECT_EQ(stream.Length(), 100u);
    EXPECT_EQ(stream.Stats().downloads, 1u);

    std::vector<std::uint8_t> buf(4);
    EXPECT_THROW(stream.ReadByte(), StreamClosedError);
    EXPECT_THROW(stream.ReadInto(buf, 0, 4), StreamClosedError);
    EXPECT_THROW(stream.Seek(0), StreamClosedError);
}

TEST(SeekableStreamTest, RejectsInvalidConstruction) {
    auto client = std::make_shared<FakeRangeClient>(MakePattern(10));
    EXPECT_THROW(SeekableStream(nullptr, 10, Options(4)), std::invalid_argument);
    EXPECT_THROW(SeekableStream(client, 10, Options(0)), std::invalid_argument);
    EXPECT_THROW(SeekableStream(client, Options(0)), std::invalid_argument);
    EXPECT_EQ(client->probe_calls, 0);
}
