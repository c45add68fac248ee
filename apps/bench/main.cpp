#include "rangeio/errors.hpp"
#include "rangeio/http_range_client.hpp"
#include "rangeio/s3_range_client.hpp"
#include "rangeio/seekable_stream.hpp"
#include "rangeio/settings.hpp"
#include "rangeio/window_cache.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

struct BenchConfig {
    std::string url;
    std::string s3_bucket;
    std::string s3_key;
    int num_threads = 1;
    int num_reads = 1000;
    int read_size = 4096;
    std::uint32_t window_size = rangeio::kDefaultWindowSize;
    std::uint64_t cache_bytes = 0;
    bool shared_cache = false;
};

struct Stats {
    std::atomic<std::uint64_t> reads{0};
    std::atomic<std::uint64_t> bytes_read{0};
    std::atomic<std::uint64_t> downloads{0};
    std::atomic<std::uint64_t> cache_hits{0};
    std::atomic<std::uint64_t> bytes_downloaded{0};
    std::atomic<int> failures{0};
};

std::shared_ptr<rangeio::RangeClient> make_client(const BenchConfig& cfg) {
    if (!cfg.s3_bucket.empty()) {
        rangeio::S3ClientConfig s3;
        s3.bucket = cfg.s3_bucket;
        s3.key = cfg.s3_key;
        return std::make_shared<rangeio::S3RangeClient>(s3);
    }
    rangeio::HttpClientConfig http;
    http.url = cfg.url;
    return std::make_shared<rangeio::HttpRangeClient>(http);
}

void worker_thread(const BenchConfig& cfg,
                   std::shared_ptr<rangeio::WindowCache> cache,
                   Stats& stats,
                   int thread_id) {
    try {
        rangeio::StreamOptions options;
        options.window_size = cfg.window_size;
        options.max_cache_bytes = cfg.cache_bytes;
        rangeio::SeekableStream stream(make_client(cfg), options, cache);

        const auto length = static_cast<std::int64_t>(stream.Length());
        if (length == 0) {
            return;
        }

        std::mt19937_64 rng(thread_id);
        std::uniform_int_distribution<std::int64_t> pos_dist(0, length - 1);
        std::vector<std::uint8_t> buffer(cfg.read_size);

        for (int i = 0; i < cfg.num_reads / cfg.num_threads; ++i) {
            stream.Seek(pos_dist(rng));
            std::int64_t n = stream.ReadInto(buffer, 0, static_cast<std::int64_t>(buffer.size()));
            stats.reads++;
            if (n > 0) {
                stats.bytes_read += static_cast<std::uint64_t>(n);
            }
        }

        auto s = stream.Stats();
        stats.downloads += s.downloads;
        stats.cache_hits += s.cache_hits;
        stats.bytes_downloaded += s.bytes_downloaded;
        stream.Close();
    } catch (const std::exception& e) {
        spdlog::error("thread {}: {}", thread_id, e.what());
        stats.failures++;
    }
}

int main(int argc, char** argv) {
    // RANGEIO_WINDOW_SIZE / RANGEIO_MAX_CACHE_BYTES seed the flag defaults.
    rangeio::StreamOptions env_options;
    try {
        env_options = rangeio::StreamOptionsFromEnv();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    cxxopts::Options options("rangebench", "Random-access read benchmark for rangeio streams");
    options.add_options()
        ("u,url", "HTTP(S) URL of the resource", cxxopts::value<std::string>()->default_value(""))
        ("bucket", "S3 bucket (uses S3 instead of --url)", cxxopts::value<std::string>()->default_value(""))
        ("key", "S3 object key", cxxopts::value<std::string>()->default_value(""))
        ("t,threads", "Number of streams read concurrently", cxxopts::value<int>()->default_value("1"))
        ("n,reads", "Total number of reads", cxxopts::value<int>()->default_value("1000"))
        ("r,read-size", "Bytes requested per read", cxxopts::value<int>()->default_value("4096"))
        ("w,window-size", "Window size in bytes", cxxopts::value<std::uint32_t>()->default_value(std::to_string(env_options.window_size)))
        ("c,cache-bytes", "Window cache budget in bytes (0 disables)", cxxopts::value<std::uint64_t>()->default_value(std::to_string(env_options.max_cache_bytes)))
        ("s,shared-cache", "Share one window cache between all streams")
        ("v,verbose", "Log every fetch")
        ("h,help", "Print usage");

    BenchConfig cfg;
    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        cfg.url = result["url"].as<std::string>();
        cfg.s3_bucket = result["bucket"].as<std::string>();
        cfg.s3_key = result["key"].as<std::string>();
        cfg.num_threads = result["threads"].as<int>();
        cfg.num_reads = result["reads"].as<int>();
        cfg.read_size = result["read-size"].as<int>();
        cfg.window_size = result["window-size"].as<std::uint32_t>();
        cfg.cache_bytes = result["cache-bytes"].as<std::uint64_t>();
        cfg.shared_cache = result.count("shared-cache") > 0;

        if (result.count("verbose")) {
            spdlog::set_level(spdlog::level::trace);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    if (cfg.url.empty() && (cfg.s3_bucket.empty() || cfg.s3_key.empty())) {
        std::cerr << "either --url or --bucket and --key are required" << std::endl;
        return 2;
    }
    if (cfg.num_threads < 1 || cfg.read_size < 1 || cfg.window_size == 0) {
        std::cerr << "threads, read-size and window-size must be positive" << std::endl;
        return 2;
    }

    std::cout << "--- Benchmark Configuration ---" << std::endl;
    std::cout << "Resource: " << (cfg.url.empty() ? "s3://" + cfg.s3_bucket + "/" + cfg.s3_key : cfg.url) << std::endl;
    std::cout << "Streams: " << cfg.num_threads << std::endl;
    std::cout << "Total reads: " << cfg.num_reads << std::endl;
    std::cout << "Read size: " << cfg.read_size << std::endl;
    std::cout << "Window size: " << cfg.window_size << std::endl;
    std::cout << "Cache bytes: " << cfg.cache_bytes << (cfg.shared_cache ? " (shared)" : "") << std::endl;
    std::cout << "-----------------------------" << std::endl;

    std::shared_ptr<rangeio::WindowCache> cache;
    if (cfg.shared_cache && cfg.cache_bytes / cfg.window_size > 0) {
        cache = std::make_shared<rangeio::LruWindowCache>(cfg.cache_bytes / cfg.window_size);
    }

    Stats stats;
    std::vector<std::thread> threads;

    auto start_time = std::chrono::steady_clock::now();
    for (int i = 0; i < cfg.num_threads; ++i) {
        threads.emplace_back(worker_thread, std::cref(cfg), cache, std::ref(stats), i);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end_time = std::chrono::steady_clock::now();
    double total_duration_s = std::chrono::duration<double>(end_time - start_time).count();

    const double fetches = static_cast<double>(stats.downloads.load() + stats.cache_hits.load());
    double hit_rate = fetches > 0 ? stats.cache_hits.load() / fetches * 100.0 : 0.0;
    double reads_per_sec = total_duration_s > 0 ? stats.reads.load() / total_duration_s : 0.0;

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Total duration: " << total_duration_s << " s" << std::endl;
    std::cout << "Reads per second: " << reads_per_sec << std::endl;
    std::cout << "Bytes read: " << stats.bytes_read.load() << std::endl;
    std::cout << "Window downloads: " << stats.downloads.load() << std::endl;
    std::cout << "Bytes downloaded: " << stats.bytes_downloaded.load() << std::endl;
    std::cout << "Cache hit rate: " << hit_rate << " %" << std::endl;
    std::cout << "Failed streams: " << stats.failures.load() << std::endl;
    std::cout << "-----------------------------" << std::endl;

    return stats.failures > 0 ? 1 : 0;
}
