#include "temp_directory.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sig-vault/local_cache.hpp>
#include <sig-vault/time_utils.hpp>
#include <thread>

using namespace SigVault;

namespace
{
RemoteRef cloudRef(const std::string &path)
{
    RemoteRef ref;
    ref.kind = BackendKind::CLOUD;
    ref.backend_id = "https://cloud.example.org/remote.php/dav/files/alice/";
    ref.path = path;
    return ref;
}

CacheConfig cacheIn(const TempDirectory &dir, size_t max_size_mb = 64)
{
    CacheConfig config;
    config.directory = (dir.path() / "cache").string();
    config.max_size_mb = max_size_mb;
    return config;
}

// Writes `content` where a download of `ref` would land and records it
std::string store(LocalCache &cache,
                  const RemoteRef &ref,
                  const std::string &content,
                  std::optional<std::chrono::system_clock::time_point> modified_at = std::nullopt)
{
    std::string local_path = cache.allocateLocalPath(ref);
    TempDirectory::writeFile(local_path, content);
    REQUIRE(isSuccess(cache.recordCompletedDownload(ref, local_path, { content.size(), modified_at })));
    // Keeps fetched_at strictly increasing between records
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    return local_path;
}
} // namespace

TEST_CASE("LocalCache records survive a restart", "[cache][persist]")
{
    TempDirectory dir("cache-persist");
    auto modified = TimeUtils::fromEpochMillis(1717496100000LL);
    std::string local_path;

    {
        LocalCache cache(cacheIn(dir));
        REQUIRE(isSuccess(cache.initialize()));
        local_path = store(cache, cloudRef("Photos/IMG_0001.JPG"), "jpeg bytes", modified);
        REQUIRE(local_path.size() > 4);
        REQUIRE(local_path.substr(local_path.size() - 4) == ".jpg");
    }

    REQUIRE(std::filesystem::exists(dir.path() / "cache" / "index.json"));

    LocalCache reloaded(cacheIn(dir));
    REQUIRE(isSuccess(reloaded.initialize()));

    auto record = reloaded.lookup(cloudRef("Photos/IMG_0001.JPG"));
    REQUIRE(record.has_value());
    REQUIRE(record->local_path == local_path);
    REQUIRE(record->size_at_download == 10);
    REQUIRE(record->remote_modified_at == modified);
    REQUIRE_FALSE(record->stale);
    REQUIRE(reloaded.statistics().entry_count == 1);
}

TEST_CASE("LocalCache heals records whose file went missing", "[cache][heal]")
{
    TempDirectory dir("cache-heal");

    SECTION("On lookup")
    {
        LocalCache cache(cacheIn(dir));
        REQUIRE(isSuccess(cache.initialize()));
        std::string local_path = store(cache, cloudRef("a.jpg"), "aaaa");

        std::filesystem::remove(local_path);

        REQUIRE_FALSE(cache.lookup(cloudRef("a.jpg")).has_value());
        REQUIRE(cache.statistics().entry_count == 0);
        REQUIRE(cache.statistics().misses == 1);
    }

    SECTION("On load")
    {
        std::string local_path;
        {
            LocalCache cache(cacheIn(dir));
            REQUIRE(isSuccess(cache.initialize()));
            local_path = store(cache, cloudRef("a.jpg"), "aaaa");
            store(cache, cloudRef("b.jpg"), "bbbb");
        }
        std::filesystem::remove(local_path);

        LocalCache reloaded(cacheIn(dir));
        REQUIRE(isSuccess(reloaded.initialize()));
        REQUIRE(reloaded.statistics().entry_count == 1);
        REQUIRE(reloaded.lookup(cloudRef("b.jpg")).has_value());
    }

    SECTION("An unreadable index is reported and the cache starts empty")
    {
        TempDirectory::writeFile(dir.path() / "cache" / "index.json", "{ this is not json");

        LocalCache cache(cacheIn(dir));
        REQUIRE(cache.initialize().code == StatusCode::CACHE_CORRUPTION);
        REQUIRE(cache.statistics().entry_count == 0);

        // Still usable afterwards
        store(cache, cloudRef("c.jpg"), "cc");
        REQUIRE(cache.lookup(cloudRef("c.jpg")).has_value());
    }
}

TEST_CASE("LocalCache replaces records and deletes the old file", "[cache][replace]")
{
    TempDirectory dir("cache-replace");
    LocalCache cache(cacheIn(dir));
    REQUIRE(isSuccess(cache.initialize()));

    std::string first = store(cache, cloudRef("v.mp4"), "version one");
    REQUIRE(cache.invalidate(cloudRef("v.mp4")));
    REQUIRE(cache.lookup(cloudRef("v.mp4"))->stale);

    std::string second = store(cache, cloudRef("v.mp4"), "version two!");
    REQUIRE(first != second);
    REQUIRE_FALSE(std::filesystem::exists(first));

    auto record = cache.lookup(cloudRef("v.mp4"));
    REQUIRE(record.has_value());
    REQUIRE(record->local_path == second);
    REQUIRE(record->size_at_download == 12);
    REQUIRE_FALSE(record->stale);
    REQUIRE(TempDirectory::readFile(second) == "version two!");
}

TEST_CASE("LocalCache staleness", "[cache][stale]")
{
    TempDirectory dir("cache-stale");
    LocalCache cache(cacheIn(dir));
    REQUIRE(isSuccess(cache.initialize()));

    auto fetched_version = TimeUtils::fromEpochMillis(1700000000000LL);
    std::string local_path = store(cache, cloudRef("doc.png"), "png", fetched_version);

    SECTION("Same or older remote time keeps the record fresh")
    {
        REQUIRE_FALSE(cache.markStaleIfNewer(cloudRef("doc.png"), fetched_version));
        REQUIRE_FALSE(cache.markStaleIfNewer(cloudRef("doc.png"), fetched_version - std::chrono::hours(1)));
        REQUIRE_FALSE(cache.lookup(cloudRef("doc.png"))->stale);
    }

    SECTION("Newer remote time marks it stale but keeps the file")
    {
        REQUIRE(cache.markStaleIfNewer(cloudRef("doc.png"), fetched_version + std::chrono::seconds(5)));
        auto record = cache.lookup(cloudRef("doc.png"));
        REQUIRE(record.has_value());
        REQUIRE(record->stale);
        REQUIRE(std::filesystem::exists(local_path));
        REQUIRE(cache.statistics().stale_count == 1);
    }

    SECTION("Invalidate of an unknown ref reports false")
    {
        REQUIRE_FALSE(cache.invalidate(cloudRef("unknown.png")));
    }

    SECTION("Remove drops the record and the file")
    {
        REQUIRE(isSuccess(cache.remove(cloudRef("doc.png"))));
        REQUIRE_FALSE(std::filesystem::exists(local_path));
        REQUIRE(cache.remove(cloudRef("doc.png")).code == StatusCode::NOT_FOUND);
    }
}

TEST_CASE("LocalCache evicts least recently fetched first", "[cache][evict]")
{
    TempDirectory dir("cache-evict");
    LocalCache cache(cacheIn(dir));
    REQUIRE(isSuccess(cache.initialize()));

    std::string oldest = store(cache, cloudRef("1.jpg"), std::string(100, '1'));
    std::string middle = store(cache, cloudRef("2.jpg"), std::string(100, '2'));
    std::string newest = store(cache, cloudRef("3.jpg"), std::string(100, '3'));

    SECTION("Oldest records go first")
    {
        REQUIRE(cache.evictLeastRecentlyFetched(150) == 200);
        REQUIRE_FALSE(std::filesystem::exists(oldest));
        REQUIRE_FALSE(std::filesystem::exists(middle));
        REQUIRE(std::filesystem::exists(newest));
        REQUIRE(cache.statistics().entry_count == 1);
    }

    SECTION("Pinned files are skipped")
    {
        cache.pin(oldest);
        REQUIRE(cache.evictLeastRecentlyFetched(100) == 100);
        REQUIRE(std::filesystem::exists(oldest));
        REQUIRE_FALSE(std::filesystem::exists(middle));

        cache.unpin(oldest);
        REQUIRE(cache.evictLeastRecentlyFetched(100) == 100);
        REQUIRE_FALSE(std::filesystem::exists(oldest));
    }

    SECTION("Asking for more than exists empties the cache")
    {
        REQUIRE(cache.evictLeastRecentlyFetched(1 << 20) == 300);
        REQUIRE(cache.statistics().total_bytes == 0);
    }
}

TEST_CASE("LocalCache stays within its size limit", "[cache][evict]")
{
    TempDirectory dir("cache-limit");
    LocalCache cache(cacheIn(dir, 1));
    REQUIRE(isSuccess(cache.initialize()));

    const std::string half_mb(512 * 1024, 'x');
    std::string first = store(cache, cloudRef("first.mov"), half_mb);
    store(cache, cloudRef("second.mov"), half_mb);
    std::string third = store(cache, cloudRef("third.mov"), half_mb);

    // Just-recorded downloads are never the eviction victim
    REQUIRE(cache.lookup(cloudRef("third.mov")).has_value());
    REQUIRE(std::filesystem::exists(third));
    REQUIRE_FALSE(std::filesystem::exists(first));
    REQUIRE(cache.statistics().total_bytes <= 1024 * 1024);
}
