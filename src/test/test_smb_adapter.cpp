#include "temp_directory.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sig-vault/smb_adapter.hpp>
#include <functional>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <thread>

using namespace SigVault;

namespace
{
BackendConfig shareAt(const std::filesystem::path &mount_root)
{
    BackendConfig backend;
    backend.name = "nas";
    backend.kind = BackendKind::SMB;
    backend.smb.host = "nas.local";
    backend.smb.share = "media";
    backend.smb.mount_root = mount_root.string();
    return backend;
}

TransferConfig quickTimeouts()
{
    TransferConfig transfers;
    transfers.connect_timeout_ms = 2000;
    return transfers;
}

// Stands in for a hung mount: the named operation blocks until released
struct StalledMount
{
    explicit StalledMount(std::string operation) : operation(std::move(operation))
    {
    }

    std::function<void(const char *)> hook() const
    {
        return [target = operation, gate = released](const char *current)
        {
            if (target != current)
            {
                return;
            }
            for (int i = 0; i < 400 && !gate->load(); ++i)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        };
    }

    ~StalledMount()
    {
        released->store(true);
    }

    std::string operation;
    std::shared_ptr<std::atomic<bool>> released = std::make_shared<std::atomic<bool>>(false);
};

TransferConfig shortIoTimeout()
{
    TransferConfig transfers = quickTimeouts();
    transfers.read_write_timeout_ms = 50;
    return transfers;
}

std::string readAll(ByteStream &stream)
{
    std::string result;
    uint8_t buffer[7];
    while (true)
    {
        size_t n = 0;
        VaultStatus status = stream.read(buffer, sizeof(buffer), n);
        REQUIRE(isSuccess(status));
        if (n == 0)
        {
            break;
        }
        result.append(reinterpret_cast<const char *>(buffer), n);
    }
    return result;
}
} // namespace

TEST_CASE("SmbAdapter lists a mounted share", "[smb][list]")
{
    TempDirectory share("smb-list");
    TempDirectory::writeFile(share.path() / "Photos" / "b.jpg", "bbbb");
    TempDirectory::writeFile(share.path() / "Photos" / "a.jpg", "aa");
    std::filesystem::create_directories(share.path() / "Photos" / "A");

    SmbAdapter adapter(shareAt(share.path()), quickTimeouts());

    SECTION("Directories first, then names ignoring case")
    {
        std::vector<Entry> entries;
        REQUIRE(isSuccess(adapter.listDirectory("\\Photos", entries)));

        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].name == "A");
        REQUIRE(entries[0].isDirectory());
        REQUIRE(entries[1].name == "a.jpg");
        REQUIRE(entries[1].size == 2u);
        REQUIRE(entries[1].media_type == MediaType::IMAGE);
        REQUIRE(entries[1].remote_ref.path == "\\Photos\\a.jpg");
        REQUIRE(entries[1].remote_ref.backend_id == "smb://nas.local/media");
        REQUIRE(entries[2].name == "b.jpg");
        REQUIRE(adapter.isConnected());
    }

    SECTION("Forward slashes in the requested path are accepted")
    {
        std::vector<Entry> entries;
        REQUIRE(isSuccess(adapter.listDirectory("Photos/", entries)));
        REQUIRE(entries.size() == 3);
    }

    SECTION("Missing directory is NOT_FOUND")
    {
        std::vector<Entry> entries;
        REQUIRE(adapter.listDirectory("\\Nope", entries).code == StatusCode::NOT_FOUND);
        REQUIRE(entries.empty());
    }

    SECTION("Parent components never leave the share")
    {
        std::vector<Entry> entries;
        REQUIRE(adapter.listDirectory("\\Photos\\..\\..", entries).code == StatusCode::NOT_FOUND);
    }
}

TEST_CASE("SmbAdapter reads and stats files", "[smb][read]")
{
    TempDirectory share("smb-read");
    TempDirectory::writeFile(share.path() / "clip.mp4", "0123456789abcdef");

    SmbAdapter adapter(shareAt(share.path()), quickTimeouts());
    RemoteRef ref = adapter.makeRef("\\clip.mp4");

    Entry entry;
    REQUIRE(isSuccess(adapter.statEntry(ref, entry)));
    REQUIRE(entry.name == "clip.mp4");
    REQUIRE(entry.size == 16u);
    REQUIRE(entry.media_type == MediaType::VIDEO);
    REQUIRE(entry.modified_at.has_value());

    std::unique_ptr<ByteStream> stream;
    REQUIRE(isSuccess(adapter.openForRead(ref, stream)));
    REQUIRE(stream->size() == 16u);
    REQUIRE(readAll(*stream) == "0123456789abcdef");
    stream->close();
    stream->close();

    REQUIRE(adapter.statEntry(adapter.makeRef("\\missing.mp4"), entry).code == StatusCode::NOT_FOUND);
}

TEST_CASE("SmbAdapter writes commit only on close", "[smb][write]")
{
    TempDirectory share("smb-write");
    SmbAdapter adapter(shareAt(share.path()), quickTimeouts());
    const std::string payload = "uploaded bytes";

    SECTION("Closed sink replaces the destination")
    {
        TempDirectory::writeFile(share.path() / "Uploads" / "new.png", "old");

        std::unique_ptr<ByteSink> sink;
        REQUIRE(isSuccess(adapter.openForWrite("\\Uploads\\new.png", payload.size(), sink)));
        REQUIRE(isSuccess(sink->write(reinterpret_cast<const uint8_t *>(payload.data()), payload.size())));

        // Nothing is visible until the commit
        REQUIRE(TempDirectory::readFile(share.path() / "Uploads" / "new.png") == "old");

        REQUIRE(isSuccess(sink->close()));
        REQUIRE(TempDirectory::readFile(share.path() / "Uploads" / "new.png") == payload);
        REQUIRE_FALSE(std::filesystem::exists(share.path() / "Uploads" / ".new.png.sigvault-part"));
    }

    SECTION("Missing parent directories are created")
    {
        std::unique_ptr<ByteSink> sink;
        REQUIRE(isSuccess(adapter.openForWrite("\\2024\\06\\pic.jpg", std::nullopt, sink)));
        REQUIRE(isSuccess(sink->write(reinterpret_cast<const uint8_t *>(payload.data()), payload.size())));
        REQUIRE(isSuccess(sink->close()));
        REQUIRE(TempDirectory::readFile(share.path() / "2024" / "06" / "pic.jpg") == payload);
    }

    SECTION("Aborted sink leaves nothing behind")
    {
        std::unique_ptr<ByteSink> sink;
        REQUIRE(isSuccess(adapter.openForWrite("\\draft.jpg", payload.size(), sink)));
        REQUIRE(isSuccess(sink->write(reinterpret_cast<const uint8_t *>(payload.data()), 5)));
        sink->abort();

        REQUIRE_FALSE(std::filesystem::exists(share.path() / "draft.jpg"));
        REQUIRE_FALSE(std::filesystem::exists(share.path() / ".draft.jpg.sigvault-part"));
    }

    SECTION("Destroyed sink acts like abort")
    {
        {
            std::unique_ptr<ByteSink> sink;
            REQUIRE(isSuccess(adapter.openForWrite("\\dropped.jpg", std::nullopt, sink)));
            REQUIRE(isSuccess(sink->write(reinterpret_cast<const uint8_t *>(payload.data()), payload.size())));
        }
        REQUIRE(std::filesystem::is_empty(share.path()));
    }

    SECTION("Invalid names are rejected before anything is created")
    {
        std::unique_ptr<ByteSink> sink;
        REQUIRE(adapter.openForWrite("\\Uploads\\..", std::nullopt, sink).code == StatusCode::INVALID_NAME);
        REQUIRE(sink == nullptr);
    }
}

TEST_CASE("SmbAdapter reports an unmounted share as a connection error", "[smb][connect]")
{
    TempDirectory scratch("smb-missing");
    SmbAdapter adapter(shareAt(scratch.path() / "not-mounted"), quickTimeouts());

    std::vector<Entry> entries;
    VaultStatus status = adapter.listDirectory("\\", entries);
    REQUIRE(status.code == StatusCode::CONNECTION_ERROR);
    REQUIRE_FALSE(adapter.isConnected());

    // Mounting later lets the next call connect afresh
    std::filesystem::create_directories(scratch.path() / "not-mounted");
    REQUIRE(isSuccess(adapter.listDirectory("\\", entries)));
    REQUIRE(adapter.isConnected());
}

TEST_CASE("SmbAdapter times out blocking share I/O", "[smb][timeout]")
{
    TempDirectory share("smb-timeout");
    TempDirectory::writeFile(share.path() / "clip.mp4", "0123456789abcdef");
    SmbAdapter adapter(shareAt(share.path()), shortIoTimeout());
    const std::string payload = "uploaded bytes";

    SECTION("A stalled read fails with a connection error")
    {
        StalledMount mount("read");
        adapter.setIoHook(mount.hook());

        std::unique_ptr<ByteStream> stream;
        REQUIRE(isSuccess(adapter.openForRead(adapter.makeRef("\\clip.mp4"), stream)));
        REQUIRE(adapter.isConnected());

        uint8_t buffer[8];
        size_t n = 0;
        auto started = std::chrono::steady_clock::now();
        VaultStatus status = stream->read(buffer, sizeof(buffer), n);
        REQUIRE(status.code == StatusCode::CONNECTION_ERROR);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(1500));
        REQUIRE(n == 0);
        REQUIRE_FALSE(adapter.isConnected());

        // The stream stays unusable
        REQUIRE(stream->read(buffer, sizeof(buffer), n).code == StatusCode::CONNECTION_ERROR);
    }

    SECTION("A stalled write fails and the upload is not committed")
    {
        StalledMount mount("write");
        adapter.setIoHook(mount.hook());

        std::unique_ptr<ByteSink> sink;
        REQUIRE(isSuccess(adapter.openForWrite("\\slow.jpg", payload.size(), sink)));

        VaultStatus status = sink->write(reinterpret_cast<const uint8_t *>(payload.data()), payload.size());
        REQUIRE(status.code == StatusCode::CONNECTION_ERROR);
        REQUIRE_FALSE(adapter.isConnected());
        REQUIRE(sink->close().code == StatusCode::CONNECTION_ERROR);
        REQUIRE_FALSE(std::filesystem::exists(share.path() / "slow.jpg"));
    }

    SECTION("A stalled listing fails with a connection error")
    {
        StalledMount mount("list");
        adapter.setIoHook(mount.hook());

        std::vector<Entry> entries;
        REQUIRE(adapter.listDirectory("\\", entries).code == StatusCode::CONNECTION_ERROR);
        REQUIRE(entries.empty());
        REQUIRE_FALSE(adapter.isConnected());
    }

    SECTION("A stalled stat fails with a connection error")
    {
        StalledMount mount("stat");
        adapter.setIoHook(mount.hook());

        Entry entry;
        REQUIRE(adapter.statEntry(adapter.makeRef("\\clip.mp4"), entry).code == StatusCode::CONNECTION_ERROR);
        REQUIRE_FALSE(adapter.isConnected());
    }

    SECTION("Calls that finish in time are unaffected")
    {
        StalledMount mount("never-called");
        adapter.setIoHook(mount.hook());

        std::unique_ptr<ByteStream> stream;
        REQUIRE(isSuccess(adapter.openForRead(adapter.makeRef("\\clip.mp4"), stream)));
        REQUIRE(readAll(*stream) == "0123456789abcdef");
        REQUIRE(adapter.isConnected());
    }
}

TEST_CASE("statusFromErrno maps to the shared taxonomy", "[smb][errors]")
{
    REQUIRE(SmbAdapter::statusFromErrno(ENOENT, "x").code == StatusCode::NOT_FOUND);
    REQUIRE(SmbAdapter::statusFromErrno(EACCES, "x").code == StatusCode::PERMISSION_DENIED);
    REQUIRE(SmbAdapter::statusFromErrno(EROFS, "x").code == StatusCode::PERMISSION_DENIED);
    REQUIRE(SmbAdapter::statusFromErrno(ENOSPC, "x").code == StatusCode::QUOTA_EXCEEDED);
    REQUIRE(SmbAdapter::statusFromErrno(EDQUOT, "x").code == StatusCode::QUOTA_EXCEEDED);
    REQUIRE(SmbAdapter::statusFromErrno(EHOSTDOWN, "x").code == StatusCode::CONNECTION_ERROR);
    REQUIRE(SmbAdapter::statusFromErrno(ETIMEDOUT, "x").code == StatusCode::CONNECTION_ERROR);

    VaultStatus status = SmbAdapter::statusFromErrno(ENOENT, "open \\a.jpg");
    REQUIRE(status.message.rfind("open \\a.jpg: ", 0) == 0);
}
