#include <catch2/catch_test_macros.hpp>
#include <sig-vault/cloud_adapter.hpp>
#include <sig-vault/config_parser.hpp>
#include <sig-vault/time_utils.hpp>
#include <sig-vault/webdav_parser.hpp>

using namespace SigVault;

namespace
{
const char *const FILES_ROOT = "/remote.php/dav/files/alice/";

const char *const PHOTOS_LISTING = R"(<?xml version="1.0"?>
<d:multistatus xmlns:d="DAV:" xmlns:oc="http://owncloud.org/ns">
  <d:response>
    <d:href>/remote.php/dav/files/alice/Photos/</d:href>
    <d:propstat>
      <d:prop>
        <d:resourcetype><d:collection/></d:resourcetype>
        <d:getlastmodified>Tue, 04 Jun 2024 10:15:00 GMT</d:getlastmodified>
      </d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
    <d:propstat>
      <d:prop><d:getcontentlength/></d:prop>
      <d:status>HTTP/1.1 404 Not Found</d:status>
    </d:propstat>
  </d:response>
  <d:response>
    <d:href>/remote.php/dav/files/alice/Photos/Summer%202024/</d:href>
    <d:propstat>
      <d:prop><d:resourcetype><d:collection/></d:resourcetype></d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
  <d:response>
    <d:href>https://cloud.example.org/remote.php/dav/files/alice/Photos/IMG_0001.JPG</d:href>
    <d:propstat>
      <d:prop>
        <d:resourcetype/>
        <d:getcontentlength>2048</d:getcontentlength>
        <d:getlastmodified>Wed, 05 Jun 2024 08:00:00 GMT</d:getlastmodified>
      </d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
  <d:response>
    <d:href>/remote.php/dav/files/bob/secret.txt</d:href>
    <d:propstat>
      <d:prop><d:getcontentlength>1</d:getcontentlength></d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
</d:multistatus>)";
} // namespace

TEST_CASE("parseMultistatus reads PROPFIND responses", "[webdav][parse]")
{
    std::vector<DavResource> resources;
    REQUIRE(isSuccess(WebDavParser::parseMultistatus(PHOTOS_LISTING, FILES_ROOT, resources)));

    // The href of another user is not below the files root
    REQUIRE(resources.size() == 3);

    SECTION("Self entry of the listed collection")
    {
        const DavResource &self = resources[0];
        REQUIRE(self.path == "Photos");
        REQUIRE(self.is_collection);
        REQUIRE_FALSE(self.content_length.has_value());
        REQUIRE(self.last_modified.has_value());
        REQUIRE(TimeUtils::toEpochMillis(*self.last_modified) == 1717496100000LL);
    }

    SECTION("Hrefs are URL decoded")
    {
        REQUIRE(resources[1].path == "Photos/Summer 2024");
        REQUIRE(resources[1].is_collection);
    }

    SECTION("Absolute hrefs lose their scheme and host")
    {
        const DavResource &file = resources[2];
        REQUIRE(file.path == "Photos/IMG_0001.JPG");
        REQUIRE_FALSE(file.is_collection);
        REQUIRE(file.content_length == 2048u);
        REQUIRE(file.last_modified.has_value());
    }
}

TEST_CASE("parseMultistatus maps the files root to the empty path", "[webdav][parse]")
{
    const char *body = R"(<?xml version="1.0"?>
<multistatus xmlns="DAV:">
  <response>
    <href>/remote.php/dav/files/alice/</href>
    <propstat><prop><resourcetype><collection/></resourcetype></prop><status>HTTP/1.1 200 OK</status></propstat>
  </response>
</multistatus>)";

    std::vector<DavResource> resources;
    REQUIRE(isSuccess(WebDavParser::parseMultistatus(body, FILES_ROOT, resources)));
    REQUIRE(resources.size() == 1);
    REQUIRE(resources[0].path.empty());
    REQUIRE(resources[0].is_collection);
}

TEST_CASE("parseMultistatus reads quota properties", "[webdav][parse][quota]")
{
    const char *body = R"(<?xml version="1.0"?>
<d:multistatus xmlns:d="DAV:">
  <d:response>
    <d:href>/remote.php/dav/files/alice/</d:href>
    <d:propstat>
      <d:prop>
        <d:quota-used-bytes>7340032</d:quota-used-bytes>
        <d:quota-available-bytes>1073741824</d:quota-available-bytes>
      </d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
  <d:response>
    <d:href>/remote.php/dav/files/alice/Shared/</d:href>
    <d:propstat>
      <d:prop>
        <d:quota-used-bytes>12</d:quota-used-bytes>
        <d:quota-available-bytes>-3</d:quota-available-bytes>
      </d:prop>
      <d:status>HTTP/1.1 200 OK</d:status>
    </d:propstat>
  </d:response>
</d:multistatus>)";

    std::vector<DavResource> resources;
    REQUIRE(isSuccess(WebDavParser::parseMultistatus(body, FILES_ROOT, resources)));
    REQUIRE(resources.size() == 2);

    REQUIRE(resources[0].quota_used_bytes == 7340032u);
    REQUIRE(resources[0].quota_available_bytes == 1073741824u);

    // Nextcloud reports an unlimited quota as -3
    REQUIRE(resources[1].quota_used_bytes == 12u);
    REQUIRE_FALSE(resources[1].quota_available_bytes.has_value());
}

TEST_CASE("parseMultistatus rejects documents that are not multistatus", "[webdav][parse]")
{
    std::vector<DavResource> resources;

    REQUIRE(WebDavParser::parseMultistatus("<html><body>Login</body></html>", FILES_ROOT, resources).code ==
            StatusCode::CONNECTION_ERROR);
    REQUIRE(WebDavParser::parseMultistatus("not xml at all", FILES_ROOT, resources).code == StatusCode::CONNECTION_ERROR);
    REQUIRE(WebDavParser::parseMultistatus(R"(<multistatus xmlns="urn:other"/>)", FILES_ROOT, resources).code ==
            StatusCode::CONNECTION_ERROR);
    REQUIRE(resources.empty());
}

TEST_CASE("WebDAV helpers", "[webdav][helpers]")
{
    SECTION("hrefPath")
    {
        REQUIRE(WebDavParser::hrefPath("https://cloud.example.org/remote.php/dav/") == "/remote.php/dav/");
        REQUIRE(WebDavParser::hrefPath("http://host") == "/");
        REQUIRE(WebDavParser::hrefPath("/already/a/path") == "/already/a/path");
    }

    SECTION("parseHttpDate")
    {
        auto parsed = WebDavParser::parseHttpDate("Thu, 01 Jan 1970 00:00:10 GMT");
        REQUIRE(parsed.has_value());
        REQUIRE(TimeUtils::toEpochMillis(*parsed) == 10000);
        REQUIRE_FALSE(WebDavParser::parseHttpDate("").has_value());
        REQUIRE_FALSE(WebDavParser::parseHttpDate("yesterday-ish").has_value());
    }
}

TEST_CASE("statusFromHttp maps to the shared taxonomy", "[webdav][errors]")
{
    REQUIRE(isSuccess(CloudAdapter::statusFromHttp(200, "GET")));
    REQUIRE(isSuccess(CloudAdapter::statusFromHttp(207, "PROPFIND")));
    REQUIRE(CloudAdapter::statusFromHttp(401, "GET").code == StatusCode::PERMISSION_DENIED);
    REQUIRE(CloudAdapter::statusFromHttp(403, "GET").code == StatusCode::PERMISSION_DENIED);
    REQUIRE(CloudAdapter::statusFromHttp(404, "GET").code == StatusCode::NOT_FOUND);
    REQUIRE(CloudAdapter::statusFromHttp(410, "GET").code == StatusCode::NOT_FOUND);
    REQUIRE(CloudAdapter::statusFromHttp(413, "PUT", true).code == StatusCode::QUOTA_EXCEEDED);
    REQUIRE(CloudAdapter::statusFromHttp(507, "PUT", true).code == StatusCode::QUOTA_EXCEEDED);
    REQUIRE(CloudAdapter::statusFromHttp(409, "PUT", true).code == StatusCode::NOT_FOUND);
    REQUIRE(CloudAdapter::statusFromHttp(409, "MKCOL").code == StatusCode::CONNECTION_ERROR);
    REQUIRE(CloudAdapter::statusFromHttp(502, "GET").code == StatusCode::CONNECTION_ERROR);

    REQUIRE(CloudAdapter::statusFromHttp(404, "GET a.jpg").message == "GET a.jpg: HTTP 404");
}

TEST_CASE("Cloud base URLs point at the WebDAV files root", "[webdav][config]")
{
    REQUIRE(ConfigParser::normalizeCloudBaseUrl("https://cloud.example.org", "alice") ==
            "https://cloud.example.org/remote.php/dav/files/alice/");
    REQUIRE(ConfigParser::normalizeCloudBaseUrl("https://cloud.example.org/", "bob smith") ==
            "https://cloud.example.org/remote.php/dav/files/bob%20smith/");
    REQUIRE(ConfigParser::normalizeCloudBaseUrl("https://cloud.example.org/remote.php/dav/files/alice", "ignored") ==
            "https://cloud.example.org/remote.php/dav/files/alice/");
}

TEST_CASE("CloudAdapter builds escaped URLs below the files root", "[webdav][cloud]")
{
    BackendConfig backend;
    backend.name = "cloud";
    backend.kind = BackendKind::CLOUD;
    backend.cloud.base_url = "https://cloud.example.org/remote.php/dav/files/alice/";

    CloudAdapter adapter(backend, TransferConfig{});

    REQUIRE(adapter.urlFor("", true) == backend.cloud.base_url);
    REQUIRE(adapter.urlFor("Photos/Summer 2024", true) == backend.cloud.base_url + "Photos/Summer%202024/");
    REQUIRE(adapter.urlFor("/Photos/a#1.jpg", false) == backend.cloud.base_url + "Photos/a%231.jpg");
    REQUIRE(adapter.makeRef("Photos/a.jpg").backend_id == backend.cloud.base_url);
}

TEST_CASE("CloudAdapter reports an unreachable server as a connection error", "[webdav][cloud]")
{
    BackendConfig backend;
    backend.name = "offline";
    backend.kind = BackendKind::CLOUD;
    backend.cloud.base_url = "http://127.0.0.1:1/remote.php/dav/files/alice/";

    TransferConfig transfers;
    transfers.connect_timeout_ms = 2000;
    CloudAdapter adapter(backend, transfers);

    std::vector<Entry> entries;
    REQUIRE(adapter.listDirectory("Photos", entries).code == StatusCode::CONNECTION_ERROR);
    REQUIRE(entries.empty());
}
