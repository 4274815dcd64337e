#include <sig-vault/webdav_parser.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/path_model.hpp>
#include <sig-vault/string_utils.hpp>
#include <cstring>
#include <curl/curl.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <memory>

namespace SigVault
{

namespace
{
const char *const DAV_NAMESPACE = "DAV:";

struct XmlDocDeleter
{
    void operator()(xmlDoc *doc) const
    {
        xmlFreeDoc(doc);
    }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

bool isDavElement(const xmlNode *node, const char *local_name)
{
    return node->type == XML_ELEMENT_NODE && node->ns && node->ns->href &&
           std::strcmp(reinterpret_cast<const char *>(node->ns->href), DAV_NAMESPACE) == 0 &&
           std::strcmp(reinterpret_cast<const char *>(node->name), local_name) == 0;
}

const xmlNode *findChild(const xmlNode *parent, const char *local_name)
{
    for (const xmlNode *child = parent->children; child; child = child->next)
    {
        if (isDavElement(child, local_name))
        {
            return child;
        }
    }
    return nullptr;
}

std::string nodeText(const xmlNode *node)
{
    xmlChar *content = xmlNodeGetContent(node);
    if (!content)
    {
        return "";
    }
    std::string text = StringUtils::trim(reinterpret_cast<const char *>(content));
    xmlFree(content);
    return text;
}

// "HTTP/1.1 200 OK" -> 200
int statusLineCode(const std::string &line)
{
    size_t space = line.find(' ');
    if (space == std::string::npos)
    {
        return 0;
    }
    try
    {
        return std::stoi(line.substr(space + 1, 3));
    }
    catch (const std::exception &)
    {
        return 0;
    }
}

std::optional<uint64_t> quotaValue(const xmlNode *prop, const char *name)
{
    const xmlNode *node = findChild(prop, name);
    if (!node)
    {
        return std::nullopt;
    }

    std::string text = nodeText(node);
    try
    {
        long long value = std::stoll(text);
        if (value >= 0)
        {
            return static_cast<uint64_t>(value);
        }
    }
    catch (const std::exception &)
    {
        Logger::debug(LogCategory::CLOUD, "Ignoring malformed {} '{}'", name, text);
    }
    return std::nullopt;
}

void applyProps(const xmlNode *prop, DavResource &resource)
{
    if (const xmlNode *type = findChild(prop, "resourcetype"))
    {
        resource.is_collection = findChild(type, "collection") != nullptr;
    }

    if (const xmlNode *length = findChild(prop, "getcontentlength"))
    {
        std::string text = nodeText(length);
        if (!text.empty())
        {
            try
            {
                resource.content_length = std::stoull(text);
            }
            catch (const std::exception &)
            {
                Logger::debug(LogCategory::CLOUD, "Ignoring malformed getcontentlength '{}'", text);
            }
        }
    }

    if (const xmlNode *modified = findChild(prop, "getlastmodified"))
    {
        resource.last_modified = WebDavParser::parseHttpDate(nodeText(modified));
    }

    if (auto used = quotaValue(prop, "quota-used-bytes"))
    {
        resource.quota_used_bytes = used;
    }
    if (auto available = quotaValue(prop, "quota-available-bytes"))
    {
        resource.quota_available_bytes = available;
    }
}
} // namespace

std::string WebDavParser::hrefPath(std::string_view href)
{
    size_t scheme = href.find("://");
    if (scheme == std::string_view::npos)
    {
        return std::string(href);
    }
    size_t path_start = href.find('/', scheme + 3);
    return path_start == std::string_view::npos ? "/" : std::string(href.substr(path_start));
}

std::optional<std::chrono::system_clock::time_point> WebDavParser::parseHttpDate(const std::string &value)
{
    if (value.empty())
    {
        return std::nullopt;
    }
    time_t parsed = curl_getdate(value.c_str(), nullptr);
    if (parsed < 0)
    {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(parsed);
}

const char *WebDavParser::propfindRequestBody()
{
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
           "<d:propfind xmlns:d=\"DAV:\">\n"
           "  <d:prop>\n"
           "    <d:resourcetype/>\n"
           "    <d:getcontentlength/>\n"
           "    <d:getlastmodified/>\n"
           "  </d:prop>\n"
           "</d:propfind>\n";
}

const char *WebDavParser::quotaRequestBody()
{
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
           "<d:propfind xmlns:d=\"DAV:\">\n"
           "  <d:prop>\n"
           "    <d:quota-used-bytes/>\n"
           "    <d:quota-available-bytes/>\n"
           "  </d:prop>\n"
           "</d:propfind>\n";
}

VaultStatus WebDavParser::parseMultistatus(std::string_view body,
                                           std::string_view root_path,
                                           std::vector<DavResource> &resources)
{
    resources.clear();

    XmlDocPtr doc(xmlReadMemory(body.data(), static_cast<int>(body.size()), "multistatus.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc)
    {
        return { StatusCode::CONNECTION_ERROR, "malformed PROPFIND response" };
    }

    const xmlNode *root = xmlDocGetRootElement(doc.get());
    if (!root || !isDavElement(root, "multistatus"))
    {
        return { StatusCode::CONNECTION_ERROR, "PROPFIND response is not a multistatus document" };
    }

    std::string decoded_root = PathModel::canonicalPath(StringUtils::urlDecode(root_path), BackendKind::CLOUD);

    for (const xmlNode *response = root->children; response; response = response->next)
    {
        if (!isDavElement(response, "response"))
        {
            continue;
        }

        const xmlNode *href = findChild(response, "href");
        if (!href)
        {
            continue;
        }

        std::string path =
        PathModel::canonicalPath(StringUtils::urlDecode(hrefPath(nodeText(href))), BackendKind::CLOUD);

        if (path.compare(0, decoded_root.size(), decoded_root) != 0 ||
            (path.size() > decoded_root.size() && !decoded_root.empty() && path[decoded_root.size()] != '/'))
        {
            Logger::debug(LogCategory::CLOUD, "Skipping href outside the files root: {}", path);
            continue;
        }

        DavResource resource;
        resource.path = PathModel::canonicalPath(path.substr(decoded_root.size()), BackendKind::CLOUD);
        if (resource.path == "/")
        {
            resource.path.clear();
        }

        for (const xmlNode *propstat = response->children; propstat; propstat = propstat->next)
        {
            if (!isDavElement(propstat, "propstat"))
            {
                continue;
            }

            const xmlNode *status = findChild(propstat, "status");
            int code = status ? statusLineCode(nodeText(status)) : 200;
            if (code < 200 || code >= 300)
            {
                continue;
            }

            if (const xmlNode *prop = findChild(propstat, "prop"))
            {
                applyProps(prop, resource);
            }
        }

        resources.push_back(std::move(resource));
    }

    return VaultStatus::success();
}

} // namespace SigVault
