// File: link_resolver.cpp
#include "link_resolver.hpp"
#include "errors.hpp"
#include "logger.hpp"

LinkResolver::LinkResolver(APIClient &client, InventoryFetcher &fetcher, BrokenJobSet &broken, JobRecovery &recovery)
    : client_(client), fetcher_(fetcher), broken_(broken), recovery_(recovery)
{
}

void LinkResolver::Apply(TreeEntry &entry, const RemoteItem &download)
{
    if (!entry.nameFromRule && !download.name.empty())
        entry.name = download.name;
    entry.url = download.link;
    entry.size = download.size;
    if (!download.mimeType.empty())
        entry.mimeType = download.mimeType;
    if (!download.generated.empty())
        entry.generated = download.generated;
}

bool LinkResolver::resolve(TreeEntry &entry, std::stop_token stop)
{
    if (entry.isFolder() || entry.originalLink.empty())
        return false;
    // Already unrestricted by an earlier listing
    if (!entry.url.empty())
        return true;

    if (auto cached = fetcher_.findDownloadByLink(entry.originalLink))
    {
        Apply(entry, *cached);
        return !entry.url.empty();
    }

    Logger::Log(LogLevel::DEBUG, "LinkResolver::resolve: creating new link for file " + entry.name + " from torrent hash " + entry.torrentHash);

    ApiRequest request;
    request.method = "POST";
    request.path = "/unrestrict/link";
    request.multipart["link"] = entry.originalLink;

    json body;
    ApiResponse response = client_.callJSON(request, body, stop, kRateLimitedOnly);

    if (IsBrokenStatus(response.status))
    {
        if (!broken_.add(entry.parentId))
        {
            throw BrokenLinkError(entry.parentId, "link of " + entry.name + " is broken and torrent " + entry.parentId + " is already queued for recovery");
        }

        auto torrent = fetcher_.torrentById(entry.parentId);
        if (!torrent)
        {
            Logger::Log(LogLevel::WARN, "LinkResolver::resolve: torrent " + entry.parentId + " of " + entry.name + " is not in the inventory");
            return false;
        }
        try
        {
            recovery_.recover(*torrent, stop);
        }
        catch (const ApiError &ex)
        {
            Logger::Log(LogLevel::ERROR, "LinkResolver::resolve: recovery of " + torrent->name + " failed: " + ex.what());
        }
        return false;
    }

    if (!response.ok())
    {
        Logger::Log(LogLevel::WARN, "LinkResolver::resolve: could not unrestrict " + entry.name + ": " +
                                        APIClient::ErrorFromResponse(response).what());
        return false;
    }

    RemoteItem download = body.is_object() ? body.get<RemoteItem>() : RemoteItem{};
    if (download.link.empty() || download.name.empty())
    {
        Logger::Log(LogLevel::WARN, "LinkResolver::resolve: empty unrestrict answer for " + entry.name);
        return false;
    }

    Apply(entry, download);
    return true;
}

std::string LinkResolver::openRange(const TreeEntry &entry, int64_t offset, int64_t size, std::stop_token stop)
{
    if (entry.url.empty())
        throw RdfsError("can't download " + entry.name + " - no URL");
    if (size <= 0)
        return {};

    ApiRequest request;
    request.rootUrl = entry.url;
    request.headers["Range"] = "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + size - 1);

    ApiResponse response = client_.callWithRetry(request, stop);

    if (IsBrokenStatus(response.status))
    {
        if (!broken_.add(entry.parentId))
        {
            throw BrokenLinkError(entry.parentId, "error opening file: '" + entry.url + "' torrent " + entry.parentId + " is already queued for recovery");
        }
        fetcher_.markStale();
        throw BrokenLinkError(entry.parentId, "error opening file: '" + entry.url + "' this link seems to be broken - torrent will be re-downloaded");
    }

    if (response.status == 416)
        return {};

    if (!response.ok())
        throw APIClient::ErrorFromResponse(response);

    // Servers that ignore Range send the whole body
    if (response.status == 200 && offset > 0)
    {
        if (static_cast<size_t>(offset) >= response.body.size())
            return {};
        return response.body.substr(static_cast<size_t>(offset), static_cast<size_t>(size));
    }
    if (response.body.size() > static_cast<size_t>(size))
        response.body.resize(static_cast<size_t>(size));
    return response.body;
}
