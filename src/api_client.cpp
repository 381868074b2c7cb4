#include "api_client.hpp"
#include <stdexcept>
#include "logger.hpp"
#include "utils.hpp"

APIClient::APIClient(std::shared_ptr<IApiTransport> transport,
                     const std::string &apiKey,
                     RetryPolicy retry)
    : transport_(std::move(transport)), apiKey_(apiKey), retry_(retry)
{
    if (!transport_)
        throw std::invalid_argument("APIClient requires a transport");
}

ApiResponse APIClient::call(ApiRequest request, std::stop_token stop)
{
    if (stop.stop_requested())
        throw OperationCancelledError();

    // Direct-download links carry their own authorization
    if (request.rootUrl.empty() && !apiKey_.empty())
    {
        request.parameters["auth_token"] = apiKey_;
    }

    ApiResponse response = transport_->perform(request, stop);
    if (response.status == 0 && stop.stop_requested())
        throw OperationCancelledError();

    Logger::Log(LogLevel::TRACE, "APIClient::call: " + request.method + " " + request.path + " -> " + std::to_string(response.status));
    return response;
}

ApiResponse APIClient::callWithRetry(const ApiRequest &request, std::stop_token stop,
                                     const std::set<long> &retryOn)
{
    ApiResponse response = call(request, stop);

    int retries = 0;
    while ((response.status == 0 || retryOn.count(response.status)) && retries < retry_.maxRetries)
    {
        Logger::Log(LogLevel::DEBUG, "APIClient::callWithRetry: " + request.method + " " + request.path +
                                         " returned " + std::to_string(response.status) + ". Retrying in " +
                                         std::to_string(retry_.backoff.count()) + " ms.");
        if (!sleep_for(retry_.backoff, stop))
            throw OperationCancelledError();

        response = call(request, stop);
        retries++;
    }

    if (retries > 0 && !response.ok())
    {
        Logger::Log(LogLevel::WARN, "APIClient::callWithRetry: giving up on " + request.method + " " + request.path +
                                        " after " + std::to_string(retries) + " retries, status " + std::to_string(response.status));
    }
    return response;
}

ApiResponse APIClient::callJSON(const ApiRequest &request, json &out, std::stop_token stop,
                                const std::set<long> &retryOn)
{
    ApiResponse response = callWithRetry(request, stop, retryOn);
    if (!response.ok())
        return response;

    if (response.body.empty())
    {
        out = json();
        return response;
    }

    try
    {
        out = json::parse(response.body);
    }
    catch (const json::parse_error &ex)
    {
        throw ApiError("malformed JSON from " + request.path + ": " + ex.what(), "HTTP " + std::to_string(response.status), response.status);
    }
    return response;
}

ApiError APIClient::ErrorFromResponse(const ApiResponse &response)
{
    if (response.status == 0)
        return ApiError(response.transportError.empty() ? "transfer failed" : response.transportError, "no response", 0);

    std::string message = response.body;
    std::string status = "HTTP " + std::to_string(response.status);

    auto body = json::parse(response.body, nullptr, false);
    if (body.is_object())
    {
        if (body.contains("error") && body["error"].is_string())
            message = body["error"].get<std::string>();
        if (body.contains("error_code") && body["error_code"].is_number())
            status += " (error_code " + std::to_string(body["error_code"].get<int>()) + ")";
    }
    return ApiError(message, status, response.status);
}

void APIClient::expectSuccess(const ApiResponse &response, const std::string &what)
{
    if (response.ok())
        return;

    ApiError error = ErrorFromResponse(response);
    Logger::Log(LogLevel::ERROR, "APIClient: " + what + " failed: " + error.what());
    throw error;
}

RemoteItem APIClient::torrentInfo(const std::string &torrentId, std::stop_token stop)
{
    ApiRequest request;
    request.path = "/torrents/info/" + torrentId;

    json body;
    expectSuccess(callJSON(request, body, stop), "torrent info for " + torrentId);
    return body.get<RemoteItem>();
}

std::string APIClient::addMagnet(const std::string &hash, std::stop_token stop)
{
    ApiRequest request;
    request.method = "POST";
    request.path = "/torrents/addMagnet";
    request.multipart["magnet"] = "magnet:?xt=urn:btih:" + hash;

    json body;
    expectSuccess(callJSON(request, body, stop), "addMagnet for " + hash);
    if (!body.is_object() || !body.contains("id") || !body["id"].is_string())
        throw ApiError("addMagnet response without id", "HTTP 201", 201);
    return body["id"].get<std::string>();
}

void APIClient::selectFiles(const std::string &torrentId, const std::string &fileIds, std::stop_token stop)
{
    ApiRequest request;
    request.method = "POST";
    request.path = "/torrents/selectFiles/" + torrentId;
    request.multipart["files"] = fileIds;

    expectSuccess(callWithRetry(request, stop), "selectFiles for " + torrentId);
}

void APIClient::deleteTorrent(const std::string &torrentId, std::stop_token stop)
{
    ApiRequest request;
    request.method = "DELETE";
    request.path = "/torrents/delete/" + torrentId;

    expectSuccess(callWithRetry(request, stop), "delete torrent " + torrentId);
}

void APIClient::deleteDownload(const std::string &downloadId, std::stop_token stop)
{
    ApiRequest request;
    request.method = "DELETE";
    request.path = "/downloads/delete/" + downloadId;

    expectSuccess(callWithRetry(request, stop, kRateLimitedOnly), "delete download " + downloadId);
}
