#pragma once

#include <chrono>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <vector>
#include "api_types.hpp"
#include "errors.hpp"
#include "i_api_transport.hpp"

struct RetryPolicy
{
    int maxRetries = 5;
    std::chrono::milliseconds backoff{2000};
};

// Statuses worth another attempt for ordinary calls.
inline const std::set<long> kRetryableStatuses = {429, 500, 502, 504, 509};
// Listing, link resolution and cleanup calls only back off on rate limiting.
inline const std::set<long> kRateLimitedOnly = {429};

// Authenticated JSON access to the remote API on top of a transport.
class APIClient
{
public:
    APIClient(std::shared_ptr<IApiTransport> transport,
              const std::string &apiKey,
              RetryPolicy retry = {});

    // Single attempt, auth parameter added.
    ApiResponse call(ApiRequest request, std::stop_token stop);

    // Repeats the call while the status is in retryOn, sleeping the policy backoff in between.
    ApiResponse callWithRetry(const ApiRequest &request, std::stop_token stop,
                              const std::set<long> &retryOn = kRetryableStatuses);

    // callWithRetry, then decodes a 2xx body into out. Non-2xx responses are returned untouched.
    ApiResponse callJSON(const ApiRequest &request, json &out, std::stop_token stop,
                         const std::set<long> &retryOn = kRetryableStatuses);

    // Turns a non-2xx response into the structured error value.
    static ApiError ErrorFromResponse(const ApiResponse &response);

    RemoteItem torrentInfo(const std::string &torrentId, std::stop_token stop);
    // Returns the ID of the new torrent.
    std::string addMagnet(const std::string &hash, std::stop_token stop);
    void selectFiles(const std::string &torrentId, const std::string &fileIds, std::stop_token stop);
    void deleteTorrent(const std::string &torrentId, std::stop_token stop);
    void deleteDownload(const std::string &downloadId, std::stop_token stop);

private:
    void expectSuccess(const ApiResponse &response, const std::string &what);

    std::shared_ptr<IApiTransport> transport_;
    std::string apiKey_;
    RetryPolicy retry_;
};
