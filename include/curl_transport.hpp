// File: curl_transport.hpp
#pragma once

#include "i_api_transport.hpp"
#include <curl/curl.h>
#include <string>

// Blocking libcurl transport. Every perform() uses its own easy handle so
// calls from concurrent FUSE worker threads do not share state.
class CurlTransport : public IApiTransport
{
public:
    explicit CurlTransport(std::string rootUrl);
    ~CurlTransport();

    CurlTransport(const CurlTransport &) = delete;
    CurlTransport &operator=(const CurlTransport &) = delete;

    ApiResponse perform(const ApiRequest &request, std::stop_token stop) override;

private:
    static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userp);
    static int progressCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

    std::string buildUrl(CURL *curl, const ApiRequest &request) const;

    std::string rootUrl_;
};
