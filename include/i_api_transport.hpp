#pragma once
#include <map>
#include <stop_token>
#include <string>

struct ApiRequest
{
    std::string method = "GET";
    // Appended to the transport's root URL unless rootUrl is set
    std::string path;
    // Absolute URL used instead of root + path (direct-download links)
    std::string rootUrl;
    std::map<std::string, std::string> parameters;
    // Sent as multipart/form-data when not empty
    std::map<std::string, std::string> multipart;
    std::map<std::string, std::string> headers;
};

struct ApiResponse
{
    // 0 when the transfer itself failed
    long status = 0;
    // Header names are lower-cased
    std::map<std::string, std::string> headers;
    std::string body;
    std::string transportError;

    bool ok() const { return status >= 200 && status < 300; }

    std::string header(const std::string &name) const
    {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};

class IApiTransport
{
public:
    virtual ApiResponse perform(const ApiRequest &request, std::stop_token stop) = 0;
    virtual ~IApiTransport() = default;
};
