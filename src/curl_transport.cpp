// File: curl_transport.cpp
#include "curl_transport.hpp"
#include "logger.hpp"
#include "utils.hpp"

CurlTransport::CurlTransport(std::string rootUrl)
    : rootUrl_(std::move(rootUrl))
{
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlTransport::~CurlTransport()
{
    curl_global_cleanup();
}

size_t CurlTransport::writeCallback(void *contents, size_t size, size_t nmemb, void *userp)
{
    auto *data = static_cast<std::string *>(userp);
    data->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

size_t CurlTransport::headerCallback(char *buffer, size_t size, size_t nitems, void *userp)
{
    auto *headers = static_cast<std::map<std::string, std::string> *>(userp);
    std::string line(buffer, size * nitems);

    auto colon = line.find(':');
    if (colon != std::string::npos)
    {
        (*headers)[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return size * nitems;
}

int CurlTransport::progressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto *stop = static_cast<std::stop_token *>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return stop->stop_requested() ? 1 : 0;
}

std::string CurlTransport::buildUrl(CURL *curl, const ApiRequest &request) const
{
    std::string url = request.rootUrl.empty() ? rootUrl_ + request.path : request.rootUrl;

    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto &[key, value] : request.parameters)
    {
        char *escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        url += separator;
        url += key + "=" + (escaped ? escaped : "");
        curl_free(escaped);
        separator = '&';
    }
    return url;
}

ApiResponse CurlTransport::perform(const ApiRequest &request, std::stop_token stop)
{
    ApiResponse response;

    CURL *curl = curl_easy_init();
    if (!curl)
    {
        response.transportError = "CURL initialization failed";
        return response;
    }

    std::string url = buildUrl(curl, request);
    Logger::Log(LogLevel::TRACE, "CurlTransport::perform: " + request.method + " " + (request.rootUrl.empty() ? request.path : std::string("<download link>")));

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

    if (request.method != "GET" && request.method != "POST")
    {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    struct curl_slist *headerList = nullptr;
    for (const auto &[name, value] : request.headers)
    {
        headerList = curl_slist_append(headerList, (name + ": " + value).c_str());
    }
    if (headerList)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    curl_mime *mime = nullptr;
    if (!request.multipart.empty())
    {
        mime = curl_mime_init(curl);
        for (const auto &[name, value] : request.multipart)
        {
            curl_mimepart *part = curl_mime_addpart(mime);
            curl_mime_name(part, name.c_str());
            curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    }
    else if (request.method == "POST")
    {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK)
    {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    else
    {
        response.transportError = curl_easy_strerror(res);
        Logger::Log(LogLevel::WARN, "CurlTransport::perform: CURL error: " + response.transportError);
    }

    if (mime)
        curl_mime_free(mime);
    if (headerList)
        curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);

    return response;
}
