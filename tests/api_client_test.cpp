// File: api_client_test.cpp
#include <memory>
#include "api_client.hpp"
#include "fake_debrid_service.h"
#include "gtest/gtest.h"
#include "logger.hpp"

class APIClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::SetLogLevel(LogLevel::FATAL);
        service_ = std::make_shared<FakeDebridService>();
        client_ = std::make_unique<APIClient>(service_, "secret", RetryPolicy{3, std::chrono::milliseconds(0)});
    }

    std::shared_ptr<FakeDebridService> service_;
    std::unique_ptr<APIClient> client_;
};

TEST_F(APIClientTest, addsTheTokenToApiCalls)
{
    ApiRequest request;
    request.path = "/torrents";
    client_->call(request, std::stop_token());

    auto requests = service_->requests();
    ASSERT_EQ(1u, requests.size());
    EXPECT_EQ("secret", requests[0].parameters.at("auth_token"));
}

TEST_F(APIClientTest, directDownloadsCarryNoToken)
{
    service_->setContent("https://dl.example/x", "abc");
    ApiRequest request;
    request.rootUrl = "https://dl.example/x";
    client_->call(request, std::stop_token());

    EXPECT_EQ(0u, service_->requests()[0].parameters.count("auth_token"));
}

TEST_F(APIClientTest, retriesRateLimitingUntilSuccess)
{
    service_->failNext("/torrents", 429, 2);
    ApiRequest request;
    request.path = "/torrents";

    ApiResponse response = client_->callWithRetry(request, std::stop_token(), kRateLimitedOnly);
    EXPECT_EQ(200, response.status);
    EXPECT_EQ(3, service_->count("GET", "/torrents"));
}

TEST_F(APIClientTest, givesUpAfterMaxRetries)
{
    service_->failNext("/torrents", 429, 10);
    ApiRequest request;
    request.path = "/torrents";

    ApiResponse response = client_->callWithRetry(request, std::stop_token(), kRateLimitedOnly);
    EXPECT_EQ(429, response.status);
    EXPECT_EQ(4, service_->count("GET", "/torrents"));
}

TEST_F(APIClientTest, rateLimitedOnlyDoesNotRetryServerErrors)
{
    service_->failNext("/torrents", 503, 1);
    ApiRequest request;
    request.path = "/torrents";

    EXPECT_EQ(503, client_->callWithRetry(request, std::stop_token(), kRateLimitedOnly).status);
    EXPECT_EQ(1, service_->count("GET", "/torrents"));
}

TEST_F(APIClientTest, errorBodiesAreDecoded)
{
    ApiResponse response;
    response.status = 503;
    response.body = R"({"error":"hoster_unavailable","error_code":19})";

    ApiError error = APIClient::ErrorFromResponse(response);
    EXPECT_EQ("hoster_unavailable", error.message());
    EXPECT_EQ("HTTP 503 (error_code 19)", error.status());
    EXPECT_EQ(503, error.httpCode());

    response.body = "plain failure";
    EXPECT_EQ("plain failure", APIClient::ErrorFromResponse(response).message());
}

TEST_F(APIClientTest, unknownTorrentThrowsApiError)
{
    try
    {
        client_->torrentInfo("NOPE", std::stop_token());
        FAIL() << "expected ApiError";
    }
    catch (const ApiError &ex)
    {
        EXPECT_EQ(404, ex.httpCode());
        EXPECT_EQ("unknown_ressource", ex.message());
    }
}

TEST_F(APIClientTest, magnetRoundTripThroughTheService)
{
    service_->addTorrent({"OLD", "Some.Movie.2019", "abc123", "dead", {}, {{1, "/a.mkv", 10, 1}}});

    std::string id = client_->addMagnet("abc123", std::stop_token());
    RemoteItem info = client_->torrentInfo(id, std::stop_token());
    EXPECT_EQ("Some.Movie.2019", info.name);
    EXPECT_EQ(kTorrentWaitingSelection, info.status);

    client_->selectFiles(id, "1", std::stop_token());
    EXPECT_EQ(1u, client_->torrentInfo(id, std::stop_token()).links.size());

    client_->deleteTorrent("OLD", std::stop_token());
    EXPECT_FALSE(service_->hasTorrent("OLD"));
}

TEST_F(APIClientTest, cancelledCallsThrow)
{
    std::stop_source source;
    source.request_stop();
    ApiRequest request;
    request.path = "/torrents";
    EXPECT_THROW(client_->call(request, source.get_token()), OperationCancelledError);
}
