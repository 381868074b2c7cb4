// File: inventory_fetcher_test.cpp
#include <memory>
#include "fake_debrid_service.h"
#include "gtest/gtest.h"
#include "inventory_fetcher.hpp"
#include "logger.hpp"

class InventoryFetcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::SetLogLevel(LogLevel::FATAL);
        service_ = std::make_shared<FakeDebridService>();
        for (int i = 0; i < 5; ++i)
        {
            std::string id = "T" + std::to_string(i);
            service_->addTorrent({id, "Torrent." + std::to_string(i), "hash" + std::to_string(i), "downloaded",
                                  {"https://rd.example/d/" + id + "A"}, {}});
        }
        service_->addDownload({"D1", "a.mkv", 10, "https://rd.example/d/T0A", "https://dl.example/a.mkv"});

        client_ = std::make_unique<APIClient>(service_, "secret", RetryPolicy{3, std::chrono::milliseconds(0)});
        FetcherSettings settings;
        settings.refreshInterval = std::chrono::seconds(3600);
        settings.pageSize = 2;
        fetcher_ = std::make_unique<InventoryFetcher>(*client_, settings);
    }

    std::shared_ptr<FakeDebridService> service_;
    std::unique_ptr<APIClient> client_;
    std::unique_ptr<InventoryFetcher> fetcher_;
};

TEST_F(InventoryFetcherTest, firstRefreshPagesEverything)
{
    FetchResult result = fetcher_->refresh(false, false, std::stop_token());

    EXPECT_TRUE(result.updated);
    ASSERT_EQ(5u, result.torrents.size());
    EXPECT_EQ("T0", result.torrents.front().id);
    EXPECT_EQ("T4", result.torrents.back().id);
    EXPECT_EQ(1u, result.downloads.size());
    // limit=1 probe, then pages of two at offsets 1 and 3
    EXPECT_EQ(3, service_->count("GET", "/torrents"));
    EXPECT_TRUE(fetcher_->hasSnapshot());
}

TEST_F(InventoryFetcherTest, unchangedCountsReuseTheSnapshot)
{
    fetcher_->refresh(false, false, std::stop_token());
    int before = service_->count("GET", "/torrents");

    FetchResult result = fetcher_->refresh(false, false, std::stop_token());
    EXPECT_FALSE(result.updated);
    EXPECT_EQ(5u, result.torrents.size());
    EXPECT_EQ(before + 1, service_->count("GET", "/torrents"));
}

TEST_F(InventoryFetcherTest, ruleFileChangeForcesAnUpdateFlag)
{
    fetcher_->refresh(false, false, std::stop_token());
    EXPECT_TRUE(fetcher_->refresh(false, true, std::stop_token()).updated);
}

TEST_F(InventoryFetcherTest, countChangePagesAgain)
{
    fetcher_->refresh(false, false, std::stop_token());
    service_->addTorrent({"T5", "Torrent.5", "hash5", "downloaded", {"https://rd.example/d/T5A"}, {}});

    FetchResult result = fetcher_->refresh(false, false, std::stop_token());
    EXPECT_TRUE(result.updated);
    EXPECT_EQ(6u, result.torrents.size());
    EXPECT_TRUE(fetcher_->torrentById("T5").has_value());
}

TEST_F(InventoryFetcherTest, staleOrForcedRefreshPagesEvenWithSameCount)
{
    fetcher_->refresh(false, false, std::stop_token());
    service_->removeTorrent("T4");
    service_->addTorrent({"T9", "Torrent.9", "hash9", "downloaded", {}, {}});

    fetcher_->markStale();
    EXPECT_TRUE(fetcher_->intervalElapsed());
    FetchResult result = fetcher_->refresh(false, false, std::stop_token());
    EXPECT_TRUE(result.updated);
    EXPECT_TRUE(fetcher_->torrentById("T9").has_value());
    EXPECT_FALSE(fetcher_->torrentById("T4").has_value());

    service_->removeTorrent("T9");
    service_->addTorrent({"T8", "Torrent.8", "hash8", "downloaded", {}, {}});
    fetcher_->refresh(true, false, std::stop_token());
    EXPECT_TRUE(fetcher_->torrentById("T8").has_value());
}

TEST_F(InventoryFetcherTest, failedPageKeepsThePreviousSnapshot)
{
    fetcher_->refresh(false, false, std::stop_token());
    service_->addTorrent({"T5", "Torrent.5", "hash5", "downloaded", {}, {}});
    service_->failNext("/torrents", 500, 1);

    EXPECT_THROW(fetcher_->refresh(true, false, std::stop_token()), ApiError);
    EXPECT_EQ(5u, fetcher_->torrents().size());
}

TEST_F(InventoryFetcherTest, rateLimitedPagesAreRetried)
{
    service_->failNext("/torrents", 429, 2);
    FetchResult result = fetcher_->refresh(false, false, std::stop_token());
    EXPECT_EQ(5u, result.torrents.size());
}

TEST_F(InventoryFetcherTest, emptyInventory)
{
    auto empty = std::make_shared<FakeDebridService>();
    APIClient client(empty, "secret", RetryPolicy{0, std::chrono::milliseconds(0)});
    InventoryFetcher fetcher(client);

    FetchResult result = fetcher.refresh(false, false, std::stop_token());
    EXPECT_TRUE(result.torrents.empty());
    EXPECT_TRUE(result.downloads.empty());
}

TEST_F(InventoryFetcherTest, snapshotLookups)
{
    fetcher_->refresh(false, false, std::stop_token());

    EXPECT_TRUE(fetcher_->hasTorrentNamed("Torrent.3"));
    EXPECT_FALSE(fetcher_->hasTorrentNamed("Torrent.30"));

    auto download = fetcher_->findDownloadByLink("https://rd.example/d/T0A");
    ASSERT_TRUE(download.has_value());
    EXPECT_EQ("https://dl.example/a.mkv", download->link);

    fetcher_->invalidateLinks({"https://rd.example/d/T0A"});
    EXPECT_FALSE(fetcher_->findDownloadByLink("https://rd.example/d/T0A").has_value());

    RemoteItem replacement;
    replacement.id = "R0";
    replacement.name = "Torrent.0";
    fetcher_->replaceTorrent("T0", replacement);
    EXPECT_FALSE(fetcher_->torrentById("T0").has_value());
    EXPECT_EQ("Torrent.0", fetcher_->torrentById("R0")->name);
    EXPECT_EQ(5u, fetcher_->torrents().size());
}
