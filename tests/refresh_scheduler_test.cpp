// File: refresh_scheduler_test.cpp
#include <memory>
#include "fake_debrid_service.h"
#include "refresh_scheduler.hpp"
#include "sandbox.h"

class RefreshSchedulerTest : public SandboxedTest
{
protected:
    void SetUp() override
    {
        SandboxedTest::SetUp();
        service_ = std::make_shared<FakeDebridService>();
        service_->addTorrent({"T1", "Show.S01", "h1", "downloaded", {"https://rd.example/d/AAA"}, {{1, "/a.mkv", 10, 1}}});

        EngineSettings settings;
        settings.apiKey = "secret";
        settings.sortFile = sandboxPath("sorting.txt");
        settings.ruleDebounce = std::chrono::seconds(0);
        settings.retry = RetryPolicy{0, std::chrono::milliseconds(0)};
        settings.fetcher.refreshInterval = std::chrono::seconds(3600);
        engine_ = std::make_unique<NamespaceEngine>(service_, settings);
    }

    std::shared_ptr<FakeDebridService> service_;
    std::unique_ptr<NamespaceEngine> engine_;
};

TEST_F(RefreshSchedulerTest, successWaitsTheFullInterval)
{
    RefreshScheduler scheduler(*engine_, std::chrono::seconds(60));
    EXPECT_EQ(std::chrono::seconds(60), scheduler.RunOnce(std::stop_token()));
    EXPECT_TRUE(engine_->folderExists(VirtualPath::Folder("/shows/Show.S01/")));
}

TEST_F(RefreshSchedulerTest, failuresBackOffAndResetOnSuccess)
{
    RefreshScheduler scheduler(*engine_, std::chrono::seconds(60));
    service_->failNext("/downloads", 500, 3);

    EXPECT_EQ(std::chrono::seconds(1), scheduler.RunOnce(std::stop_token()));
    EXPECT_EQ(std::chrono::seconds(2), scheduler.RunOnce(std::stop_token()));
    EXPECT_EQ(std::chrono::seconds(4), scheduler.RunOnce(std::stop_token()));
    EXPECT_EQ(std::chrono::seconds(60), scheduler.RunOnce(std::stop_token()));

    service_->failNext("/downloads", 500, 1);
    EXPECT_EQ(std::chrono::seconds(1), scheduler.RunOnce(std::stop_token()));
}

TEST_F(RefreshSchedulerTest, backoffIsCapped)
{
    RefreshScheduler scheduler(*engine_, std::chrono::seconds(60));
    service_->failNext("/downloads", 500, 8);

    std::chrono::seconds last{0};
    for (int i = 0; i < 8; ++i)
        last = scheduler.RunOnce(std::stop_token());
    EXPECT_EQ(std::chrono::seconds(32), last);
}

TEST_F(RefreshSchedulerTest, rejectedRulesAreRetried)
{
    writeFile(sandboxPath("sorting.txt"), "/bad == (unclosed\n");
    EngineSettings settings;
    settings.apiKey = "secret";
    settings.sortFile = sandboxPath("sorting.txt");
    settings.strictRules = true;
    NamespaceEngine strict(service_, settings);

    RefreshScheduler scheduler(strict, std::chrono::seconds(60));
    EXPECT_EQ(std::chrono::seconds(1), scheduler.RunOnce(std::stop_token()));
    EXPECT_EQ(0, service_->count("GET", "/torrents"));
}

TEST_F(RefreshSchedulerTest, stopsPromptlyWhileWaiting)
{
    RefreshScheduler scheduler(*engine_, std::chrono::seconds(3600));
    scheduler.Start();
    scheduler.Stop();
    // Stopping twice is harmless
    scheduler.Stop();
    EXPECT_EQ(0, service_->count("GET", "/downloads"));
}
