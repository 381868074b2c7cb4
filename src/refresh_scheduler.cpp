// File: refresh_scheduler.cpp
#include "refresh_scheduler.hpp"
#include <algorithm>
#include "errors.hpp"
#include "logger.hpp"

RefreshScheduler::RefreshScheduler(NamespaceEngine &engine, std::chrono::seconds interval)
    : engine_(engine), interval_(interval), timer_(ioc_)
{
}

RefreshScheduler::~RefreshScheduler()
{
    Stop();
}

void RefreshScheduler::Start()
{
    if (shouldRun_.exchange(true))
        return;

    Logger::Log(LogLevel::DEBUG, "RefreshScheduler::Start: refreshing every " + std::to_string(interval_.count()) + " seconds");
    Schedule(interval_);
    thread_ = std::jthread([this]()
                           { ioc_.run(); });
}

void RefreshScheduler::Stop()
{
    if (!shouldRun_.exchange(false))
        return;

    Logger::Log(LogLevel::DEBUG, "RefreshScheduler::Stop() called.");
    stopSource_.request_stop();
    net::post(ioc_, [this]()
              { timer_.cancel(); });
    ioc_.stop();
    if (thread_.joinable())
        thread_.join();
}

std::chrono::seconds RefreshScheduler::RunOnce(std::stop_token stop)
{
    try
    {
        engine_.refresh(false, stop);
        retryDelay_ = std::chrono::seconds(1);
        return interval_;
    }
    catch (const ApiError &ex)
    {
        Logger::Log(LogLevel::ERROR, "RefreshScheduler: refresh failed: " + std::string(ex.what()));
    }
    catch (const RuleFileError &ex)
    {
        Logger::Log(LogLevel::ERROR, "RefreshScheduler: sorting file not applied: " + std::string(ex.what()));
    }

    std::chrono::seconds delay = retryDelay_;
    Logger::Log(LogLevel::INFO, "RefreshScheduler: retrying refresh in " + std::to_string(delay.count()) + " seconds...");
    retryDelay_ = std::min(retryDelay_ * 2, std::chrono::seconds(32));
    return delay;
}

void RefreshScheduler::Schedule(std::chrono::seconds delay)
{
    if (!shouldRun_)
        return;

    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code &ec)
                      {
        if (ec || !shouldRun_)
            return;

        std::chrono::seconds next = interval_;
        try
        {
            next = RunOnce(stopSource_.get_token());
        }
        catch (const OperationCancelledError &)
        {
            return;
        }
        Schedule(next); });
}
