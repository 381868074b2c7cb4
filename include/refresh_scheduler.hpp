// File: refresh_scheduler.hpp
#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include "namespace_engine.hpp"

namespace net = boost::asio;

// Drives a non-forced refresh on a fixed cadence so link caches stay warm
// between browses.
class RefreshScheduler
{
public:
    RefreshScheduler(NamespaceEngine &engine, std::chrono::seconds interval);
    ~RefreshScheduler();

    // Starts the timer loop on its own thread.
    void Start();

    // Cancels the timer, aborts an in-flight refresh and joins the thread.
    void Stop();

    // Runs one refresh and returns the delay before the next one: the
    // interval after success, a doubling backoff (1s..32s) after a failure.
    std::chrono::seconds RunOnce(std::stop_token stop);

private:
    void Schedule(std::chrono::seconds delay);

    NamespaceEngine &engine_;
    std::chrono::seconds interval_;
    std::chrono::seconds retryDelay_{1};

    net::io_context ioc_;
    net::steady_timer timer_;
    std::jthread thread_;
    std::stop_source stopSource_;
    std::atomic<bool> shouldRun_{false};
};
