#pragma once
#define FUSE_USE_VERSION 35
#include <fuse3/fuse_lowlevel.h>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <string>
#include <vector>

class FuseContext;

// Owns the FUSE session that serves a FuseContext at the mount point.
class FuseManager
{
public:
    FuseManager(const std::string &mountPoint, FuseContext &context);
    ~FuseManager();

    bool Initialize(bool debugMode);
    void Run();
    void Stop();

    // Waits up to timeout for the session loop to return, e.g. after an
    // external unmount. Returns true once it has.
    bool WaitForExit(std::chrono::milliseconds timeout);

private:
    std::string mountPoint_;
    FuseContext &context_;

    struct fuse_session *session_;
    std::thread fuseThread_;
    std::mutex exitMutex_;
    std::condition_variable exitCondition_;
    bool exitRequested_;

    void FuseLoop();
};
