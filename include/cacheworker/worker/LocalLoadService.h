#pragma once

#include "cacheworker/common/noncopyable.h"
#include "cacheworker/network/EventLoopThread.h"
#include "cacheworker/worker/FileSystem.h"
#include "cacheworker/worker/LoadService.h"
#include "cacheworker/worker/PagedService.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace cacheworker {
namespace network {
class EventLoop;
}

namespace worker {

// Runs load jobs on a dedicated "load-job" event loop. A job copies every file
// under a path into the page store, page by page, under an id derived from the
// file's backing path. One job per path; finished jobs stay queryable until
// more than maxTrackedJobs have finished.
class LocalLoadService : public LoadService, common::noncopyable {
public:
    LocalLoadService(FileSystem& fs, PagedService& pages, size_t maxTrackedJobs = 128);
    ~LocalLoadService() override;

    std::string Load(const std::string& path, const LoadOptions& options) override;

    // Page-store id used for a backing path: 16 hex digits of its FNV-1a hash.
    static std::string FileIdFor(const std::string& backingPath);

    // Blocks until the job for path is no longer running or timeout expires.
    bool WaitForJob(const std::string& path, std::chrono::milliseconds timeout);

private:
    enum class JobState { kRunning, kSucceeded, kFailed, kStopped };

    struct Failure {
        std::string path;
        std::string message;
    };

    struct Job {
        Job(const std::string& p, const LoadOptions& o) : path(p), options(o) {}

        const std::string path;
        const LoadOptions options;
        std::unique_ptr<std::regex> filter;

        std::atomic<bool> cancelled{false};
        std::atomic<JobState> state{JobState::kRunning};
        std::atomic<std::int64_t> filesTotal{0};
        std::atomic<std::int64_t> filesProcessed{0};
        std::atomic<std::int64_t> filesSkipped{0};
        std::atomic<std::int64_t> bytesLoaded{0};
        std::chrono::steady_clock::time_point startTime{std::chrono::steady_clock::now()};

        mutable std::mutex mutex;
        std::vector<Failure> failures;
        std::string error;
    };

    std::string Submit(const std::string& path, const LoadOptions& options);
    std::string Stop(const std::string& path);
    std::string Progress(const std::string& path, const LoadOptions& options);

    void RunJob(const std::shared_ptr<Job>& job);
    void LoadDirectory(const std::shared_ptr<Job>& job, const std::string& dir);
    void LoadFiles(const std::shared_ptr<Job>& job, const std::vector<FileStatus>& files);
    void LoadFile(const std::shared_ptr<Job>& job, const FileStatus& file);
    void Throttle(const std::shared_ptr<Job>& job);
    void FailJob(const std::shared_ptr<Job>& job, const std::string& error);
    void RecordFailure(const std::shared_ptr<Job>& job, const std::string& path, const std::string& message);
    void Finish(const std::shared_ptr<Job>& job, JobState state);
    void EvictFinishedLocked();

    static const char* StateName(JobState state);
    static std::string ProgressText(const Job& job, bool verbose);
    static std::string ProgressJson(const Job& job, bool verbose);

    FileSystem& fs_;
    PagedService& pages_;
    const size_t maxTrackedJobs_;

    std::mutex mutex_;
    std::condition_variable finished_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;
    std::list<std::string> finishedOrder_;

    network::EventLoopThread jobThread_;
    network::EventLoop* jobLoop_;
};

} // namespace worker
} // namespace cacheworker
