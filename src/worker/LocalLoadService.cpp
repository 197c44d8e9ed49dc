#include "cacheworker/worker/LocalLoadService.h"
#include "cacheworker/common/Json.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/EventLoop.h"
#include "cacheworker/protocol/HttpRequest.h"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <sstream>
#include <thread>

namespace cacheworker {
namespace worker {

LocalLoadService::LocalLoadService(FileSystem& fs, PagedService& pages, size_t maxTrackedJobs)
    : fs_(fs),
      pages_(pages),
      maxTrackedJobs_(maxTrackedJobs),
      jobThread_("load-job"),
      jobLoop_(jobThread_.StartLoop()) {
}

LocalLoadService::~LocalLoadService() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : jobs_) {
        entry.second->cancelled = true;
    }
}

std::string LocalLoadService::FileIdFor(const std::string& backingPath) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : backingPath) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof buf, "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

const char* LocalLoadService::StateName(JobState state) {
    switch (state) {
        case JobState::kRunning: return "RUNNING";
        case JobState::kSucceeded: return "SUCCEEDED";
        case JobState::kFailed: return "FAILED";
        case JobState::kStopped: return "STOPPED";
        default: return "UNKNOWN";
    }
}

std::string LocalLoadService::Load(const std::string& path, const LoadOptions& options) {
    OpType type = options.opType().value_or(OpType::SUBMIT);
    switch (type) {
        case OpType::SUBMIT: return Submit(path, options);
        case OpType::STOP: return Stop(path);
        case OpType::PROGRESS: return Progress(path, options);
    }
    return "Unsupported load operation";
}

std::string LocalLoadService::Submit(const std::string& path, const LoadOptions& options) {
    auto job = std::make_shared<Job>(path, options);
    if (options.fileFilterPattern() && !options.fileFilterPattern()->empty()) {
        try {
            job->filter.reset(new std::regex(*options.fileFilterPattern()));
        } catch (const std::regex_error& e) {
            return "Invalid fileFilterRegx '" + *options.fileFilterPattern() + "': " + e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(path);
        if (it != jobs_.end()) {
            if (it->second->state == JobState::kRunning) {
                return "Load '" + path + "' is already running.";
            }
            finishedOrder_.remove(path);
            jobs_.erase(it);
        }
        jobs_[path] = job;
    }

    LOG_INFO << "LocalLoadService: submitted load of " << path << " " << options.ToString();
    jobLoop_->QueueInLoop([this, job]() { RunJob(job); });
    return "Load '" + path + "' is successfully submitted.";
}

std::string LocalLoadService::Stop(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(path);
    if (it == jobs_.end() || it->second->state != JobState::kRunning) {
        return "Cannot find load job for path " + path + ", it might have already been stopped or finished.";
    }
    it->second->cancelled = true;
    LOG_INFO << "LocalLoadService: stop requested for " << path;
    return "Load '" + path + "' is successfully stopped.";
}

std::string LocalLoadService::Progress(const std::string& path, const LoadOptions& options) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(path);
        if (it == jobs_.end()) {
            return "Load for path '" + path + "' cannot be found.";
        }
        job = it->second;
    }
    if (protocol::IEquals(options.progressFormat(), "JSON")) {
        return ProgressJson(*job, options.verbose());
    }
    return ProgressText(*job, options.verbose());
}

std::string LocalLoadService::ProgressText(const Job& job, bool verbose) {
    std::ostringstream ss;
    ss << "Load '" << job.path << "' progress:\n"
       << "\tState: " << StateName(job.state) << "\n"
       << "\tFiles Processed: " << job.filesProcessed.load() << " of " << job.filesTotal.load() << "\n"
       << "\tFiles Skipped: " << job.filesSkipped.load() << "\n"
       << "\tBytes Loaded: " << job.bytesLoaded.load() << "\n";
    std::lock_guard<std::mutex> lock(job.mutex);
    ss << "\tFiles Failed: " << job.failures.size() << "\n";
    if (!job.error.empty()) {
        ss << "\tError: " << job.error << "\n";
    }
    if (verbose) {
        for (const auto& failure : job.failures) {
            ss << "\t\t" << failure.path << ": " << failure.message << "\n";
        }
    }
    return ss.str();
}

std::string LocalLoadService::ProgressJson(const Job& job, bool verbose) {
    using common::JsonString;
    std::ostringstream ss;
    ss << "{\"path\":" << JsonString(job.path)
       << ",\"state\":" << JsonString(StateName(job.state))
       << ",\"filesProcessed\":" << job.filesProcessed.load()
       << ",\"filesTotal\":" << job.filesTotal.load()
       << ",\"filesSkipped\":" << job.filesSkipped.load()
       << ",\"bytesLoaded\":" << job.bytesLoaded.load();
    std::lock_guard<std::mutex> lock(job.mutex);
    ss << ",\"failureCount\":" << job.failures.size();
    if (!job.error.empty()) {
        ss << ",\"error\":" << JsonString(job.error);
    }
    if (verbose) {
        ss << ",\"failures\":[";
        for (size_t i = 0; i < job.failures.size(); ++i) {
            if (i > 0) ss << ",";
            ss << "{\"path\":" << JsonString(job.failures[i].path)
               << ",\"message\":" << JsonString(job.failures[i].message) << "}";
        }
        ss << "]";
    }
    ss << "}";
    return ss.str();
}

bool LocalLoadService::WaitForJob(const std::string& path, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_.wait_for(lock, timeout, [this, &path]() {
        auto it = jobs_.find(path);
        return it == jobs_.end() || it->second->state != JobState::kRunning;
    });
}

void LocalLoadService::FailJob(const std::shared_ptr<Job>& job, const std::string& error) {
    LOG_WARN << "LocalLoadService: load of " << job->path << " failed: " << error;
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->error = error;
    }
    Finish(job, JobState::kFailed);
}

void LocalLoadService::RunJob(const std::shared_ptr<Job>& job) {
    if (job->cancelled) {
        Finish(job, JobState::kStopped);
        return;
    }
    try {
        FileStatus root = fs_.GetStatus(job->path);
        if (root.isFolder) {
            LoadDirectory(job, root.path);
        } else {
            LoadFiles(job, {root});
        }
    } catch (const FileSystemError& e) {
        FailJob(job, e.what());
        return;
    } catch (const std::regex_error& e) {
        // Matching can give up on pathological filters.
        FailJob(job, std::string("fileFilterRegx: ") + e.what());
        return;
    }

    if (job->cancelled) {
        Finish(job, JobState::kStopped);
        return;
    }
    bool anyFailure = false;
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        anyFailure = !job->failures.empty();
    }
    Finish(job, anyFailure ? JobState::kFailed : JobState::kSucceeded);
}

// Breadth-first walk. With partialListing every directory's files are loaded
// as soon as that directory is listed; otherwise the whole tree is listed first.
void LocalLoadService::LoadDirectory(const std::shared_ptr<Job>& job, const std::string& dir) {
    std::deque<std::string> pending{dir};
    std::vector<FileStatus> collected;
    while (!pending.empty() && !job->cancelled) {
        std::string current = pending.front();
        pending.pop_front();

        std::vector<FileStatus> files;
        for (const FileStatus& status : fs_.ListStatus(current)) {
            if (status.isFolder) {
                pending.push_back(status.path);
            } else if (!job->filter || std::regex_search(status.path, *job->filter)) {
                files.push_back(status);
            }
        }
        if (job->options.partialListing()) {
            LoadFiles(job, files);
        } else {
            collected.insert(collected.end(), files.begin(), files.end());
        }
    }
    if (!job->options.partialListing()) {
        LoadFiles(job, collected);
    }
}

void LocalLoadService::LoadFiles(const std::shared_ptr<Job>& job, const std::vector<FileStatus>& files) {
    job->filesTotal += static_cast<std::int64_t>(files.size());
    for (const FileStatus& file : files) {
        if (job->cancelled) {
            return;
        }
        try {
            LoadFile(job, file);
        } catch (const FileSystemError& e) {
            RecordFailure(job, file.path, e.what());
        } catch (const PageStoreError& e) {
            RecordFailure(job, file.path, e.what());
        }
        ++job->filesProcessed;
    }
}

void LocalLoadService::LoadFile(const std::shared_ptr<Job>& job, const FileStatus& file) {
    if (job->options.loadMetadataOnly()) {
        return;
    }
    const std::string fileId = FileIdFor(file.ufsPath);
    if (job->options.skipIfExists() && pages_.LocatePage(fileId, 0)) {
        ++job->filesSkipped;
        return;
    }

    const std::int64_t pageSize = pages_.PageSize();
    std::unique_ptr<PositionReader> reader = fs_.OpenPositionRead(file.path);
    std::string page(static_cast<size_t>(pageSize), '\0');
    std::int64_t loaded = 0;
    for (std::int64_t index = 0; index * pageSize < file.length; ++index) {
        if (job->cancelled) {
            return;
        }
        std::int64_t want = std::min(pageSize, file.length - index * pageSize);
        std::int64_t n = reader->Read(index * pageSize, &page[0], want);
        if (n < 0) {
            break;
        }
        if (!pages_.WritePage(fileId, index, page.substr(0, static_cast<size_t>(n)))) {
            RecordFailure(job, file.path, "page " + std::to_string(index) + " was not written");
            return;
        }
        loaded += n;
        job->bytesLoaded += n;
        Throttle(job);
    }

    if (job->options.verify()) {
        FileStatus after = fs_.GetStatus(file.path);
        if (after.length != loaded) {
            RecordFailure(job, file.path, "verification failed: loaded " + std::to_string(loaded) +
                                          " of " + std::to_string(after.length) + " bytes");
        }
    }
}

void LocalLoadService::Throttle(const std::shared_ptr<Job>& job) {
    const auto& bandwidth = job->options.bandwidth();
    if (!bandwidth || *bandwidth <= 0) {
        return;
    }
    const double expectedSec = static_cast<double>(job->bytesLoaded) / static_cast<double>(*bandwidth);
    const auto due = job->startTime + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(expectedSec));
    while (!job->cancelled && std::chrono::steady_clock::now() < due) {
        auto remaining = due - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            remaining, std::chrono::milliseconds(100)));
    }
}

void LocalLoadService::RecordFailure(const std::shared_ptr<Job>& job, const std::string& path, const std::string& message) {
    LOG_WARN << "LocalLoadService: load of " << path << " failed: " << message;
    std::lock_guard<std::mutex> lock(job->mutex);
    job->failures.push_back(Failure{path, message});
}

void LocalLoadService::Finish(const std::shared_ptr<Job>& job, JobState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->state = state;
        auto it = jobs_.find(job->path);
        if (it != jobs_.end() && it->second == job) {
            finishedOrder_.push_back(job->path);
            EvictFinishedLocked();
        }
    }
    finished_.notify_all();
    LOG_INFO << "LocalLoadService: load of " << job->path << " finished state=" << StateName(state)
             << " files=" << job->filesProcessed.load() << " bytes=" << job->bytesLoaded.load();
}

void LocalLoadService::EvictFinishedLocked() {
    while (finishedOrder_.size() > maxTrackedJobs_) {
        jobs_.erase(finishedOrder_.front());
        finishedOrder_.pop_front();
    }
}

} // namespace worker
} // namespace cacheworker
