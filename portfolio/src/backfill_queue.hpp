#pragma once

#include "snapshots.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class JobKind {
    BACKFILL,
    FILL_MISSING
};

enum class JobStatus {
    QUEUED,
    RUNNING,
    DONE,
    CANCELLED,
    FAILED
};

std::string to_string(JobKind kind);
std::string to_string(JobStatus status);

struct JobInfo {
    int64_t id = 0;
    JobKind kind = JobKind::FILL_MISSING;
    JobStatus status = JobStatus::QUEUED;
    std::optional<Date> start;
    std::optional<Date> end;
    BackfillResult result;
    std::string error;
    std::chrono::system_clock::time_point submitted_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;

    bool finished() const {
        return status == JobStatus::DONE || status == JobStatus::CANCELLED ||
               status == JobStatus::FAILED;
    }
};

// Single worker running backfill jobs in submission order. Cancelling a
// running job stops it at the next date boundary.
class BackfillQueue {
public:
    explicit BackfillQueue(std::shared_ptr<SnapshotReconstructor> reconstructor);
    ~BackfillQueue();

    BackfillQueue(const BackfillQueue&) = delete;
    BackfillQueue& operator=(const BackfillQueue&) = delete;

    int64_t submit_backfill(const Date& start, const Date& end);
    // Reuses an already queued fill-missing job when there is one.
    int64_t submit_fill_missing();

    bool cancel(int64_t job_id);
    std::optional<JobInfo> status(int64_t job_id) const;
    bool wait(int64_t job_id, std::chrono::milliseconds timeout);
    size_t pending() const;

    void shutdown();

private:
    struct Job {
        JobInfo info;
        std::atomic<bool> cancel{false};
    };

    static constexpr size_t kMaxRetainedJobs = 500;

    std::shared_ptr<SnapshotReconstructor> reconstructor_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::deque<std::shared_ptr<Job>> queue_;
    std::map<int64_t, std::shared_ptr<Job>> jobs_;
    int64_t next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;
    std::once_flag join_once_;

    int64_t enqueue(JobKind kind, std::optional<Date> start, std::optional<Date> end);
    void worker_loop();
    void run_job(const std::shared_ptr<Job>& job);
    void prune_finished();
};
