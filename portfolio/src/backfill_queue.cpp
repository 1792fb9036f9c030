#include "backfill_queue.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

std::string to_string(JobKind kind) {
    switch (kind) {
        case JobKind::BACKFILL: return "BACKFILL";
        case JobKind::FILL_MISSING: return "FILL_MISSING";
        default: return "UNKNOWN";
    }
}

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED: return "QUEUED";
        case JobStatus::RUNNING: return "RUNNING";
        case JobStatus::DONE: return "DONE";
        case JobStatus::CANCELLED: return "CANCELLED";
        case JobStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

BackfillQueue::BackfillQueue(std::shared_ptr<SnapshotReconstructor> reconstructor)
    : reconstructor_(std::move(reconstructor))
{
    worker_ = std::thread(&BackfillQueue::worker_loop, this);
}

BackfillQueue::~BackfillQueue() {
    shutdown();
}

int64_t BackfillQueue::enqueue(JobKind kind, std::optional<Date> start, std::optional<Date> end) {
    auto job = std::make_shared<Job>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Backfill queue is shut down");
        }
        job->info.id = next_id_++;
        job->info.kind = kind;
        job->info.start = start;
        job->info.end = end;
        job->info.submitted_at = std::chrono::system_clock::now();
        queue_.push_back(job);
        jobs_[job->info.id] = job;
        prune_finished();
    }
    work_cv_.notify_one();

    spdlog::info("Queued {} job {}", to_string(kind), job->info.id);
    return job->info.id;
}

int64_t BackfillQueue::submit_backfill(const Date& start, const Date& end) {
    if (start > end) {
        throw ValidationError("Backfill start " + start.to_string() + " is after end " + end.to_string());
    }
    return enqueue(JobKind::BACKFILL, start, end);
}

int64_t BackfillQueue::submit_fill_missing() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& job : queue_) {
            if (job->info.kind == JobKind::FILL_MISSING && !job->cancel) {
                return job->info.id;
            }
        }
    }
    return enqueue(JobKind::FILL_MISSING, std::nullopt, std::nullopt);
}

bool BackfillQueue::cancel(int64_t job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw NotFoundError("Job " + std::to_string(job_id) + " not found");
    }

    auto& job = it->second;
    if (job->info.finished()) {
        return false;
    }

    job->cancel = true;
    if (job->info.status == JobStatus::QUEUED) {
        for (auto q = queue_.begin(); q != queue_.end(); ++q) {
            if ((*q)->info.id == job_id) {
                queue_.erase(q);
                break;
            }
        }
        job->info.status = JobStatus::CANCELLED;
        job->info.finished_at = std::chrono::system_clock::now();
        done_cv_.notify_all();
    }
    spdlog::info("Cancelled job {}", job_id);
    return true;
}

std::optional<JobInfo> BackfillQueue::status(int64_t job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second->info;
}

bool BackfillQueue::wait(int64_t job_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [&]() {
        auto it = jobs_.find(job_id);
        return it == jobs_.end() || it->second->info.finished();
    });
}

size_t BackfillQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// Caller holds mutex_.
void BackfillQueue::prune_finished() {
    auto it = jobs_.begin();
    while (jobs_.size() > kMaxRetainedJobs && it != jobs_.end()) {
        if (it->second->info.finished()) {
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
}

void BackfillQueue::run_job(const std::shared_ptr<Job>& job) {
    BackfillResult result;
    std::string error;
    bool failed = false;

    try {
        if (job->info.kind == JobKind::BACKFILL) {
            result = reconstructor_->backfill(*job->info.start, *job->info.end, &job->cancel);
        } else {
            result = reconstructor_->fill_missing(&job->cancel);
        }
    } catch (const std::exception& e) {
        failed = true;
        error = e.what();
        spdlog::error("{} job {} failed: {}", to_string(job->info.kind), job->info.id, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    job->info.result = result;
    job->info.error = error;
    if (failed) {
        job->info.status = JobStatus::FAILED;
    } else if (result.cancelled || job->cancel) {
        job->info.status = JobStatus::CANCELLED;
    } else {
        job->info.status = JobStatus::DONE;
    }
    job->info.finished_at = std::chrono::system_clock::now();
    done_cv_.notify_all();
}

void BackfillQueue::worker_loop() {
    spdlog::info("Backfill worker started");

    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) break;

            job = queue_.front();
            queue_.pop_front();
            job->info.status = JobStatus::RUNNING;
        }

        spdlog::info("Running {} job {}", to_string(job->info.kind), job->info.id);
        run_job(job);
    }

    spdlog::info("Backfill worker stopped");
}

void BackfillQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;

        for (auto& [id, job] : jobs_) {
            if (job->info.finished()) continue;
            job->cancel = true;
            if (job->info.status == JobStatus::QUEUED) {
                job->info.status = JobStatus::CANCELLED;
                job->info.finished_at = std::chrono::system_clock::now();
            }
        }
        queue_.clear();
    }
    work_cv_.notify_all();
    done_cv_.notify_all();

    // Concurrent callers all return only after the worker has exited.
    std::call_once(join_once_, [this]() {
        if (worker_.joinable()) worker_.join();
    });
}
