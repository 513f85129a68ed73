/**
 * @file task_group.h
 * @brief Bounded-concurrency fan-out with a full join and an optional deadline
 *
 * Used for both the certificate source fan-out and the liveness probe
 * fan-out. A TaskGroup runs its tasks on at most N worker threads and
 * waits for every task (success or failure) before returning. When a
 * deadline passes first, the group is cancelled: tasks that have not
 * finished are reported as ABANDONED and whatever they produce later is
 * discarded.
 *
 * Workers write outcomes only through the group's mutex, so callers get
 * a consistent snapshot without sharing any collection with the workers.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace certstalker::utils {

/**
 * @brief Shared cancellation flag handed to every task of a run
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

    /**
     * @brief Sleep in short slices, waking early on cancellation
     * @return false if the token was cancelled before the sleep completed
     */
    bool sleepFor(std::chrono::milliseconds duration) const {
        auto until = std::chrono::steady_clock::now() + duration;
        while (!isCancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= until) {
                return true;
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(
                until - now, std::chrono::milliseconds(50));
            std::this_thread::sleep_for(slice);
        }
        return false;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Counts TaskGroup worker threads still alive in the process
 *
 * A worker abandoned at a deadline keeps running until its current task
 * returns. The program waits on this before static destruction so that no
 * worker logs or touches an event loop after main() has returned.
 */
class WorkerTracker {
public:
    /// Never destroyed: late workers may still report after main() returns
    static WorkerTracker& instance() {
        static WorkerTracker* tracker = new WorkerTracker();
        return *tracker;
    }

    void started() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++running_;
    }

    void finished() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ > 0 && --running_ == 0) {
            cv_.notify_all();
        }
    }

    size_t running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    /**
     * @brief Wait until no worker is alive
     * @return false if workers were still running when timeout expired
     */
    bool waitForIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return running_ == 0; });
    }

private:
    WorkerTracker() = default;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t running_ = 0;
};

/// Completion state of one task
enum class TaskState {
    COMPLETED,  ///< Task returned a value
    FAILED,     ///< Task threw; error holds the message
    ABANDONED   ///< Deadline passed before the task finished
};

template <typename R>
struct TaskOutcome {
    TaskState state = TaskState::ABANDONED;
    std::optional<R> value;
    std::string error;
};

/**
 * @brief Fixed-size worker pool over a known list of tasks
 *
 * Usage:
 * @code
 *   TaskGroup<int> group(4);
 *   group.add([](const CancellationToken&) { return 42; });
 *   auto outcomes = group.run(std::nullopt);
 * @endcode
 */
template <typename R>
class TaskGroup {
public:
    using Task = std::function<R(const CancellationToken&)>;
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    /**
     * @param concurrency Maximum number of tasks running at once (clamped to >= 1)
     * @param token Cancellation token shared with the tasks
     */
    explicit TaskGroup(size_t concurrency, CancellationToken token = CancellationToken())
        : concurrency_(concurrency == 0 ? 1 : concurrency),
          state_(std::make_shared<State>()) {
        state_->token = token;
    }

    /** @brief Queue a task; must be called before run() */
    void add(Task task) {
        state_->tasks.push_back(std::move(task));
    }

    size_t size() const { return state_->tasks.size(); }

    /**
     * @brief Run every queued task and wait for all of them or the deadline
     * @param deadline Optional absolute deadline
     * @return One outcome per task, in the order tasks were added
     */
    std::vector<TaskOutcome<R>> run(Deadline deadline) {
        auto state = state_;
        size_t total = state->tasks.size();
        state->outcomes.assign(total, TaskOutcome<R>{});
        if (total == 0) {
            return {};
        }

        size_t workers = std::min(concurrency_, total);
        for (size_t i = 0; i < workers; ++i) {
            // Workers own the state so that abandoned tasks never touch a dead group.
            // The state (and every collaborator the tasks captured) is released
            // before the worker reports itself finished.
            WorkerTracker::instance().started();
            std::thread([state]() mutable {
                workerLoop(std::move(state));
                WorkerTracker::instance().finished();
            }).detach();
        }

        std::unique_lock<std::mutex> lock(state->mutex);
        auto allDone = [&state, total]() { return state->finished == total; };
        if (deadline.has_value()) {
            if (!state->cv.wait_until(lock, *deadline, allDone)) {
                state->token.cancel();
            }
        } else {
            state->cv.wait(lock, allDone);
        }
        state->closed = true;
        return state->outcomes;
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<Task> tasks;
        std::vector<TaskOutcome<R>> outcomes;
        size_t next = 0;
        size_t finished = 0;
        bool closed = false;
        CancellationToken token;
    };

    static void workerLoop(std::shared_ptr<State> state) {
        while (true) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->closed || state->next >= state->tasks.size()) {
                    return;
                }
                if (state->token.isCancelled()) {
                    // Tasks never started count as finished, left ABANDONED
                    state->finished += state->tasks.size() - state->next;
                    state->next = state->tasks.size();
                    state->cv.notify_all();
                    return;
                }
                index = state->next++;
            }

            TaskOutcome<R> outcome;
            try {
                outcome.value = state->tasks[index](state->token);
                outcome.state = TaskState::COMPLETED;
            } catch (const std::exception& e) {
                outcome.state = TaskState::FAILED;
                outcome.error = e.what();
            } catch (...) {
                outcome.state = TaskState::FAILED;
                outcome.error = "unknown error";
            }

            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) {
                return;
            }
            state->outcomes[index] = std::move(outcome);
            ++state->finished;
            state->cv.notify_all();
        }
    }

    size_t concurrency_;
    std::shared_ptr<State> state_;
};

} // namespace certstalker::utils
