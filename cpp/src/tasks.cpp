#include "ridesafe/tasks.hpp"

#include <chrono>
#include <exception>

namespace ridesafe {

TaskGroup::TaskGroup(std::string name, Logger logger)
    : name_(std::move(name)), logger_(std::move(logger)), state_(std::make_shared<State>()) {}

TaskGroup::~TaskGroup() {
    cancel();
}

bool TaskGroup::wait(State& state, double seconds) {
    std::unique_lock<std::mutex> lock(state.mutex);
    state.cv.wait_for(lock, std::chrono::duration<double>(seconds), [&state] { return state.cancelled; });
    return !state.cancelled;
}

void TaskGroup::run_guarded(const Logger& logger, const std::string& group, const std::string& task,
                            const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::exception& exc) {
        logger.error("background_task_failed", {{"group", group}, {"task", task}, {"error", exc.what()}});
    }
}

void TaskGroup::spawn_periodic(const std::string& task, double interval_s, std::function<void()> fn) {
    auto logger = logger_;
    auto group = name_;
    spawn([logger, group, task, interval_s, fn = std::move(fn)](State& state) {
        while (wait(state, interval_s)) {
            run_guarded(logger, group, task, fn);
        }
    });
}

void TaskGroup::spawn_after(const std::string& task, double delay_s, std::function<void()> fn) {
    auto logger = logger_;
    auto group = name_;
    spawn([logger, group, task, delay_s, fn = std::move(fn)](State& state) {
        if (wait(state, delay_s)) {
            run_guarded(logger, group, task, fn);
        }
    });
}

void TaskGroup::spawn(std::function<void(State&)> body) {
    {
        std::lock_guard<std::mutex> guard(state_->mutex);
        if (state_->cancelled) {
            logger_.debug("task_spawn_ignored", {{"group", name_}});
            return;
        }
    }
    reap_finished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto state = state_;
    std::thread thread([state, done, body = std::move(body)] {
        body(*state);
        done->store(true);
    });
    std::lock_guard<std::mutex> guard(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void TaskGroup::reap_finished() {
    std::lock_guard<std::mutex> guard(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskGroup::cancel() {
    {
        std::lock_guard<std::mutex> guard(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> guard(workers_mutex_);
        workers.swap(workers_);
    }
    const auto self = std::this_thread::get_id();
    for (auto& worker : workers) {
        if (!worker.thread.joinable()) {
            continue;
        }
        if (worker.thread.get_id() == self) {
            worker.thread.detach();
        } else {
            worker.thread.join();
        }
    }
}

bool TaskGroup::cancelled() const {
    std::lock_guard<std::mutex> guard(state_->mutex);
    return state_->cancelled;
}

std::size_t TaskGroup::active_tasks() const {
    std::lock_guard<std::mutex> guard(workers_mutex_);
    std::size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker.done->load()) {
            ++count;
        }
    }
    return count;
}

}  // namespace ridesafe
