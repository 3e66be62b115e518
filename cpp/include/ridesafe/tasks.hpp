#ifndef RIDESAFE_TASKS_HPP
#define RIDESAFE_TASKS_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ridesafe/logging.hpp"

namespace ridesafe {

// Owns the background work of one session or incident. Every task waits on
// the group's cancellation signal, so cancel() stops all of them promptly.
// cancel() is idempotent and joins the workers; when invoked from one of the
// group's own tasks that worker is detached instead.
class TaskGroup {
public:
    explicit TaskGroup(std::string name, Logger logger = get_logger("TaskGroup"));
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Runs fn every interval_s until cancelled. The first run happens after one interval.
    void spawn_periodic(const std::string& task, double interval_s, std::function<void()> fn);

    // Runs fn once after delay_s unless cancelled first.
    void spawn_after(const std::string& task, double delay_s, std::function<void()> fn);

    void cancel();
    bool cancelled() const;
    std::size_t active_tasks() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // False once the group is cancelled.
    static bool wait(State& state, double seconds);
    static void run_guarded(const Logger& logger, const std::string& group, const std::string& task,
                            const std::function<void()>& fn);

    void spawn(std::function<void(State&)> body);
    void reap_finished();

    std::string name_;
    Logger logger_;
    std::shared_ptr<State> state_;
    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

}  // namespace ridesafe

#endif  // RIDESAFE_TASKS_HPP
