#ifndef RIDESAFE_PERSISTENCE_HPP
#define RIDESAFE_PERSISTENCE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "ridesafe/logging.hpp"
#include "ridesafe/types.hpp"

namespace ridesafe {

using Record = std::variant<MonitoringSession, EmergencyIncident>;

const std::string& record_id(const Record& record);
std::string record_kind(const Record& record);

struct WriteResult {
    bool ok = true;
    std::string error;
};

// Durable store for sessions and incidents. upsert() reports failures through
// WriteResult rather than throwing. Writes carrying a sequence lower than the
// last one stored for the same id are ignored.
class Repository {
public:
    virtual ~Repository() = default;
    virtual WriteResult upsert(const Record& record, std::uint64_t sequence) = 0;
};

class InMemoryRepository : public Repository {
public:
    WriteResult upsert(const Record& record, std::uint64_t sequence) override;

    std::optional<MonitoringSession> session(const std::string& id) const;
    std::optional<EmergencyIncident> incident(const std::string& id) const;
    std::vector<MonitoringSession> sessions() const;
    std::size_t write_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> sequences_;
    std::map<std::string, MonitoringSession> sessions_;
    std::map<std::string, EmergencyIncident> incidents_;
    std::size_t writes_ = 0;
};

// One JSON document per line.
class JsonLinesRepository : public Repository {
public:
    explicit JsonLinesRepository(const std::string& path);

    WriteResult upsert(const Record& record, std::uint64_t sequence) override;

private:
    std::mutex mutex_;
    std::string path_;
    std::ofstream stream_;
    std::map<std::string, std::uint64_t> sequences_;
};

// A queued snapshot superseded by a newer one for the same id is skipped.
class AsyncRecordWriter {
public:
    explicit AsyncRecordWriter(std::shared_ptr<Repository> repository,
                               Logger logger = get_logger("AsyncRecordWriter"));
    ~AsyncRecordWriter();

    AsyncRecordWriter(const AsyncRecordWriter&) = delete;
    AsyncRecordWriter& operator=(const AsyncRecordWriter&) = delete;

    void start();
    void stop();

    void enqueue(Record record);

    WriteResult write_now(const Record& record);

    // Blocks until every record enqueued so far has been handed to the repository.
    void flush();

    std::size_t failed_writes() const;

private:
    struct Pending {
        Record record;
        std::uint64_t sequence = 0;
    };

    void run();
    std::uint64_t next_sequence(const std::string& id);
    void write(const Pending& pending);
    WriteResult upsert_guarded(const Record& record, std::uint64_t sequence);

    std::shared_ptr<Repository> repository_;
    Logger logger_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Pending> queue_;
    std::map<std::string, std::uint64_t> sequences_;
    bool writing_ = false;
    std::size_t failed_ = 0;
};

}  // namespace ridesafe

#endif  // RIDESAFE_PERSISTENCE_HPP
