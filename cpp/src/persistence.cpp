#include "ridesafe/persistence.hpp"

#include <stdexcept>

#include "ridesafe/serialization.hpp"

namespace ridesafe {

const std::string& record_id(const Record& record) {
    return std::visit([](const auto& value) -> const std::string& { return value.id; }, record);
}

std::string record_kind(const Record& record) {
    return std::holds_alternative<MonitoringSession>(record) ? "monitoring_session" : "emergency_incident";
}

WriteResult InMemoryRepository::upsert(const Record& record, std::uint64_t sequence) {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto& id = record_id(record);
    auto it = sequences_.find(id);
    if (it != sequences_.end() && it->second > sequence) {
        return {};
    }
    sequences_[id] = sequence;
    if (const auto* session = std::get_if<MonitoringSession>(&record)) {
        sessions_[id] = *session;
    } else {
        incidents_[id] = std::get<EmergencyIncident>(record);
    }
    ++writes_;
    return {};
}

std::optional<MonitoringSession> InMemoryRepository::session(const std::string& id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EmergencyIncident> InMemoryRepository::incident(const std::string& id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = incidents_.find(id);
    if (it == incidents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MonitoringSession> InMemoryRepository::sessions() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<MonitoringSession> result;
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::size_t InMemoryRepository::write_count() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return writes_;
}

JsonLinesRepository::JsonLinesRepository(const std::string& path)
    : path_(path), stream_(path, std::ios::app) {
    if (!stream_) {
        throw std::runtime_error("Unable to open record log: " + path);
    }
}

WriteResult JsonLinesRepository::upsert(const Record& record, std::uint64_t sequence) {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto& id = record_id(record);
    auto it = sequences_.find(id);
    if (it != sequences_.end() && it->second > sequence) {
        return {};
    }
    const std::string document = std::visit([](const auto& value) { return to_json(value); }, record);
    stream_ << "{\"sequence\":" << sequence << "," << document.substr(1) << "\n";
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        return WriteResult{false, "write to " + path_ + " failed"};
    }
    sequences_[id] = sequence;
    return {};
}

AsyncRecordWriter::AsyncRecordWriter(std::shared_ptr<Repository> repository, Logger logger)
    : repository_(std::move(repository)), logger_(std::move(logger)) {
    if (!repository_) {
        throw std::invalid_argument("AsyncRecordWriter requires a repository");
    }
}

AsyncRecordWriter::~AsyncRecordWriter() {
    stop();
}

void AsyncRecordWriter::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&AsyncRecordWriter::run, this);
}

void AsyncRecordWriter::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::uint64_t AsyncRecordWriter::next_sequence(const std::string& id) {
    return ++sequences_[id];
}

void AsyncRecordWriter::enqueue(Record record) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        const auto sequence = next_sequence(record_id(record));
        queue_.push_back(Pending{std::move(record), sequence});
    }
    cv_.notify_one();
    if (!running_) {
        // Without a worker, drain inline so records are never stranded.
        flush();
    }
}

WriteResult AsyncRecordWriter::write_now(const Record& record) {
    std::uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        sequence = next_sequence(record_id(record));
    }
    WriteResult result = upsert_guarded(record, sequence);
    if (!result.ok) {
        std::lock_guard<std::mutex> guard(mutex_);
        ++failed_;
    }
    return result;
}

WriteResult AsyncRecordWriter::upsert_guarded(const Record& record, std::uint64_t sequence) {
    try {
        return repository_->upsert(record, sequence);
    } catch (const std::exception& exc) {
        return WriteResult{false, exc.what()};
    }
}

void AsyncRecordWriter::write(const Pending& pending) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = sequences_.find(record_id(pending.record));
        if (it != sequences_.end() && it->second > pending.sequence) {
            // A newer snapshot of the same record is already queued or written.
            bool newer_queued = false;
            for (const auto& queued : queue_) {
                if (record_id(queued.record) == record_id(pending.record)) {
                    newer_queued = true;
                    break;
                }
            }
            if (newer_queued) {
                return;
            }
        }
    }
    WriteResult result = upsert_guarded(pending.record, pending.sequence);
    if (!result.ok) {
        logger_.error("record_write_failed", {{"kind", record_kind(pending.record)},
                                              {"id", record_id(pending.record)},
                                              {"error", result.error}});
        std::lock_guard<std::mutex> guard(mutex_);
        ++failed_;
    }
}

void AsyncRecordWriter::run() {
    logger_.info("record_writer_started");
    while (true) {
        Pending pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) {
                break;
            }
            pending = std::move(queue_.front());
            queue_.pop_front();
            writing_ = true;
        }
        write(pending);
        {
            std::lock_guard<std::mutex> guard(mutex_);
            writing_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
    logger_.info("record_writer_stopped");
}

void AsyncRecordWriter::flush() {
    if (running_) {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return (queue_.empty() && !writing_) || !running_; });
        if (queue_.empty() && !writing_) {
            return;
        }
    }
    // No worker: drain on the caller's thread.
    while (true) {
        Pending pending;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (queue_.empty()) {
                return;
            }
            pending = std::move(queue_.front());
            queue_.pop_front();
        }
        write(pending);
    }
}

std::size_t AsyncRecordWriter::failed_writes() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return failed_;
}

}  // namespace ridesafe
