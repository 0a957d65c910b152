#pragma once

#include "persistence/persistence_adapter.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tg {

/**
 * @brief Counters describing mirrored writes
 */
struct MirrorStatistics {
    size_t enqueued = 0;
    size_t completed = 0;
    size_t failed = 0;
};

/**
 * @brief Forwards graph mutations to a PersistenceAdapter, best-effort
 *
 * In asynchronous mode a single worker thread drains a FIFO of pending
 * operations, so callers never wait on storage latency and operations reach
 * the adapter in submission order. Failures are logged to stderr and counted,
 * never rethrown.
 */
class PersistenceMirror {
public:
    using Operation = std::function<void(PersistenceAdapter&)>;

    /**
     * @param adapter Shared with the owner, which also reads from it at load time
     * @param asynchronous Run operations on a worker thread instead of inline
     */
    PersistenceMirror(std::shared_ptr<PersistenceAdapter> adapter, bool asynchronous = true);
    ~PersistenceMirror();

    PersistenceMirror(const PersistenceMirror&) = delete;
    PersistenceMirror& operator=(const PersistenceMirror&) = delete;

    /**
     * @brief Queue (or run) an operation
     * @param description Used in the failure log line
     */
    void submit(const std::string& description, Operation operation);

    void mirror_node(const GraphNode& node);
    void mirror_edge(const GraphEdge& edge);
    void mirror_node_deletion(const std::string& node_id);
    void mirror_edge_deletion(const EdgeKey& key);

    /**
     * @brief Block until every submitted operation has run
     */
    void flush();

    MirrorStatistics stats() const;

    bool is_asynchronous() const { return asynchronous_; }

    PersistenceAdapter& adapter() { return *adapter_; }

private:
    struct PendingOperation {
        std::string description;
        Operation operation;
    };

    std::shared_ptr<PersistenceAdapter> adapter_;
    bool asynchronous_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable drained_;
    std::deque<PendingOperation> queue_;
    size_t in_flight_ = 0;
    bool stopping_ = false;
    MirrorStatistics stats_;

    std::thread worker_;

    void worker_loop();
    void run(const PendingOperation& pending);
};

} // namespace tg
