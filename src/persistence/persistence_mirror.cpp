#include "persistence/persistence_mirror.hpp"
#include <iostream>

namespace tg {

PersistenceMirror::PersistenceMirror(std::shared_ptr<PersistenceAdapter> adapter, bool asynchronous)
    : adapter_(std::move(adapter)), asynchronous_(asynchronous) {
    if (!adapter_) {
        throw std::invalid_argument("PersistenceMirror requires an adapter");
    }
    if (asynchronous_) {
        worker_ = std::thread(&PersistenceMirror::worker_loop, this);
    }
}

PersistenceMirror::~PersistenceMirror() {
    if (!asynchronous_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PersistenceMirror::submit(const std::string& description, Operation operation) {
    PendingOperation pending{description, std::move(operation)};

    if (!asynchronous_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.enqueued++;
        }
        run(pending);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(pending));
        stats_.enqueued++;
    }
    work_available_.notify_one();
}

void PersistenceMirror::mirror_node(const GraphNode& node) {
    submit("upsert node " + node.id,
           [node](PersistenceAdapter& adapter) { adapter.upsert_node(node); });
}

void PersistenceMirror::mirror_edge(const GraphEdge& edge) {
    submit("upsert edge " + edge.source_id + " -> " + edge.target_id +
               " (" + to_string(edge.relationship) + ")",
           [edge](PersistenceAdapter& adapter) { adapter.upsert_edge(edge); });
}

void PersistenceMirror::mirror_node_deletion(const std::string& node_id) {
    submit("delete node " + node_id,
           [node_id](PersistenceAdapter& adapter) { adapter.delete_node(node_id); });
}

void PersistenceMirror::mirror_edge_deletion(const EdgeKey& key) {
    submit("delete edge " + key.source_id + " -> " + key.target_id +
               " (" + to_string(key.relationship) + ")",
           [key](PersistenceAdapter& adapter) {
               adapter.delete_edge(key.source_id, key.target_id, key.relationship);
           });
}

void PersistenceMirror::flush() {
    if (!asynchronous_) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

MirrorStatistics PersistenceMirror::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void PersistenceMirror::worker_loop() {
    while (true) {
        PendingOperation pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            // Pending writes are drained before the worker exits
            if (queue_.empty()) {
                return;
            }

            pending = std::move(queue_.front());
            queue_.pop_front();
            in_flight_++;
        }

        run(pending);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_--;
        }
        drained_.notify_all();
    }
}

void PersistenceMirror::run(const PendingOperation& pending) {
    bool ok = true;
    try {
        pending.operation(*adapter_);
    } catch (const std::exception& e) {
        ok = false;
        std::cerr << "Warning: failed to persist " << pending.description
                  << " to " << adapter_->get_backend_name() << ": " << e.what() << "\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        stats_.completed++;
    } else {
        stats_.failed++;
    }
}

} // namespace tg
