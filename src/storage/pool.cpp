#include "storage/pool.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace sluice::storage {

Pool::Pool(std::size_t workers, std::size_t capacity,
           std::shared_ptr<spdlog::logger> logger)
    : capacity_(std::max<std::size_t>(capacity, 1))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{
    workers = std::max<std::size_t>(workers, 1);
    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    logger_->debug("Pool started: {} workers, queue capacity {}", workers, capacity_);
}

Pool::~Pool() {
    shutdown();
}

void Pool::submit(std::unique_ptr<Dispatch> op) {
    std::unique_lock lock(mutex_);
    if (stopped_) {
        lock.unlock();
        canceled_.fetch_add(1, std::memory_order_relaxed);
        op->complete(std::make_error_code(std::errc::operation_canceled));
        return;
    }

    if (queue_.size() < capacity_ && waiting_.empty()) {
        queue_.push_back(std::move(op));
        lock.unlock();
        cv_.notify_one();
        return;
    }

    // Queue full: the caller stays suspended until a worker frees a slot.
    waiting_.push_back(std::move(op));
    if (waiting_.size() == 1) {
        logger_->debug("Pool queue full ({} queued); callers now wait for a slot",
                       queue_.size());
    }
}

std::size_t Pool::admit_waiting() {
    std::size_t admitted = 0;
    while (!waiting_.empty() && queue_.size() < capacity_) {
        queue_.push_back(std::move(waiting_.front()));
        waiting_.pop_front();
        ++admitted;
    }
    return admitted;
}

void Pool::worker_loop(std::size_t index) {
    for (;;) {
        std::unique_ptr<Dispatch> op;
        std::size_t admitted = 0;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopped_ || !queue_.empty(); });
            if (queue_.empty()) {
                return; // stopped and drained
            }
            op = std::move(queue_.front());
            queue_.pop_front();
            admitted = admit_waiting();
        }
        if (admitted > 0) {
            cv_.notify_one();
        }

        active_.fetch_add(1, std::memory_order_relaxed);

        std::error_code failure;
        if (op->ticket && op->ticket->canceled()) {
            failure = std::make_error_code(std::errc::operation_canceled);
        } else {
            try {
                op->run();
            } catch (const std::exception& e) {
                logger_->error("Pool worker {}: dispatch threw: {}", index, e.what());
                panicked_.fetch_add(1, std::memory_order_relaxed);
                failure = make_error_code(errc::pool_panic);
            } catch (...) {
                logger_->error("Pool worker {}: dispatch threw a non-standard exception",
                               index);
                panicked_.fetch_add(1, std::memory_order_relaxed);
                failure = make_error_code(errc::pool_panic);
            }

            // Cancelled while running: the result is discarded.
            if (!failure && op->ticket && op->ticket->canceled()) {
                failure = std::make_error_code(std::errc::operation_canceled);
            }
        }

        if (is_canceled(failure)) {
            canceled_.fetch_add(1, std::memory_order_relaxed);
        }
        op->complete(failure);
        op.reset();

        active_.fetch_sub(1, std::memory_order_relaxed);
        completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Pool::cancel(const std::shared_ptr<Ticket>& ticket) {
    if (!ticket) {
        return;
    }
    ticket->canceled_.store(true, std::memory_order_release);

    std::vector<std::unique_ptr<Dispatch>> removed;
    {
        std::lock_guard lock(mutex_);
        auto extract = [&](std::deque<std::unique_ptr<Dispatch>>& q) {
            auto it = std::stable_partition(q.begin(), q.end(),
                [&](const auto& op) { return op->ticket != ticket; });
            std::move(it, q.end(), std::back_inserter(removed));
            q.erase(it, q.end());
        };
        extract(queue_);
        extract(waiting_);
        admit_waiting();
    }

    if (!removed.empty()) {
        cv_.notify_all();
    }
    for (auto& op : removed) {
        canceled_.fetch_add(1, std::memory_order_relaxed);
        op->complete(std::make_error_code(std::errc::operation_canceled));
    }
}

void Pool::shutdown() {
    std::vector<std::unique_ptr<Dispatch>> removed;
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (auto* q : {&queue_, &waiting_}) {
            std::move(q->begin(), q->end(), std::back_inserter(removed));
            q->clear();
        }
    }
    cv_.notify_all();

    for (auto& op : removed) {
        canceled_.fetch_add(1, std::memory_order_relaxed);
        op->complete(std::make_error_code(std::errc::operation_canceled));
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    logger_->debug("Pool stopped: {} completed, {} panicked, {} canceled ({} discarded at shutdown)",
                   completed_.load(), panicked_.load(), canceled_.load(), removed.size());
}

Pool::Stats Pool::stats() const {
    Stats s;
    s.workers   = workers_.size();
    s.capacity  = capacity_;
    s.active    = active_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.panicked  = panicked_.load(std::memory_order_relaxed);
    s.canceled  = canceled_.load(std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    s.queued  = queue_.size();
    s.waiting = waiting_.size();
    return s;
}

bool Pool::stopped() const {
    std::lock_guard lock(mutex_);
    return stopped_;
}

} // namespace sluice::storage
