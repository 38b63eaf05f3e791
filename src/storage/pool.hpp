#pragma once

#include "common/error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace sluice::storage {

// ── Pool ─────────────────────────────────────────────────────────────────────
//
// Fixed set of worker threads that run blocking engine calls off the
// scheduler's threads.  Each dispatch is awaited by the calling coroutine;
// its completion is posted back to that coroutine's executor.
//
//   auto [ec, value] = co_await pool.query<std::string>(
//       [&](std::string& out) { return blocking_get(key, out); });
//
// Backpressure: at most `capacity` dispatches are queued for the workers.
// Further callers stay suspended, in arrival order, until a slot frees up;
// no scheduler thread ever blocks on a full queue.
//
// Failure containment: an exception escaping a body is caught on the worker,
// logged, counted and reported to its caller as errc::pool_panic.  The worker
// keeps serving the queue.
//
// Cancellation: dispatches submitted with a Ticket can be cancelled as a
// group.  Queued ones are removed and complete with operation_canceled; a
// running one is not preempted, its result is discarded and it too completes
// with operation_canceled.
//
// Thread-safe.  The destructor (or shutdown()) must not run on a worker.

class Pool {
public:
    // Identifies a group of dispatches that are cancelled together.
    class Ticket {
    public:
        [[nodiscard]] bool canceled() const noexcept {
            return canceled_.load(std::memory_order_acquire);
        }

    private:
        friend class Pool;
        std::atomic<bool> canceled_{false};
    };

    struct Stats {
        std::size_t workers   = 0;
        std::size_t capacity  = 0;
        std::size_t queued    = 0; // admitted, not yet picked up by a worker
        std::size_t waiting   = 0; // suspended callers beyond capacity
        std::size_t active    = 0; // running on a worker right now
        uint64_t    completed = 0;
        uint64_t    panicked  = 0;
        uint64_t    canceled  = 0;
    };

    // Starts `workers` threads immediately.
    Pool(std::size_t workers, std::size_t capacity,
         std::shared_ptr<spdlog::logger> logger = {});

    ~Pool();

    Pool(const Pool&)            = delete;
    Pool& operator=(const Pool&) = delete;

    // Run `body` on a worker and return its status and produced value.
    // `body` has the signature std::error_code(T&).  When the status is not
    // success the value is whatever the body left in it.
    template <typename T, typename Fn>
    boost::asio::awaitable<std::tuple<std::error_code, T>>
    query(Fn body, std::shared_ptr<Ticket> ticket = {});

    // Run `body` on a worker and return its status.
    // `body` has the signature std::error_code().
    template <typename Fn>
    boost::asio::awaitable<std::error_code>
    execute(Fn body, std::shared_ptr<Ticket> ticket = {});

    // Cancel every queued or running dispatch submitted with `ticket`.
    void cancel(const std::shared_ptr<Ticket>& ticket);

    // Stop accepting work, cancel everything queued and join the workers.
    // Running bodies finish first.  Later dispatches complete immediately with
    // operation_canceled.  Idempotent.
    void shutdown();

    [[nodiscard]] Stats stats() const;

    [[nodiscard]] bool stopped() const;

private:
    // Type-erased dispatch: a blocking body plus the awaiting handler.
    class Dispatch {
    public:
        explicit Dispatch(std::shared_ptr<Ticket> t) : ticket(std::move(t)) {}
        virtual ~Dispatch() = default;

        // Runs the body on the calling (worker) thread.  May throw.
        virtual void run() = 0;

        // Posts the completion.  A non-empty `failure` replaces the body's
        // own status and value.
        virtual void complete(std::error_code failure) = 0;

        std::shared_ptr<Ticket> ticket;
    };

    template <typename T, typename Fn, typename Handler>
    class Operation;

    void submit(std::unique_ptr<Dispatch> op);
    void worker_loop(std::size_t index);

    // Moves suspended callers into free queue slots.  Caller holds mutex_.
    std::size_t admit_waiting();

    const std::size_t capacity_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Dispatch>> queue_;
    std::deque<std::unique_ptr<Dispatch>> waiting_;
    bool stopped_ = false;

    std::vector<std::thread> workers_;

    std::atomic<std::size_t> active_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> panicked_{0};
    std::atomic<uint64_t> canceled_{0};
};

// ── Operation ────────────────────────────────────────────────────────────────
// Binds one body to the handler of the coroutine awaiting it.  Holds outstanding
// work on the handler's executor so its io_context keeps running while the
// body is queued or running.

template <typename T, typename Fn, typename Handler>
class Pool::Operation final : public Pool::Dispatch {
public:
    Operation(Fn body, Handler handler, std::shared_ptr<Ticket> ticket)
        : Dispatch(std::move(ticket))
        , body_(std::move(body))
        , handler_(std::move(handler))
        , work_(boost::asio::make_work_guard(handler_))
    {}

    void run() override {
        if constexpr (std::is_void_v<T>) {
            status_ = body_();
        } else {
            status_ = body_(value_);
        }
    }

    void complete(std::error_code failure) override {
        auto ex = work_.get_executor();
        if constexpr (std::is_void_v<T>) {
            const std::error_code ec = failure ? failure : status_;
            boost::asio::post(ex,
                [handler = std::move(handler_), ec]() mutable {
                    handler(ec);
                });
        } else {
            auto args = failure
                ? std::make_tuple(failure, T{})
                : std::make_tuple(status_, std::move(value_));
            boost::asio::post(ex,
                [handler = std::move(handler_), args = std::move(args)]() mutable {
                    std::apply(std::move(handler), std::move(args));
                });
        }
        work_.reset();
    }

private:
    struct Empty {};
    using Value = std::conditional_t<std::is_void_v<T>, Empty, T>;

    Fn body_;
    Handler handler_;
    decltype(boost::asio::make_work_guard(std::declval<Handler&>())) work_;
    std::error_code status_;
    Value value_{};
};

template <typename T, typename Fn>
boost::asio::awaitable<std::tuple<std::error_code, T>>
Pool::query(Fn body, std::shared_ptr<Ticket> ticket) {
    using Token = decltype(boost::asio::use_awaitable);
    co_return co_await boost::asio::async_initiate<Token, void(std::error_code, T)>(
        [this, ticket](auto handler, Fn fn) {
            using Handler = decltype(handler);
            submit(std::make_unique<Operation<T, Fn, Handler>>(
                std::move(fn), std::move(handler), ticket));
        },
        boost::asio::use_awaitable, std::move(body));
}

template <typename Fn>
boost::asio::awaitable<std::error_code>
Pool::execute(Fn body, std::shared_ptr<Ticket> ticket) {
    using Token = decltype(boost::asio::use_awaitable);
    co_return co_await boost::asio::async_initiate<Token, void(std::error_code)>(
        [this, ticket](auto handler, Fn fn) {
            using Handler = decltype(handler);
            submit(std::make_unique<Operation<void, Fn, Handler>>(
                std::move(fn), std::move(handler), ticket));
        },
        boost::asio::use_awaitable, std::move(body));
}

} // namespace sluice::storage
