#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace sluice::storage {

// ── Watch ────────────────────────────────────────────────────────────────────
//
// Per-key wait/notify registry of one Map.  Lets a coroutine suspend until a
// key is next written instead of polling it:
//
//   auto waiter = map->watch("room:42");       // registered here
//   co_await map->insert("room:42", payload);  // elsewhere
//   auto ec = co_await waiter->wait();         // resolves with success
//
// Registration is complete once watch() returns, so a write that happens
// between watch() and wait() is still delivered.  A write that completed
// before watch() is never delivered.  Each Waiter resolves at most once.
//
// Thread-safe.  notify() is called on pool workers after a write is applied.

class Watch {
public:
    class Waiter {
    public:
        class Completion;

        Waiter() = default;
        ~Waiter();

        Waiter(const Waiter&)            = delete;
        Waiter& operator=(const Waiter&) = delete;

        // Suspend until notified.  Returns success on a write, or
        // operation_canceled if the registry was shut down.  Only one
        // wait() may be outstanding per Waiter.
        boost::asio::awaitable<std::error_code> wait();

        [[nodiscard]] bool resolved() const;

    private:
        friend class Watch;

        void resolve(std::error_code ec);

        mutable std::mutex mutex_;
        bool resolved_ = false;
        std::error_code result_;
        std::unique_ptr<Completion> completion_;
    };

    Watch() = default;
    ~Watch();

    Watch(const Watch&)            = delete;
    Watch& operator=(const Watch&) = delete;

    // Waiter resolved by the next write to exactly `key`.
    [[nodiscard]] std::shared_ptr<Waiter> watch(std::string_view key);

    // Waiter resolved by the next write to any key starting with `prefix`.
    [[nodiscard]] std::shared_ptr<Waiter> watch_prefix(std::string_view prefix);

    // Resolve and forget every waiter registered for `key`, exact or by
    // prefix.  Returns how many were woken.
    std::size_t notify(std::string_view key);

    // Resolve every pending waiter with operation_canceled.  Later watch()
    // calls return waiters that are already canceled.
    void cancel_all();

    [[nodiscard]] std::size_t pending() const;

private:
    using Waiters = std::vector<std::shared_ptr<Waiter>>;

    std::shared_ptr<Waiter> enroll(Waiters& list);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Waiters> keys_;
    std::map<std::string, Waiters, std::less<>> prefixes_;
    bool closed_ = false;
};

} // namespace sluice::storage
