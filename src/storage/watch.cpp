#include "storage/watch.hpp"

#include <utility>

#include <boost/asio/async_result.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace sluice::storage {

// ── Waiter ───────────────────────────────────────────────────────────────────

// The suspended wait() handler, erased so the Waiter need not be a template.
class Watch::Waiter::Completion {
public:
    virtual ~Completion() = default;
    virtual void post(std::error_code ec) = 0;
};

namespace {

template <typename Handler>
class HandlerCompletion final : public Watch::Waiter::Completion {
public:
    explicit HandlerCompletion(Handler handler)
        : handler_(std::move(handler))
        , work_(boost::asio::make_work_guard(handler_))
    {}

    void post(std::error_code ec) override {
        auto ex = work_.get_executor();
        boost::asio::post(ex,
            [handler = std::move(handler_), ec]() mutable {
                handler(ec);
            });
        work_.reset();
    }

private:
    Handler handler_;
    decltype(boost::asio::make_work_guard(std::declval<Handler&>())) work_;
};

} // anonymous namespace

Watch::Waiter::~Waiter() = default;

boost::asio::awaitable<std::error_code> Watch::Waiter::wait() {
    using Token = decltype(boost::asio::use_awaitable);
    co_return co_await boost::asio::async_initiate<Token, void(std::error_code)>(
        [this](auto handler) {
            using Handler = decltype(handler);
            auto completion = std::make_unique<HandlerCompletion<Handler>>(std::move(handler));

            std::unique_lock lock(mutex_);
            if (resolved_) {
                const auto ec = result_;
                lock.unlock();
                completion->post(ec);
                return;
            }
            if (completion_) {
                lock.unlock();
                completion->post(std::make_error_code(std::errc::operation_in_progress));
                return;
            }
            completion_ = std::move(completion);
        },
        boost::asio::use_awaitable);
}

bool Watch::Waiter::resolved() const {
    std::lock_guard lock(mutex_);
    return resolved_;
}

void Watch::Waiter::resolve(std::error_code ec) {
    std::unique_ptr<Completion> completion;
    {
        std::lock_guard lock(mutex_);
        if (resolved_) {
            return;
        }
        resolved_ = true;
        result_ = ec;
        completion = std::move(completion_);
    }
    if (completion) {
        completion->post(ec);
    }
}

// ── Registry ─────────────────────────────────────────────────────────────────

Watch::~Watch() {
    cancel_all();
}

std::shared_ptr<Watch::Waiter> Watch::enroll(Waiters& list) {
    auto waiter = std::make_shared<Waiter>();
    list.push_back(waiter);
    return waiter;
}

std::shared_ptr<Watch::Waiter> Watch::watch(std::string_view key) {
    std::unique_lock lock(mutex_);
    if (closed_) {
        lock.unlock();
        auto waiter = std::make_shared<Waiter>();
        waiter->resolve(std::make_error_code(std::errc::operation_canceled));
        return waiter;
    }
    return enroll(keys_[std::string(key)]);
}

std::shared_ptr<Watch::Waiter> Watch::watch_prefix(std::string_view prefix) {
    std::unique_lock lock(mutex_);
    if (closed_) {
        lock.unlock();
        auto waiter = std::make_shared<Waiter>();
        waiter->resolve(std::make_error_code(std::errc::operation_canceled));
        return waiter;
    }
    auto it = prefixes_.find(prefix);
    if (it == prefixes_.end()) {
        it = prefixes_.emplace(std::string(prefix), Waiters{}).first;
    }
    return enroll(it->second);
}

std::size_t Watch::notify(std::string_view key) {
    Waiters woken;
    {
        std::lock_guard lock(mutex_);
        if (auto it = keys_.find(std::string(key)); it != keys_.end()) {
            woken = std::move(it->second);
            keys_.erase(it);
        }
        // Only the prefixes of `key` itself can match: one lookup per length.
        for (std::size_t len = 0; len <= key.size() && !prefixes_.empty(); ++len) {
            if (auto it = prefixes_.find(key.substr(0, len)); it != prefixes_.end()) {
                woken.insert(woken.end(), it->second.begin(), it->second.end());
                prefixes_.erase(it);
            }
        }
    }

    for (auto& waiter : woken) {
        waiter->resolve({});
    }
    return woken.size();
}

void Watch::cancel_all() {
    Waiters canceled;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        for (auto& [_, list] : keys_) {
            canceled.insert(canceled.end(), list.begin(), list.end());
        }
        for (auto& [_, list] : prefixes_) {
            canceled.insert(canceled.end(), list.begin(), list.end());
        }
        keys_.clear();
        prefixes_.clear();
    }

    for (auto& waiter : canceled) {
        waiter->resolve(std::make_error_code(std::errc::operation_canceled));
    }
    if (!canceled.empty()) {
        spdlog::debug("Watch: canceled {} pending waiters", canceled.size());
    }
}

std::size_t Watch::pending() const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& [_, list] : keys_) {
        n += list.size();
    }
    for (const auto& [_, list] : prefixes_) {
        n += list.size();
    }
    return n;
}

} // namespace sluice::storage
