#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

#include <QFuture>
#include <QPromise>

#include "Queue.h"

/*! A dedicated thread with an inbound operation queue.
 *
 *  A component that owns mutable state creates one Worker and only touches
 *  that state from operations posted to it. Operations run one at a time in
 *  the order they were posted.
 *
 *  post() returns a QFuture that completes when the operation has run, and
 *  that can be co_await'ed from a coroutine. An exception thrown by the
 *  operation is stored in the future and re-thrown in the awaiting coroutine.
 *  Operations returning void complete a QFuture<bool>.
 *
 *  Operations that are still queued when the worker is destroyed are run
 *  before the thread exits. Operations posted after stop() fail with an
 *  exception in their future.
 */
class Worker
{
public:
    class Operation {
    public:
        Operation() = default;
        virtual ~Operation() = default;

        Operation(const Operation&) = delete;
        Operation& operator=(const Operation&) = delete;
        Operation(Operation&&) = delete;
        Operation& operator=(Operation&&) = delete;

        virtual void execute() noexcept = 0;
    };

    using op_queue_t = Queue<std::unique_ptr<Operation>>;

    explicit Worker(std::string name);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    template <typename Fn>
    auto post(Fn&& fn) {
        using result_t = std::invoke_result_t<std::decay_t<Fn>&>;
        if constexpr (std::is_void_v<result_t>) {
            return enqueue<bool>([fn = std::forward<Fn>(fn)]() mutable {
                fn();
                return true;
            });
        } else {
            return enqueue<result_t>(std::forward<Fn>(fn));
        }
    }

    /*! Stops accepting operations, runs the ones already queued and joins the thread. */
    void stop();

    bool isCurrentThread() const noexcept {
        return std::this_thread::get_id() == thread_id_;
    }

    const std::string& name() const noexcept {
        return name_;
    }

    size_t pending() const {
        return queue_.size();
    }

private:
    template <typename T, typename Fn>
    class Job final : public Operation {
    public:
        explicit Job(Fn&& fn)
            : fn_{std::move(fn)} {
            promise_.start();
        }

        ~Job() override {
            if (!done_) {
                promise_.setException(std::make_exception_ptr(
                    std::runtime_error{"The worker stopped before the operation could run"}));
                promise_.finish();
            }
        }

        void execute() noexcept override {
            try {
                promise_.addResult(fn_());
            } catch (...) {
                promise_.setException(std::current_exception());
            }
            promise_.finish();
            done_ = true;
        }

        QFuture<T> future() {
            return promise_.future();
        }

    private:
        Fn fn_;
        QPromise<T> promise_;
        bool done_{false};
    };

    template <typename T, typename Fn>
    QFuture<T> enqueue(Fn&& fn) {
        using job_t = Job<T, std::decay_t<Fn>>;
        auto job = std::make_unique<job_t>(std::decay_t<Fn>(std::forward<Fn>(fn)));
        auto future = job->future();
        submit(std::move(job));
        return future;
    }

    void submit(std::unique_ptr<Operation>&& op);
    void run() noexcept;

    const std::string name_;
    op_queue_t queue_;
    std::thread::id thread_id_;
    std::jthread thread_;
};

std::ostream& operator<<(std::ostream& os, const Worker& worker);
