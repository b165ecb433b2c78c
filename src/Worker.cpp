#include <cassert>
#include <format>
#include <ostream>

#include "Worker.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const Worker& w, bool json) {
    if (json) {
        return make_pair(true, format(R"("worker":"{}")", w.name()));
    }

    return make_pair(false, format("Worker{{name={}}}", w.name()));
}
} // logfault ns

std::ostream& operator<<(std::ostream& os, const Worker& worker) {
    return os << "Worker{" << worker.name() << '}';
}

Worker::Worker(std::string name)
    : name_{std::move(name)}
{
    thread_ = std::jthread([this] { run(); });
    thread_id_ = thread_.get_id();
}

Worker::~Worker()
{
    stop();
}

void Worker::stop()
{
    queue_.stop();

    if (thread_.joinable() && !isCurrentThread()) {
        LOG_TRACE_EX(*this) << "Waiting for the worker thread to finish.";
        thread_.join();
    }
}

void Worker::submit(std::unique_ptr<Operation> &&op)
{
    assert(op);
    if (!queue_.push(std::move(op))) {
        // The rejected job fails its future from its destructor
        LOG_WARN_EX(*this) << "Operation posted after the worker was stopped.";
    }
}

void Worker::run() noexcept
{
    LOG_DEBUG_EX(*this) << "Worker thread started.";

    op_queue_t::type_t op;
    while (queue_.pop(op)) {
        op->execute();
        op.reset();
    }

    LOG_DEBUG_EX(*this) << "Worker thread done.";
}
