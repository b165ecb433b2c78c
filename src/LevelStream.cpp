#include <algorithm>

#include "LevelStream.h"

LevelStream::LevelStream(QObject *parent)
    : QObject(parent)
{
}

void LevelStream::push(float level)
{
    level = std::clamp(level, 0.0f, 1.0f);
    {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return;
        }
        if (backlog_.size() >= max_backlog) {
            backlog_.pop_front();
        }
        backlog_.push_back(level);
        ++total_;
    }

    emit levelAvailable(level);
}

void LevelStream::close()
{
    {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return;
        }
        closed_ = true;
    }

    emit closed();
}

bool LevelStream::isClosed() const
{
    std::lock_guard lock{mutex_};
    return closed_;
}

std::vector<float> LevelStream::takeAll()
{
    std::lock_guard lock{mutex_};
    std::vector<float> levels{backlog_.begin(), backlog_.end()};
    backlog_.clear();
    return levels;
}

size_t LevelStream::totalCount() const
{
    std::lock_guard lock{mutex_};
    return total_;
}
