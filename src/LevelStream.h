#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include <QObject>

/*! Live amplitude levels for one capture.
 *
 *  Levels are in [0, 1] and arrive in temporal order. Once closed, the stream
 *  ignores further levels and cannot be reopened.
 *
 *  Levels are pushed from the capture worker thread. Observers either connect
 *  to levelAvailable() or poll with takeAll().
 */
class LevelStream : public QObject
{
    Q_OBJECT
public:
    static constexpr size_t max_backlog = 1024;

    explicit LevelStream(QObject *parent = nullptr);

    void push(float level);
    void close();

    bool isClosed() const;

    // Levels not yet taken, oldest first. The backlog keeps the newest max_backlog levels.
    std::vector<float> takeAll();

    size_t totalCount() const;

signals:
    void levelAvailable(float level);
    void closed();

private:
    mutable std::mutex mutex_;
    std::deque<float> backlog_;
    size_t total_{};
    bool closed_{false};
};
