#pragma once

#include <filesystem>

#include <QUrl>

#include <qcoroasyncgenerator.h>

#include "ModelInfo.h"

/*! Bulk transfer of a model file.
 *
 *  fetch() writes to "<target>.part" and renames it to target when the
 *  transfer completed. Progress is yielded as data arrives. Errors end the
 *  generator with DictationError(ModelDownloadFailed).
 *
 *  Destroying the generator before it finished aborts the transfer and
 *  removes the partial file.
 */
class ModelFetcher
{
public:
    ModelFetcher() = default;
    virtual ~ModelFetcher() = default;

    ModelFetcher(const ModelFetcher&) = delete;
    ModelFetcher& operator=(const ModelFetcher&) = delete;

    virtual QCoro::AsyncGenerator<DownloadProgress> fetch(QUrl url, std::filesystem::path target) = 0;

    static std::filesystem::path partialPath(const std::filesystem::path& target) {
        auto path = target;
        path += ".part";
        return path;
    }
};
