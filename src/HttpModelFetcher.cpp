#include <algorithm>
#include <format>
#include <system_error>

#include <QFile>
#include <QNetworkRequest>
#include <QScopeGuard>

#include <qcorosignal.h>

#include "HttpModelFetcher.h"
#include "Errors.h"
#include "logging.h"

using namespace std;

namespace {

[[noreturn]] void fail(string message) {
    throw DictationError{DictationError::Kind::ModelDownloadFailed, std::move(message)};
}

} // anon ns

ReplyEventProxy::ReplyEventProxy(QNetworkReply *reply, QObject *parent)
    : QObject(parent)
{
    connect(reply, &QNetworkReply::readyRead, this, [this] {
        emit event(Event::ReadyRead);
    });

    connect(reply, &QNetworkReply::finished, this, [this] {
        emit event(Event::Finished);
    });

    connect(reply, &QNetworkReply::errorOccurred, this, [this](QNetworkReply::NetworkError) {
        emit event(Event::Error);
    });
}

HttpModelFetcher::HttpModelFetcher(QObject *parent)
    : QObject(parent)
{
}

QCoro::AsyncGenerator<DownloadProgress> HttpModelFetcher::fetch(QUrl url, std::filesystem::path target)
{
    LOG_DEBUG_N << "Downloading file from URL: " << url.toString().toStdString()
                << " to path: " << target.string();

    if (error_code ec; !filesystem::create_directories(target.parent_path(), ec) && ec) {
        fail(format("cannot create {}: {}", target.parent_path().string(), ec.message()));
    }

    const QString full_path = QString::fromStdString(target.string());
    const QString tmp_path = QString::fromStdString(partialPath(target).string());

    QNetworkRequest request{url};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply *reply = nam_.get(request);
    bool completed = false;

    // Abort the transfer and clean up the temp file if we don't complete.
    // This includes the consumer dropping the generator.
    const auto guard = qScopeGuard([reply, tmp_path, &completed] {
        if (!reply->isFinished()) {
            LOG_DEBUG << "Aborting unfinished download";
            reply->abort();
        }
        reply->deleteLater();

        if (!completed && QFile::exists(tmp_path)) {
            LOG_DEBUG << "Removing temporary file: " << tmp_path.toStdString();
            QFile::remove(tmp_path);
        }
    });

    QFile out(tmp_path);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        fail(format("cannot write {}: {}", tmp_path.toStdString(), out.errorString().toStdString()));
    }

    // Our "any-of-these-signals" proxy
    ReplyEventProxy proxy{reply};

    DownloadProgress progress;
    uint64_t reported = 0;
    bool write_error = false;

    auto drainToFile = [&] {
        while (reply->bytesAvailable() > 0) {
            const QByteArray chunk = reply->read(64 * 1024); // 64 KiB
            if (chunk.isEmpty()) {
                break;
            }

            if (out.write(chunk) != chunk.size()) {
                write_error = true;
                reply->abort();
                break;
            }
            progress.bytes_received += static_cast<uint64_t>(chunk.size());
        }

        if (const auto total = reply->header(QNetworkRequest::ContentLengthHeader).toLongLong(); total > 0) {
            progress.bytes_total = static_cast<uint64_t>(total);
        }
        if (progress.bytes_total > 0) {
            // Keep 1.0 for the moment the file is complete on disk
            progress.fraction = std::min(0.999, static_cast<double>(progress.bytes_received)
                                                    / static_cast<double>(progress.bytes_total));
        }
    };

    while (true) {
        drainToFile();
        if (write_error) {
            LOG_ERROR_N << "Disk write error while downloading " << url.toString().toStdString();
            fail(format("disk write error: {}", out.errorString().toStdString()));
        }

        if (progress.bytes_received != reported) {
            reported = progress.bytes_received;
            co_yield progress;
            // More data may have arrived while the consumer had control
            continue;
        }

        if (reply->isFinished() && reply->bytesAvailable() == 0) {
            LOG_TRACE_N << "Download finished.";
            break;
        }

        if (reply->error() != QNetworkReply::NoError) {
            LOG_ERROR_N << "Download error detected: " << reply->errorString().toStdString();
            fail(reply->errorString().toStdString());
        }

        const auto ev = co_await qCoro(&proxy, &ReplyEventProxy::event);
        if (ev == ReplyEventProxy::Event::Error) {
            LOG_ERROR_N << "Download error signaled: " << reply->errorString().toStdString();
            fail(reply->errorString().toStdString());
        }
    }

    out.flush();
    out.close();

    if (reply->error() != QNetworkReply::NoError) {
        LOG_ERROR_N << "Network error while downloading " << url.toString().toStdString()
                    << ": " << reply->errorString().toStdString();
        fail(reply->errorString().toStdString());
    }

    const int http_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (http_status != 0 && (http_status < 200 || http_status >= 300)) {
        LOG_ERROR_N << "HTTP error " << http_status << " while downloading " << url.toString().toStdString();
        fail(format("HTTP status {}", http_status));
    }

    if (progress.bytes_received == 0) {
        fail("the server sent an empty file");
    }

    if (QFile::exists(full_path)) {
        QFile::remove(full_path);
    }

    if (!QFile::rename(tmp_path, full_path)) {
        LOG_ERROR_N << "Failed to rename " << tmp_path.toStdString() << " to " << full_path.toStdString();
        fail(format("cannot rename the downloaded file to {}", full_path.toStdString()));
    }

    completed = true;
    LOG_INFO_N << "Downloaded " << progress.bytes_received << " bytes to " << target.string();

    progress.bytes_total = progress.bytes_received;
    progress.fraction = 1.0;
    co_yield progress;
}
