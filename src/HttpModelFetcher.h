#pragma once

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>

#include "ModelFetcher.h"

class ReplyEventProxy : public QObject {
    Q_OBJECT
public:
    enum class Event {
        ReadyRead,
        Finished,
        Error
    };
    Q_ENUM(Event)

    explicit ReplyEventProxy(QNetworkReply *reply, QObject *parent = nullptr);

signals:
    void event(ReplyEventProxy::Event ev);
};

/*! Downloads model files over HTTP(S) with QNetworkAccessManager. */
class HttpModelFetcher : public QObject, public ModelFetcher
{
    Q_OBJECT
public:
    explicit HttpModelFetcher(QObject *parent = nullptr);

    QCoro::AsyncGenerator<DownloadProgress> fetch(QUrl url, std::filesystem::path target) override;

private:
    QNetworkAccessManager nam_;
};
