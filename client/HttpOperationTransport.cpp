// HTTP binding of the transport contract. Requests are JSON over POST/GET;
// replies are normalized by SnapshotJson.
#include "HttpOperationTransport.hpp"
#include "SnapshotJson.hpp"
#include "jobwatch/RuntimeLogging.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QNetworkRequest>
#include <QRandomGenerator>
#include <QUrl>
#include <memory>

Q_LOGGING_CATEGORY(jwTransport, "jobwatch.transport")

using jobwatch::OperationClass;
using jobwatch::TransportFailure;

namespace {

QString newProposedId(OperationClass cls) {
    const char *prefix = "op";
    switch (cls) {
    case OperationClass::Convert:
        prefix = "conversion";
        break;
    case OperationClass::Patch:
        prefix = "hex";
        break;
    case OperationClass::Publish:
        prefix = "sticker";
        break;
    case OperationClass::Auth:
        prefix = "connect";
        break;
    }
    return QStringLiteral("%1_%2_%3")
        .arg(QString::fromLatin1(prefix))
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(QRandomGenerator::global()->generate() % 100000000u, 8, 10,
             QLatin1Char('0'));
}

// A server that answered with an HTTP error usually still sends a JSON body
// with {success:false, error}; let the body decide. Only a missing answer is
// a network failure.
template <typename Reply>
bool networkFailure(const QString &transportError, const QByteArray &body,
                    Reply &out) {
    if (transportError.isEmpty() || !body.trimmed().isEmpty())
        return false;
    out.failure = jobwatchclient::classifyFailureMessage(transportError) ==
                          TransportFailure::ResourceLocked
                      ? TransportFailure::ResourceLocked
                      : TransportFailure::Network;
    out.error = transportError.toStdString();
    return true;
}

} // namespace

HttpOperationTransport::HttpOperationTransport(const ClientSettings &settings,
                                               QObject *parent)
    : QObject(parent), baseUrl_(settings.baseUrl),
      timeoutMs_(settings.requestTimeoutMs) {
    while (baseUrl_.endsWith('/'))
        baseUrl_.chop(1);
}

QString HttpOperationTransport::startPath(OperationClass cls) {
    switch (cls) {
    case OperationClass::Convert:
        return QStringLiteral("/api/convert-videos");
    case OperationClass::Patch:
        return QStringLiteral("/api/hex-edit");
    case OperationClass::Publish:
        return QStringLiteral("/api/sticker/create-pack");
    case OperationClass::Auth:
        return QStringLiteral("/api/sticker/connect");
    }
    return {};
}

QJsonObject
HttpOperationTransport::startPayload(OperationClass cls,
                                     const jobwatch::StartRequest &req,
                                     const QString &proposedId) {
    QJsonObject payload;
    payload.insert("process_id", proposedId);

    QJsonArray files;
    for (const auto &f : req.files)
        files.append(QString::fromStdString(f));

    QJsonObject options;
    for (const auto &kv : req.options)
        options.insert(QString::fromStdString(kv.first),
                       QString::fromStdString(kv.second));

    switch (cls) {
    case OperationClass::Convert:
        payload.insert("files", files);
        payload.insert("output_dir", QString::fromStdString(req.outputDir));
        payload.insert("settings", options);
        break;
    case OperationClass::Patch:
        payload.insert("files", files);
        payload.insert("output_dir", QString::fromStdString(req.outputDir));
        break;
    case OperationClass::Publish: {
        const QString emoji = options.value("emoji").toString(QStringLiteral("😀"));
        QJsonArray media;
        for (const auto &f : req.files) {
            QJsonObject m;
            m.insert("file_path", QString::fromStdString(f));
            m.insert("emoji", emoji);
            media.append(m);
        }
        payload.insert("media_files", media);
        payload.insert("pack_name", options.value("pack_name").toString());
        payload.insert("sticker_type",
                       options.value("sticker_type").toString(QStringLiteral("video")));
        if (options.contains("pack_title"))
            payload.insert("pack_title", options.value("pack_title"));
        break;
    }
    case OperationClass::Auth:
        break;
    }
    return payload;
}

void HttpOperationTransport::track(QNetworkReply *reply, const QString &what,
                                   RawCB done) {
    auto timer = std::make_shared<QElapsedTimer>();
    timer->start();
    connect(reply, &QNetworkReply::finished, this,
            [reply, what, timer, done = std::move(done)]() {
                RawReply raw;
                raw.body = reply->readAll();
                raw.httpStatus =
                    reply->attribute(QNetworkRequest::HttpStatusCodeAttribute)
                        .toInt();
                if (reply->error() != QNetworkReply::NoError)
                    raw.transportError = reply->errorString();
                qCDebug(jwTransport) << "reply" << what
                                     << "http=" << raw.httpStatus
                                     << "bytes=" << raw.body.size()
                                     << "elapsedMs=" << timer->elapsed();
                if (!raw.transportError.isEmpty())
                    qCInfo(jwTransport) << "request failed" << what
                                        << "error=" << raw.transportError;
                reply->deleteLater();
                done(raw);
            });
}

void HttpOperationTransport::get(const QString &path, RawCB done) {
    QNetworkRequest request(QUrl(baseUrl_ + path));
    request.setTransferTimeout(timeoutMs_);
    track(nam_.get(request), QStringLiteral("GET ") + path, std::move(done));
}

void HttpOperationTransport::post(const QString &path,
                                  const QJsonObject &payload, RawCB done) {
    QNetworkRequest request(QUrl(baseUrl_ + path));
    request.setTransferTimeout(timeoutMs_);
    request.setHeader(QNetworkRequest::ContentTypeHeader,
                      QStringLiteral("application/json"));
    const QByteArray body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    track(nam_.post(request, body), QStringLiteral("POST ") + path,
          std::move(done));
}

void HttpOperationTransport::postAck(const QString &path,
                                     const QJsonObject &payload, AckCB done) {
    post(path, payload, [done = std::move(done)](const RawReply &raw) {
        jobwatch::AckReply reply;
        if (!networkFailure(raw.transportError, raw.body, reply))
            reply = jobwatchclient::parseAckBody(raw.body);
        done(reply);
    });
}

void HttpOperationTransport::postAuth(const QString &path,
                                      const QJsonObject &payload,
                                      AuthCB done) {
    post(path, payload, [done = std::move(done)](const RawReply &raw) {
        jobwatch::AuthReply reply;
        if (!networkFailure(raw.transportError, raw.body, reply))
            reply = jobwatchclient::parseAuthBody(raw.body);
        done(reply);
    });
}

void HttpOperationTransport::startOperation(OperationClass cls,
                                            const jobwatch::StartRequest &req,
                                            StartCB done) {
    const QString proposedId = newProposedId(cls);
    qCInfo(jwTransport) << "start" << jobwatch::toString(cls)
                        << "files=" << req.files.size()
                        << "proposedId=" << proposedId;
    post(startPath(cls), startPayload(cls, req, proposedId),
         [proposedId, done = std::move(done)](const RawReply &raw) {
             jobwatch::StartReply reply;
             if (!networkFailure(raw.transportError, raw.body, reply))
                 reply = jobwatchclient::parseStartBody(raw.body, proposedId);
             done(reply);
         });
}

void HttpOperationTransport::fetchProgress(const std::string &operationId,
                                           ProgressCB done) {
    const QString path =
        QStringLiteral("/api/conversion-progress/") +
        QString::fromUtf8(QUrl::toPercentEncoding(QString::fromStdString(operationId)));
    get(path, [done = std::move(done)](const RawReply &raw) {
        jobwatch::ProgressReply reply;
        if (!networkFailure(raw.transportError, raw.body, reply))
            reply = jobwatchclient::parseProgressBody(raw.body);
        done(reply);
    });
}

void HttpOperationTransport::pauseOperation(const std::string &operationId,
                                            AckCB done) {
    QJsonObject payload;
    payload.insert("process_id", QString::fromStdString(operationId));
    postAck(QStringLiteral("/api/pause-operation"), payload, std::move(done));
}

void HttpOperationTransport::resumeOperation(const std::string &operationId,
                                             AckCB done) {
    QJsonObject payload;
    payload.insert("process_id", QString::fromStdString(operationId));
    postAck(QStringLiteral("/api/resume-operation"), payload, std::move(done));
}

void HttpOperationTransport::stopOperation(const std::string &operationId,
                                           AckCB done) {
    QJsonObject payload;
    payload.insert("process_id", QString::fromStdString(operationId));
    postAck(QStringLiteral("/api/stop-process"), payload, std::move(done));
}

void HttpOperationTransport::connectAccount(
    const jobwatch::AuthCredentials &credentials, AuthCB done) {
    qCInfo(jwTransport) << "connect account"
                        << "phone="
                        << QString::fromStdString(
                               jobwatch::redacted(credentials.phoneNumber, 4));
    QJsonObject payload;
    payload.insert("api_id", QString::fromStdString(credentials.apiId));
    payload.insert("api_hash", QString::fromStdString(credentials.apiHash));
    payload.insert("phone_number",
                   QString::fromStdString(credentials.phoneNumber));
    payload.insert("process_id", newProposedId(OperationClass::Auth));
    postAuth(startPath(OperationClass::Auth), payload, std::move(done));
}

void HttpOperationTransport::verifyCode(const std::string &code, AuthCB done) {
    QJsonObject payload;
    payload.insert("code", QString::fromStdString(code));
    postAuth(QStringLiteral("/api/sticker/verify-code"), payload,
             std::move(done));
}

void HttpOperationTransport::verifyPassword(const std::string &password,
                                            AuthCB done) {
    QJsonObject payload;
    payload.insert("password", QString::fromStdString(password));
    postAuth(QStringLiteral("/api/sticker/verify-password"), payload,
             std::move(done));
}

void HttpOperationTransport::clearSession(AckCB done) {
    postAck(QStringLiteral("/api/clear-session"), QJsonObject{},
            std::move(done));
}

void HttpOperationTransport::checkHealth(AckCB done) {
    get(QStringLiteral("/api/health"), [done = std::move(done)](const RawReply &raw) {
        jobwatch::AckReply reply;
        if (networkFailure(raw.transportError, raw.body, reply)) {
            done(reply);
            return;
        }
        // Health answers {status: "healthy"} without a success flag.
        if (raw.httpStatus >= 200 && raw.httpStatus < 300) {
            reply.ok = true;
        } else {
            reply.failure = TransportFailure::Rejected;
            reply.error = "Backend unhealthy (HTTP " +
                          std::to_string(raw.httpStatus) + ")";
        }
        done(reply);
    });
}
