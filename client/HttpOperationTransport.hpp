// Transport to the worker's local HTTP API (Qt Network). Every reply body goes
// through SnapshotJson before it reaches the engine.
#pragma once
#include "ClientSettings.hpp"
#include "jobwatch/OperationTransport.hpp"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QString>
#include <functional>

class QJsonObject;

class HttpOperationTransport : public QObject,
                               public jobwatch::OperationTransport {
    Q_OBJECT
public:
    explicit HttpOperationTransport(const ClientSettings &settings,
                                    QObject *parent = nullptr);

    void startOperation(jobwatch::OperationClass cls,
                        const jobwatch::StartRequest &req,
                        StartCB done) override;
    void fetchProgress(const std::string &operationId,
                       ProgressCB done) override;
    void pauseOperation(const std::string &operationId, AckCB done) override;
    void resumeOperation(const std::string &operationId, AckCB done) override;
    void stopOperation(const std::string &operationId, AckCB done) override;

    void connectAccount(const jobwatch::AuthCredentials &credentials,
                        AuthCB done) override;
    void verifyCode(const std::string &code, AuthCB done) override;
    void verifyPassword(const std::string &password, AuthCB done) override;
    void clearSession(AckCB done) override;

    void checkHealth(AckCB done) override;

    const QString &baseUrl() const { return baseUrl_; }

    // Endpoint path used to start a job of the given class.
    static QString startPath(jobwatch::OperationClass cls);
    // Request body for a start call; exposed for tests.
    static QJsonObject startPayload(jobwatch::OperationClass cls,
                                    const jobwatch::StartRequest &req,
                                    const QString &proposedId);

private:
    // Raw outcome of one HTTP exchange. `transportError` is set only when no
    // HTTP answer was received at all.
    struct RawReply {
        QByteArray body;
        int httpStatus = 0;
        QString transportError;
    };
    using RawCB = std::function<void(const RawReply &)>;

    void get(const QString &path, RawCB done);
    void post(const QString &path, const QJsonObject &payload, RawCB done);
    void track(QNetworkReply *reply, const QString &what, RawCB done);
    void postAck(const QString &path, const QJsonObject &payload, AckCB done);
    void postAuth(const QString &path, const QJsonObject &payload, AuthCB done);

    QNetworkAccessManager nam_;
    QString baseUrl_;
    int timeoutMs_ = 15000;
};
