// Normalization of the worker's JSON bodies into the engine's typed replies.
// Every loosely shaped response is turned into one canonical struct here;
// nothing past this boundary looks at JSON.
#pragma once
#include "jobwatch/OperationTransport.hpp"
#include "jobwatch/OperationTypes.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <map>

namespace jobwatchclient {

// "database is locked" and friends are transient; everything else is a
// plain rejection.
jobwatch::TransportFailure classifyFailureMessage(const QString &message);

jobwatch::RemoteStatus remoteStatusFromString(const QString &status);

QJsonObject itemStatusesToJson(const std::map<int, jobwatch::ItemSnapshot> &items);
// Non-integer keys and non-object values are dropped. Returns false only when
// nothing usable was found in a non-empty object.
bool itemStatusesFromJson(const QJsonObject &obj,
                          std::map<int, jobwatch::ItemSnapshot> &out,
                          QString *error = nullptr);

QJsonObject snapshotToJson(const jobwatch::ProgressSnapshot &snapshot);
// Accepts the plain progress object or any of the wrappers the worker uses
// ({data}, {data: {data}}, {data: {progress: {...}}}).
bool snapshotFromJson(const QJsonObject &body,
                      jobwatch::ProgressSnapshot &out, QString *error = nullptr);

jobwatch::ProgressReply parseProgressBody(const QByteArray &body);
// `proposedId` is the id sent with the request; used when the worker does not
// echo one back.
jobwatch::StartReply parseStartBody(const QByteArray &body,
                                    const QString &proposedId);
jobwatch::AckReply parseAckBody(const QByteArray &body);
jobwatch::AuthReply parseAuthBody(const QByteArray &body);

} // namespace jobwatchclient
