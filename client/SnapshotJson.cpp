#include "SnapshotJson.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>

using jobwatch::ItemSnapshot;
using jobwatch::ItemStatus;
using jobwatch::ProgressSnapshot;
using jobwatch::RemoteStatus;
using jobwatch::TransportFailure;

namespace jobwatchclient {

namespace {

bool parseObject(const QByteArray &body, QJsonObject &out, QString &error) {
    if (body.trimmed().isEmpty()) {
        error = QStringLiteral("Empty response body");
        return false;
    }
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        error = QStringLiteral("Invalid JSON response: %1").arg(pe.errorString());
        return false;
    }
    out = doc.object();
    return true;
}

// The worker nests payloads inconsistently; pick the innermost object that
// actually carries a status.
QJsonObject unwrapPayload(const QJsonObject &body) {
    QJsonObject data = body;
    if (body.value("data").isObject())
        data = body.value("data").toObject();
    if (data.value("data").isObject())
        data = data.value("data").toObject();
    if (data.value("progress").isObject())
        data = data.value("progress").toObject();
    return data;
}

QString bodyError(const QJsonObject &body) {
    QString msg = body.value("error").toString();
    if (msg.isEmpty())
        msg = body.value("message").toString();
    return msg;
}

template <typename Reply>
bool failedEnvelope(const QJsonObject &body, Reply &reply) {
    const QJsonValue success = body.value("success");
    if (!success.isBool()) {
        reply.failure = TransportFailure::Malformed;
        reply.error = "Response without success flag";
        return true;
    }
    if (!success.toBool()) {
        const QString msg = bodyError(body);
        reply.failure = classifyFailureMessage(msg);
        reply.error = msg.isEmpty() ? std::string("Request rejected")
                                    : msg.toStdString();
        return true;
    }
    return false;
}

int clampedInt(const QJsonValue &v, int fallback) {
    if (!v.isDouble())
        return fallback;
    return std::max(0, std::min(100, static_cast<int>(v.toDouble())));
}

} // namespace

TransportFailure classifyFailureMessage(const QString &message) {
    const QString lower = message.toLower();
    if (lower.contains("database is locked") ||
        lower.contains("resource locked"))
        return TransportFailure::ResourceLocked;
    return TransportFailure::Rejected;
}

RemoteStatus remoteStatusFromString(const QString &status) {
    const QString s = status.trimmed().toLower();
    if (s == "completed" || s == "done" || s == "success")
        return RemoteStatus::Completed;
    if (s == "error" || s == "failed" || s == "stopped" || s == "cancelled" ||
        s == "canceled")
        return RemoteStatus::Error;
    if (s == "paused")
        return RemoteStatus::Paused;
    return RemoteStatus::Running;
}

QJsonObject
itemStatusesToJson(const std::map<int, jobwatch::ItemSnapshot> &items) {
    QJsonObject out;
    for (const auto &kv : items) {
        QJsonObject entry;
        entry.insert("status", QString::fromLatin1(jobwatch::toString(kv.second.status)));
        if (kv.second.progress)
            entry.insert("progress", *kv.second.progress);
        if (kv.second.stage)
            entry.insert("stage", QString::fromStdString(*kv.second.stage));
        out.insert(QString::number(kv.first), entry);
    }
    return out;
}

bool itemStatusesFromJson(const QJsonObject &obj,
                          std::map<int, jobwatch::ItemSnapshot> &out,
                          QString *error) {
    out.clear();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool ok = false;
        const int index = it.key().toInt(&ok);
        if (!ok || !it.value().isObject())
            continue;
        const QJsonObject fs = it.value().toObject();
        ItemSnapshot snap;
        const auto parsed =
            jobwatch::itemStatusFromString(fs.value("status").toString().toStdString());
        snap.status = parsed ? *parsed : ItemStatus::Processing;
        if (fs.value("progress").isDouble())
            snap.progress = clampedInt(fs.value("progress"), 0);
        if (fs.value("stage").isString())
            snap.stage = fs.value("stage").toString().toStdString();
        out.emplace(index, std::move(snap));
    }
    if (!obj.isEmpty() && out.empty()) {
        if (error)
            *error = QStringLiteral("No usable item statuses");
        return false;
    }
    return true;
}

QJsonObject snapshotToJson(const ProgressSnapshot &snapshot) {
    QJsonObject o;
    o.insert("status", QString::fromLatin1(jobwatch::toString(snapshot.status)));
    o.insert("paused", snapshot.paused);
    o.insert("can_pause", snapshot.canPause);
    o.insert("progress", snapshot.progress);
    o.insert("current_stage", QString::fromStdString(snapshot.currentStage));
    o.insert("file_statuses", itemStatusesToJson(snapshot.items));
    o.insert("completed_files", snapshot.completedCount);
    o.insert("failed_files", snapshot.failedCount);
    o.insert("total_files", snapshot.totalCount);
    if (snapshot.errorMessage)
        o.insert("error", QString::fromStdString(*snapshot.errorMessage));
    return o;
}

bool snapshotFromJson(const QJsonObject &body, ProgressSnapshot &out,
                      QString *error) {
    const QJsonObject data = unwrapPayload(body);
    const QJsonValue status = data.value("status");
    if (!status.isString()) {
        if (error)
            *error = QStringLiteral("Progress without status");
        return false;
    }
    ProgressSnapshot s;
    s.status = remoteStatusFromString(status.toString());
    s.paused = data.value("paused").toBool(s.status == RemoteStatus::Paused);
    s.canPause = data.value("can_pause").toBool(false);
    s.progress = clampedInt(data.value("progress"), 0);
    s.currentStage = data.value("current_stage").toString().toStdString();
    s.completedCount = data.value("completed_files").toInt(0);
    s.failedCount = data.value("failed_files").toInt(0);
    s.totalCount = data.value("total_files").toInt(0);
    if (data.value("file_statuses").isObject()) {
        QString itemErr;
        if (!itemStatusesFromJson(data.value("file_statuses").toObject(),
                                  s.items, &itemErr)) {
            if (error)
                *error = itemErr;
            return false;
        }
    }
    QString msg = data.value("error").toString();
    if (msg.isEmpty())
        msg = data.value("error_message").toString();
    if (msg.isEmpty() && s.status == RemoteStatus::Error &&
        !s.currentStage.empty())
        msg = QString::fromStdString(s.currentStage);
    if (!msg.isEmpty())
        s.errorMessage = msg.toStdString();

    // Fast jobs sometimes report every item done before flipping the
    // operation status.
    if (s.status == RemoteStatus::Running && s.totalCount > 0 &&
        static_cast<int>(s.items.size()) == s.totalCount &&
        std::all_of(s.items.begin(), s.items.end(), [](const auto &kv) {
            return kv.second.status == ItemStatus::Completed;
        })) {
        s.status = RemoteStatus::Completed;
        s.progress = 100;
    }
    out = std::move(s);
    return true;
}

jobwatch::ProgressReply parseProgressBody(const QByteArray &body) {
    jobwatch::ProgressReply reply;
    QJsonObject obj;
    QString err;
    if (!parseObject(body, obj, err)) {
        reply.failure = TransportFailure::Malformed;
        reply.error = err.toStdString();
        return reply;
    }
    if (failedEnvelope(obj, reply))
        return reply;
    if (!snapshotFromJson(obj, reply.snapshot, &err)) {
        reply.failure = TransportFailure::Malformed;
        reply.error = err.toStdString();
        return reply;
    }
    reply.ok = true;
    return reply;
}

jobwatch::StartReply parseStartBody(const QByteArray &body,
                                    const QString &proposedId) {
    jobwatch::StartReply reply;
    QJsonObject obj;
    QString err;
    if (!parseObject(body, obj, err)) {
        reply.failure = TransportFailure::Malformed;
        reply.error = err.toStdString();
        return reply;
    }
    if (failedEnvelope(obj, reply))
        return reply;
    const QJsonObject data = obj.value("data").toObject();
    QString id = obj.value("process_id").toString();
    if (id.isEmpty())
        id = data.value("process_id").toString();
    if (id.isEmpty())
        id = data.value("operation_id").toString();
    if (id.isEmpty())
        id = proposedId;
    if (id.isEmpty()) {
        reply.failure = TransportFailure::Malformed;
        reply.error = "Backend did not return an operation id";
        return reply;
    }
    reply.ok = true;
    reply.operationId = id.toStdString();
    return reply;
}

jobwatch::AckReply parseAckBody(const QByteArray &body) {
    jobwatch::AckReply reply;
    QJsonObject obj;
    QString err;
    if (!parseObject(body, obj, err)) {
        reply.failure = TransportFailure::Malformed;
        reply.error = err.toStdString();
        return reply;
    }
    if (failedEnvelope(obj, reply))
        return reply;
    reply.ok = true;
    return reply;
}

jobwatch::AuthReply parseAuthBody(const QByteArray &body) {
    jobwatch::AuthReply reply;
    QJsonObject obj;
    QString err;
    if (!parseObject(body, obj, err)) {
        reply.failure = TransportFailure::Malformed;
        reply.error = err.toStdString();
        return reply;
    }
    if (failedEnvelope(obj, reply))
        return reply;
    const QJsonObject result =
        obj.value("data").isObject() ? obj.value("data").toObject() : obj;
    reply.ok = true;
    reply.needsCode = result.value("needs_code").toBool(false);
    reply.needsPassword = result.value("needs_password").toBool(false);
    return reply;
}

} // namespace jobwatchclient
