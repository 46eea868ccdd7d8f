#include "ClientSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {

using jobwatch::OperationClass;

const OperationClass kPolledClasses[] = {
    OperationClass::Convert, OperationClass::Patch, OperationClass::Publish};

QString policyKey(OperationClass cls, const char *field) {
    return QStringLiteral("Polling/%1/%2")
        .arg(QString::fromLatin1(jobwatch::toString(cls)),
             QString::fromLatin1(field));
}

int positiveInt(const QSettings &s, const QString &key, int fallback) {
    bool ok = false;
    const int v = s.value(key, fallback).toInt(&ok);
    return (ok && v > 0) ? v : fallback;
}

qint64 positiveInt64(const QSettings &s, const QString &key, qint64 fallback) {
    bool ok = false;
    const qint64 v = s.value(key, fallback).toLongLong(&ok);
    return (ok && v > 0) ? v : fallback;
}

QString defaultOutputDirPath() {
    QString base =
        QStandardPaths::writableLocation(QStandardPaths::MoviesLocation);
    if (base.isEmpty())
        base = QDir::homePath();
    return QDir(base).filePath(QStringLiteral("JobWatch"));
}

} // namespace

jobwatch::OperationPolicy
ClientSettings::policyFor(jobwatch::OperationClass cls) const {
    auto it = policies.find(cls);
    if (it != policies.end())
        return it->second;
    return jobwatch::defaultPolicyFor(cls);
}

ClientSettings ClientSettings::load(const QSettings &s) {
    ClientSettings out;
    QString url = s.value("Backend/baseUrl", out.baseUrl).toString().trimmed();
    while (url.endsWith('/'))
        url.chop(1);
    if (!url.isEmpty())
        out.baseUrl = url;
    out.requestTimeoutMs =
        positiveInt(s, "Backend/requestTimeoutMs", out.requestTimeoutMs);
    out.authRetryBackoffMs =
        positiveInt(s, "Auth/retryBackoffMs", out.authRetryBackoffMs);
    out.defaultOutputDir = QDir::cleanPath(
        s.value("Output/defaultDir", defaultOutputDirPath()).toString().trimmed());

    for (OperationClass cls : kPolledClasses) {
        const jobwatch::OperationPolicy d = jobwatch::defaultPolicyFor(cls);
        jobwatch::OperationPolicy p;
        p.pollIntervalMs = positiveInt(s, policyKey(cls, "intervalMs"),
                                       d.pollIntervalMs);
        p.maxConsecutiveErrors =
            positiveInt(s, policyKey(cls, "maxConsecutiveErrors"),
                        d.maxConsecutiveErrors);
        p.maxDurationMs =
            positiveInt64(s, policyKey(cls, "maxDurationMs"), d.maxDurationMs);
        p.immediateFirstPoll =
            s.value(policyKey(cls, "immediateFirstPoll"), d.immediateFirstPoll)
                .toBool();
        out.policies[cls] = p;
    }
    return out;
}

ClientSettings ClientSettings::loadDefault() {
    QSettings s("JobWatch", "JobWatch");
    return load(s);
}

void ClientSettings::save(QSettings &s) const {
    s.setValue("Backend/baseUrl", baseUrl);
    s.setValue("Backend/requestTimeoutMs", requestTimeoutMs);
    s.setValue("Auth/retryBackoffMs", authRetryBackoffMs);
    s.setValue("Output/defaultDir", defaultOutputDir);
    for (OperationClass cls : kPolledClasses) {
        const jobwatch::OperationPolicy p = policyFor(cls);
        s.setValue(policyKey(cls, "intervalMs"), p.pollIntervalMs);
        s.setValue(policyKey(cls, "maxConsecutiveErrors"),
                   p.maxConsecutiveErrors);
        s.setValue(policyKey(cls, "maxDurationMs"),
                   static_cast<qlonglong>(p.maxDurationMs));
        s.setValue(policyKey(cls, "immediateFirstPoll"), p.immediateFirstPoll);
    }
}
