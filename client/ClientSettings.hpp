// Client configuration persisted with QSettings ("JobWatch", "JobWatch").
#pragma once
#include "jobwatch/OperationTypes.hpp"

#include <QString>
#include <map>

class QSettings;

struct ClientSettings {
    QString baseUrl = QStringLiteral("http://127.0.0.1:5000");
    int requestTimeoutMs = 15000;
    int authRetryBackoffMs = 1000;
    QString defaultOutputDir;
    // Per-class overrides; classes without an entry use defaultPolicyFor().
    std::map<jobwatch::OperationClass, jobwatch::OperationPolicy> policies;

    jobwatch::OperationPolicy policyFor(jobwatch::OperationClass cls) const;

    // Reads every key, falling back to defaults for missing or non-positive
    // values.
    static ClientSettings load(const QSettings &s);
    static ClientSettings loadDefault();
    void save(QSettings &s) const;
};
