// jobwatch: command-line front end for the worker. Starts one operation (or
// the sign-in handshake), prints its progress and exits with
//   0 every item succeeded / connected
//   1 an item failed, the operation aborted or sign-in failed
//   2 usage error
#include "AuthController.hpp"
#include "ClientSettings.hpp"
#include "HttpOperationTransport.hpp"
#include "OperationService.hpp"
#include "jobwatch/OperationTypes.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>
#include <QTimer>

#include <cstdio>
#include <vector>

using namespace jobwatch;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

QString readLine(const QString &prompt) {
    static QTextStream in(stdin);
    out() << prompt << Qt::flush;
    return in.readLine();
}

struct CliOptions {
    QCommandLineOption baseUrl{QStringLiteral("base-url"),
                               QStringLiteral("Worker base URL."),
                               QStringLiteral("url")};
    QCommandLineOption output{{QStringLiteral("o"), QStringLiteral("output")},
                              QStringLiteral("Output directory."),
                              QStringLiteral("dir")};
    QCommandLineOption option{QStringLiteral("option"),
                              QStringLiteral("Class option key=value (repeatable)."),
                              QStringLiteral("key=value")};
    QCommandLineOption interval{QStringLiteral("interval-ms"),
                                QStringLiteral("Poll interval override."),
                                QStringLiteral("ms")};
    QCommandLineOption maxErrors{QStringLiteral("max-errors"),
                                 QStringLiteral("Consecutive poll failures before giving up."),
                                 QStringLiteral("n")};
    QCommandLineOption maxDuration{QStringLiteral("max-duration-ms"),
                                   QStringLiteral("Wall-clock limit override."),
                                   QStringLiteral("ms")};
    QCommandLineOption apiId{QStringLiteral("api-id"),
                             QStringLiteral("Account API id (auth)."),
                             QStringLiteral("id")};
    QCommandLineOption apiHash{QStringLiteral("api-hash"),
                               QStringLiteral("Account API hash (auth)."),
                               QStringLiteral("hash")};
    QCommandLineOption phone{QStringLiteral("phone"),
                             QStringLiteral("Phone number (auth)."),
                             QStringLiteral("number")};
    QCommandLineOption save{
        QStringLiteral("save"),
        QStringLiteral("Persist --base-url, --output and poll overrides.")};
    QCommandLineOption verbose{{QStringLiteral("v"), QStringLiteral("verbose")},
                               QStringLiteral("Show engine logs.")};

    void addTo(QCommandLineParser &p) const {
        p.addOptions({baseUrl, output, option, interval, maxErrors, maxDuration,
                      apiId, apiHash, phone, save, verbose});
    }
};

bool positiveInt(const QString &text, int &value) {
    bool ok = false;
    const int v = text.toInt(&ok);
    if (!ok || v <= 0)
        return false;
    value = v;
    return true;
}

// Applies command-line overrides on top of the stored settings.
bool applyOverrides(const QCommandLineParser &p, const CliOptions &o,
                    OperationClass cls, ClientSettings &settings,
                    QString &error) {
    if (p.isSet(o.baseUrl))
        settings.baseUrl = p.value(o.baseUrl);
    if (p.isSet(o.output))
        settings.defaultOutputDir = p.value(o.output);

    OperationPolicy policy = settings.policyFor(cls);
    bool touched = false;
    if (p.isSet(o.interval)) {
        if (!positiveInt(p.value(o.interval), policy.pollIntervalMs)) {
            error = QStringLiteral("--interval-ms must be a positive integer");
            return false;
        }
        touched = true;
    }
    if (p.isSet(o.maxErrors)) {
        if (!positiveInt(p.value(o.maxErrors), policy.maxConsecutiveErrors)) {
            error = QStringLiteral("--max-errors must be a positive integer");
            return false;
        }
        touched = true;
    }
    if (p.isSet(o.maxDuration)) {
        bool ok = false;
        const qint64 ms = p.value(o.maxDuration).toLongLong(&ok);
        if (!ok || ms <= 0) {
            error = QStringLiteral("--max-duration-ms must be a positive integer");
            return false;
        }
        policy.maxDurationMs = ms;
        touched = true;
    }
    if (touched)
        settings.policies[cls] = policy;
    return true;
}

void printItems(const std::vector<Item> &items) {
    for (const Item &item : items) {
        out() << QStringLiteral("  [%1] %2% %3 %4")
                     .arg(item.index)
                     .arg(item.progress, 3)
                     .arg(QString::fromLatin1(toString(item.status)), -10)
                     .arg(QFileInfo(QString::fromStdString(item.path)).fileName());
        if (!item.stage.empty())
            out() << " (" << QString::fromStdString(item.stage) << ")";
        out() << "\n";
    }
    out() << Qt::flush;
}

int runOperation(QCoreApplication &app, OperationClass cls,
                 const QStringList &files, const QCommandLineParser &p,
                 const CliOptions &o, const ClientSettings &settings) {
    StartRequest request;
    for (const QString &kv : p.values(o.option)) {
        const int eq = kv.indexOf('=');
        if (eq <= 0) {
            err() << "invalid --option '" << kv << "', expected key=value\n";
            return kExitUsage;
        }
        request.options[kv.left(eq).toStdString()] = kv.mid(eq + 1).toStdString();
    }
    if (cls == OperationClass::Publish && !request.options.count("pack_name")) {
        err() << "publish requires --option pack_name=<name>\n";
        return kExitUsage;
    }

    std::vector<Item> items;
    for (int i = 0; i < files.size(); ++i) {
        Item item;
        item.index = i;
        item.path = QFileInfo(files.at(i)).absoluteFilePath().toStdString();
        items.push_back(item);
    }

    HttpOperationTransport transport(settings);
    OperationService service(&transport, settings);

    QObject::connect(&service, &OperationService::started, &app,
                     [](OperationClass c, const QString &id) {
                         out() << toString(c) << ": started " << id << "\n"
                               << Qt::flush;
                     });
    QObject::connect(&service, &OperationService::tick, &app,
                     [](OperationClass c, const ProgressSnapshot &s) {
                         out() << toString(c) << ": " << s.progress << "% "
                               << QString::fromStdString(s.currentStage)
                               << " (" << s.completedCount << " done, "
                               << s.failedCount << " failed of "
                               << s.totalCount << ")\n"
                               << Qt::flush;
                     });
    QObject::connect(&service, &OperationService::itemsChanged, &app,
                     [&items](OperationClass) { printItems(items); });
    QObject::connect(&service, &OperationService::paused, &app,
                     [](OperationClass c) { out() << toString(c) << ": paused\n" << Qt::flush; });
    QObject::connect(&service, &OperationService::resumed, &app,
                     [](OperationClass c) { out() << toString(c) << ": resumed\n" << Qt::flush; });
    QObject::connect(&service, &OperationService::terminal, &app,
                     [&](const TerminalSummary &s) {
                         printItems(items);
                         out() << toString(s.cls) << ": " << toString(s.status)
                               << " " << s.successCount << "/" << s.totalCount
                               << " succeeded, " << s.failureCount
                               << " failed\n";
                         if (s.errorMessage)
                             out() << "  " << QString::fromStdString(*s.errorMessage)
                                   << "\n";
                         out() << Qt::flush;
                         app.exit(s.status == OperationStatus::Completed &&
                                          s.failureCount == 0
                                      ? kExitOk
                                      : kExitFailed);
                     });
    QObject::connect(&service, &OperationService::aborted, &app,
                     [&](OperationClass c, AbortReason reason, const QString &m) {
                         err() << toString(c) << ": aborted ("
                               << toString(reason) << ") " << m << "\n"
                               << Qt::flush;
                         app.exit(kExitFailed);
                     });

    OperationHandle handle;
    EngineError error;
    if (!service.startOperation(cls, items, request, handle, error)) {
        err() << toString(cls) << ": " << QString::fromStdString(error.message)
              << "\n";
        return error.kind == ErrorKind::InvalidInput ? kExitUsage : kExitFailed;
    }
    return app.exec();
}

int runAuth(QCoreApplication &app, const QCommandLineParser &p,
            const CliOptions &o, const ClientSettings &settings) {
    AuthCredentials credentials;
    credentials.apiId = p.value(o.apiId).toStdString();
    credentials.apiHash = p.value(o.apiHash).toStdString();
    credentials.phoneNumber = p.value(o.phone).toStdString();

    HttpOperationTransport transport(settings);
    OperationRegistry registry;
    AuthController auth(&transport, registry, settings.authRetryBackoffMs);

    // Prompts until the controller accepts the input; EOF ends the run.
    auto promptFor = [&](AuthPhase phase) {
        const bool wantCode = (phase == AuthPhase::AwaitingCode);
        for (;;) {
            const QString line = readLine(wantCode
                                              ? QStringLiteral("Verification code: ")
                                              : QStringLiteral("2FA password: "));
            if (line.isNull()) {
                err() << "\nno input; giving up\n";
                app.exit(kExitFailed);
                return;
            }
            EngineError e;
            const bool sent = wantCode
                                  ? auth.submitCode(line.trimmed().toStdString(), e)
                                  : auth.submitPassword(line.toStdString(), e);
            if (sent)
                return;
            err() << QString::fromStdString(e.message) << "\n" << Qt::flush;
            if (e.kind != ErrorKind::InvalidInput) {
                app.exit(kExitFailed);
                return;
            }
        }
    };

    QObject::connect(&auth, &AuthController::phaseChanged, &app,
                     [&](AuthPhase phase) {
                         out() << "auth: " << toString(phase) << "\n" << Qt::flush;
                         if (phase == AuthPhase::AwaitingCode ||
                             phase == AuthPhase::AwaitingPassword)
                             QTimer::singleShot(0, &app, [&promptFor, phase] {
                                 promptFor(phase);
                             });
                     });
    QObject::connect(&auth, &AuthController::retryScheduled, &app,
                     [](int attempt, int delayMs) {
                         out() << "auth: worker busy, retry " << attempt
                               << " in " << delayMs << " ms\n" << Qt::flush;
                     });
    QObject::connect(&auth, &AuthController::connected, &app,
                     [&app] { app.exit(kExitOk); });
    QObject::connect(&auth, &AuthController::failed, &app,
                     [&](const EngineError &e) {
                         err() << "auth: " << QString::fromStdString(e.message)
                               << "\n" << Qt::flush;
                         // Same step may be retried; the initial connect may not.
                         if (auth.phase() == AuthPhase::Disconnected)
                             app.exit(kExitFailed);
                         else
                             QTimer::singleShot(0, &app, [&promptFor, &auth] {
                                 promptFor(auth.phase());
                             });
                     });

    EngineError error;
    if (!auth.submitCredentials(credentials, error)) {
        err() << "auth: " << QString::fromStdString(error.message) << "\n";
        return error.kind == ErrorKind::InvalidInput ? kExitUsage : kExitFailed;
    }
    return app.exec();
}

int runHealth(QCoreApplication &app, const ClientSettings &settings) {
    HttpOperationTransport transport(settings);
    int exitCode = kExitFailed;
    transport.checkHealth([&](const AckReply &r) {
        if (r.ok)
            out() << "worker at " << transport.baseUrl() << " is healthy\n";
        else
            err() << "worker at " << transport.baseUrl() << ": "
                  << QString::fromStdString(r.error) << "\n";
        out() << Qt::flush;
        exitCode = r.ok ? kExitOk : kExitFailed;
        app.exit(exitCode);
    });
    app.exec();
    return exitCode;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("JobWatch"));
    QCoreApplication::setApplicationName(QStringLiteral("JobWatch"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Start and follow jobs on the local media worker."));
    parser.addHelpOption();
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("convert | patch | publish | auth | health"));
    parser.addPositionalArgument(QStringLiteral("files"),
                                 QStringLiteral("Input files."),
                                 QStringLiteral("[files...]"));
    CliOptions opts;
    opts.addTo(parser);
    parser.process(app);

    if (!parser.isSet(opts.verbose))
        QLoggingCategory::setFilterRules(
            QStringLiteral("jobwatch.*.debug=false\njobwatch.*.info=false"));

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        err() << parser.helpText();
        return kExitUsage;
    }
    const QString command = args.takeFirst().toLower();

    ClientSettings settings = ClientSettings::loadDefault();

    if (command == QLatin1String("health")) {
        if (parser.isSet(opts.baseUrl))
            settings.baseUrl = parser.value(opts.baseUrl);
        return runHealth(app, settings);
    }

    const auto cls = operationClassFromString(command.toStdString());
    if (!cls) {
        err() << "unknown command '" << command << "'\n";
        return kExitUsage;
    }

    QString error;
    if (!applyOverrides(parser, opts, *cls, settings, error)) {
        err() << error << "\n";
        return kExitUsage;
    }
    if (parser.isSet(opts.save)) {
        QSettings store(QStringLiteral("JobWatch"), QStringLiteral("JobWatch"));
        settings.save(store);
    }

    if (*cls == OperationClass::Auth)
        return runAuth(app, parser, opts, settings);

    if (args.isEmpty()) {
        err() << command << ": no input files\n";
        return kExitUsage;
    }
    return runOperation(app, *cls, args, parser, opts, settings);
}
