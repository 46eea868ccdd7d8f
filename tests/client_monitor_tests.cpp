// Client layer tests on a real Qt event loop against the in-process mock
// transport (run via CTest).
#include "AuthController.hpp"
#include "ClientSettings.hpp"
#include "HttpOperationTransport.hpp"
#include "OperationService.hpp"
#include "SnapshotJson.hpp"
#include "jobwatch/ItemReconciler.hpp"
#include "jobwatch/MockOperationTransport.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonObject>
#include <QSettings>
#include <QTemporaryDir>
#include <QThread>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

using namespace jobwatch;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

bool waitUntil(const std::function<bool()> &pred, int timeoutMs = 3000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
    return true;
}

void spin(int ms) {
    waitUntil([] { return false; }, ms);
}

ClientSettings fastSettings(int intervalMs = 5, int maxErrors = 3) {
    ClientSettings s;
    s.authRetryBackoffMs = 1;
    for (OperationClass cls : {OperationClass::Convert, OperationClass::Patch,
                               OperationClass::Publish}) {
        OperationPolicy p;
        p.pollIntervalMs = intervalMs;
        p.maxConsecutiveErrors = maxErrors;
        p.maxDurationMs = 60 * 1000;
        s.policies[cls] = p;
    }
    return s;
}

std::vector<Item> makeItems(int n) {
    std::vector<Item> items;
    for (int i = 0; i < n; ++i) {
        Item item;
        item.index = i;
        item.path = "/videos/clip" + std::to_string(i) + ".mp4";
        items.push_back(item);
    }
    return items;
}

ItemSnapshot itemSnap(ItemStatus status, int progress = -1) {
    ItemSnapshot s;
    s.status = status;
    if (progress >= 0)
        s.progress = progress;
    return s;
}

ProgressReply progressOk(const ProgressSnapshot &s) {
    ProgressReply r;
    r.ok = true;
    r.snapshot = s;
    return r;
}

ProgressReply progressMalformed() {
    ProgressReply r;
    r.failure = TransportFailure::Malformed;
    r.error = "Response without success flag";
    return r;
}

// Records what the service announced.
struct Events {
    int started = 0;
    int terminal = 0;
    int aborted = 0;
    int paused = 0;
    int resumed = 0;
    int itemsChanged = 0;
    TerminalSummary summary;
    AbortReason reason = AbortReason::StartFailed;

    void attach(OperationService &svc) {
        QObject::connect(&svc, &OperationService::started, &svc,
                         [this](OperationClass, const QString &) { ++started; });
        QObject::connect(&svc, &OperationService::terminal, &svc,
                         [this](const TerminalSummary &s) {
                             ++terminal;
                             summary = s;
                         });
        QObject::connect(&svc, &OperationService::aborted, &svc,
                         [this](OperationClass, AbortReason r, const QString &) {
                             ++aborted;
                             reason = r;
                         });
        QObject::connect(&svc, &OperationService::paused, &svc,
                         [this](OperationClass) { ++paused; });
        QObject::connect(&svc, &OperationService::resumed, &svc,
                         [this](OperationClass) { ++resumed; });
        QObject::connect(&svc, &OperationService::itemsChanged, &svc,
                         [this](OperationClass) { ++itemsChanged; });
    }
};

// Worker stand-in whose progress reflects the pause state it was told about.
// Control acks can be held back to keep a request in flight.
class PausableWorker : public MockOperationTransport {
public:
    bool remotePaused = false;
    bool holdControl = false;
    int polls = 0;

    void fetchProgress(const std::string &, ProgressCB done) override {
        ++polls;
        ProgressSnapshot s;
        s.paused = remotePaused;
        s.canPause = true;
        s.progress = 10;
        s.items[0] = itemSnap(ItemStatus::Processing, 10);
        s.totalCount = 1;
        done(progressOk(s));
    }
    void pauseOperation(const std::string &, AckCB done) override {
        control([this] { remotePaused = true; }, std::move(done));
    }
    void resumeOperation(const std::string &, AckCB done) override {
        control([this] { remotePaused = false; }, std::move(done));
    }
    void releaseControl() {
        auto held = std::move(held_);
        held_.clear();
        for (auto &fn : held)
            fn();
    }

private:
    void control(std::function<void()> apply, AckCB done) {
        auto fn = [apply = std::move(apply), done = std::move(done)] {
            apply();
            AckReply r;
            r.ok = true;
            done(r);
        };
        if (holdControl)
            held_.push_back(std::move(fn));
        else
            fn();
    }
    std::vector<std::function<void()>> held_;
};

// Three items: item 0 finishes on the first poll, the rest on the second.
void test_convert_completes_once(TestContext &t) {
    MockOperationTransport mock;
    OperationService svc(&mock, fastSettings());
    Events ev;
    ev.attach(svc);

    ProgressSnapshot tick1;
    tick1.progress = 40;
    tick1.totalCount = 3;
    tick1.items = {{0, itemSnap(ItemStatus::Completed)},
                   {1, itemSnap(ItemStatus::Processing, 30)},
                   {2, itemSnap(ItemStatus::Processing, 10)}};
    ProgressSnapshot tick2;
    tick2.status = RemoteStatus::Completed;
    tick2.progress = 100;
    tick2.totalCount = 3;
    tick2.items = {{0, itemSnap(ItemStatus::Completed)},
                   {1, itemSnap(ItemStatus::Completed)},
                   {2, itemSnap(ItemStatus::Completed)}};
    mock.queueProgressReply(progressOk(tick1));
    mock.queueProgressReply(progressOk(tick2));

    auto items = makeItems(3);
    StartRequest req;
    req.outputDir = "/out";
    OperationHandle handle;
    EngineError err;
    t.check(svc.startOperation(OperationClass::Convert, items, req, handle, err),
            "convert start accepted");
    t.check(mock.lastStartRequest().files.size() == 3,
            "item paths are sent as files");
    t.check(svc.isPolling(OperationClass::Convert), "polling after start");

    t.check(waitUntil([&] { return ev.terminal > 0; }), "terminal reached");
    spin(40);
    t.check(ev.terminal == 1, "exactly one terminal event");
    t.check(ev.summary.successCount == 3 && ev.summary.failureCount == 0,
            "3 succeeded, 0 failed");
    t.check(mock.progressCalls() == 2, "no poll after terminal");
    t.check(!svc.registry().isActive(OperationClass::Convert), "slot released");
    t.check(!svc.isPolling(OperationClass::Convert), "not polling");
    t.check(ev.itemsChanged >= 1, "item updates announced");
    for (const Item &item : items)
        t.check(item.status == ItemStatus::Completed && item.progress == 100,
                "every item completed");
    const auto snap = svc.currentSnapshot(OperationClass::Convert);
    t.check(snap && snap->status == RemoteStatus::Completed,
            "last snapshot still queryable");
}

void test_persistent_error_aborts(TestContext &t) {
    MockOperationTransport mock;
    OperationService svc(&mock, fastSettings(5, 3));
    Events ev;
    ev.attach(svc);

    ProgressSnapshot good;
    good.items = {{0, itemSnap(ItemStatus::Processing, 40)}};
    mock.queueProgressReply(progressOk(good));
    for (int i = 0; i < 3; ++i)
        mock.queueProgressReply(progressMalformed());

    auto items = makeItems(2);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Convert, items, {}, handle, err);
    t.check(waitUntil([&] { return ev.aborted > 0; }), "abort reached");
    spin(30);
    t.check(ev.reason == AbortReason::PersistentError, "reason persistent-error");
    t.check(ev.terminal == 0, "no terminal snapshot applied");
    t.check(mock.progressCalls() == 4, "polling stopped at the threshold");
    t.check(!svc.registry().isActive(OperationClass::Convert), "slot released");
    t.check(items[0].status == ItemStatus::Processing && items[0].progress == 40,
            "items keep the last good state");
    const auto op = svc.currentOperation(OperationClass::Convert);
    t.check(op && op->status == OperationStatus::Error, "operation errored");
}

void test_pause_resume(TestContext &t) {
    PausableWorker worker;
    OperationService svc(&worker, fastSettings());
    Events ev;
    ev.attach(svc);

    auto items = makeItems(1);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Convert, items, {}, handle, err);
    t.check(waitUntil([&] { return worker.polls >= 1; }), "first poll");

    t.check(!svc.resume(OperationClass::Convert), "resume rejected while running");
    worker.holdControl = true;
    t.check(svc.pause(OperationClass::Convert), "pause accepted");
    t.check(!svc.resume(OperationClass::Convert),
            "resume rejected before pause acknowledged");
    t.check(!svc.pause(OperationClass::Convert), "second pause rejected");
    const int before = worker.polls;
    t.check(waitUntil([&] { return worker.polls >= before + 2; }),
            "polling continues while the request is in flight");
    t.check(ev.paused == 0, "not paused before the ack");

    worker.holdControl = false;
    worker.releaseControl();
    t.check(ev.paused == 1, "paused event on ack");
    const int pausedAt = worker.polls;
    t.check(waitUntil([&] { return worker.polls >= pausedAt + 2; }),
            "polling continues while paused");
    const auto op = svc.currentOperation(OperationClass::Convert);
    t.check(op && op->status == OperationStatus::Paused, "still paused");
    t.check(ev.resumed == 0, "paused snapshots do not resume");

    t.check(svc.resume(OperationClass::Convert), "resume accepted after pause");
    t.check(ev.resumed == 1, "resumed event");
    const int resumedAt = worker.polls;
    t.check(waitUntil([&] { return worker.polls >= resumedAt + 1; }),
            "timer keeps polling after resume");

    t.check(svc.cancel(OperationClass::Convert), "cancel accepted");
    t.check(ev.aborted == 1 && ev.reason == AbortReason::Canceled,
            "aborted with canceled");
    t.check(worker.stopCalls() == 1, "remote stop requested");
    t.check(!svc.registry().isActive(OperationClass::Convert), "slot released");
    const int canceledAt = worker.polls;
    spin(30);
    t.check(worker.polls == canceledAt, "no poll after cancel");
    t.check(!svc.cancel(OperationClass::Convert), "second cancel is a no-op");
}

// The worker answers the pause before a poll that was already under way; the
// poll's "running" snapshot must not undo the pause.
void test_late_poll_after_pause_ack(TestContext &t) {
    MockOperationTransport mock;
    OperationService svc(&mock, fastSettings());
    Events ev;
    ev.attach(svc);
    auto items = makeItems(1);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Convert, items, {}, handle, err);
    mock.setDeferred(true);

    ProgressSnapshot running;
    running.progress = 20;
    running.items = {{0, itemSnap(ItemStatus::Processing, 20)}};
    mock.queueProgressReply(progressOk(running));
    mock.queueProgressReply(progressOk(running));
    t.check(waitUntil([&] { return mock.pendingCount() == 1; }), "poll in flight");

    t.check(svc.pause(OperationClass::Convert), "pause accepted");
    t.check(mock.pendingCount() == 2, "pause ack held");
    t.check(mock.deliverPendingAt(1), "ack delivered first");
    t.check(ev.paused == 1, "paused event on ack");
    t.check(mock.deliverPendingAt(0), "older poll delivered after the ack");

    auto op = svc.currentOperation(OperationClass::Convert);
    t.check(op && op->status == OperationStatus::Paused,
            "older poll leaves the operation paused");
    t.check(ev.resumed == 0, "no resumed event from the older poll");
    t.check(items[0].progress == 20, "older poll still updates items");

    t.check(svc.resume(OperationClass::Convert), "resume accepted after pause");
    mock.setDeferred(false);
    mock.flushPending();
    t.check(ev.resumed == 1, "resumed on ack");
    svc.cancel(OperationClass::Convert);
}

void test_pending_start_cancel_resets_items(TestContext &t) {
    MockOperationTransport mock;
    mock.setDeferred(true);
    OperationService svc(&mock, fastSettings());
    Events ev;
    ev.attach(svc);
    auto items = makeItems(2);
    OperationHandle handle;
    EngineError err;
    t.check(svc.startOperation(OperationClass::Publish, items, {}, handle, err),
            "start sent");
    t.check(items[0].status == ItemStatus::Starting, "items marked starting");
    t.check(svc.cancel(OperationClass::Publish), "cancel before the reply");
    t.check(items[0].status == ItemStatus::Pending &&
                items[1].status == ItemStatus::Pending,
            "items back to pending");
    t.check(ev.aborted == 1 && ev.reason == AbortReason::Canceled,
            "canceled reported");
    mock.flushPending();
    spin(20);
    t.check(ev.started == 0, "late start reply ignored");
    t.check(items[0].status == ItemStatus::Pending, "items stay pending");
}

void test_backend_pause_is_mirrored(TestContext &t) {
    PausableWorker worker;
    OperationService svc(&worker, fastSettings());
    Events ev;
    ev.attach(svc);
    auto items = makeItems(1);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Convert, items, {}, handle, err);
    t.check(waitUntil([&] { return worker.polls >= 1; }), "first poll");
    worker.remotePaused = true; // paused from another client
    t.check(waitUntil([&] { return ev.paused == 1; }), "paused mirrored");
    worker.remotePaused = false;
    t.check(waitUntil([&] { return ev.resumed == 1; }), "resume mirrored");
    svc.cancel(OperationClass::Convert);
}

void test_timeout(TestContext &t) {
    PausableWorker worker;
    ClientSettings settings = fastSettings();
    settings.policies[OperationClass::Patch].maxDurationMs = 500;
    OperationService svc(&worker, settings);
    qint64 now = 10000;
    svc.setClock([&now] { return now; });
    Events ev;
    ev.attach(svc);

    auto items = makeItems(1);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Patch, items, {}, handle, err);
    t.check(waitUntil([&] { return worker.polls >= 2; }), "polling within budget");
    t.check(ev.aborted == 0, "no abort within budget");
    now += 501;
    t.check(waitUntil([&] { return ev.aborted > 0; }), "timeout abort");
    t.check(ev.reason == AbortReason::Timeout, "reason timeout");
    const auto op = svc.currentOperation(OperationClass::Patch);
    t.check(op && op->status == OperationStatus::TimedOut, "status timedOut");
    t.check(!svc.registry().isActive(OperationClass::Patch), "slot released");
}

void test_stale_result_discarded(TestContext &t) {
    MockOperationTransport mock;
    OperationService svc(&mock, fastSettings());
    Events ev;
    ev.attach(svc);
    auto items = makeItems(1);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Publish, items, {}, handle, err);

    mock.setDeferred(true);
    ProgressSnapshot done;
    done.status = RemoteStatus::Completed;
    done.items = {{0, itemSnap(ItemStatus::Completed)}};
    mock.queueProgressReply(progressOk(done));
    t.check(waitUntil([&] { return mock.pendingCount() == 1; }), "poll in flight");

    t.check(svc.cancel(OperationClass::Publish), "cancel while in flight");
    mock.flushPending();
    spin(20);
    t.check(ev.terminal == 0, "late completion is discarded");
    t.check(items[0].status != ItemStatus::Completed, "items untouched");
    t.check(ev.aborted == 1, "only the cancel is reported");
}

void test_immediate_first_poll(TestContext &t) {
    MockOperationTransport mock;
    ClientSettings settings = fastSettings(10000);
    settings.policies[OperationClass::Patch].immediateFirstPoll = true;
    OperationService svc(&mock, settings);
    Events ev;
    ev.attach(svc);

    ProgressSnapshot done;
    done.status = RemoteStatus::Completed;
    done.totalCount = 2;
    mock.queueProgressReply(progressOk(done));

    auto patchItems = makeItems(2);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Patch, patchItems, {}, handle, err);
    t.check(waitUntil([&] { return ev.terminal == 1; }, 1000),
            "patch finishes without waiting an interval");
    t.check(ev.summary.successCount == 2,
            "unreported items converge to completed");

    auto convertItems = makeItems(1);
    svc.startOperation(OperationClass::Convert, convertItems, {}, handle, err);
    spin(50);
    t.check(mock.progressCalls() == 1, "convert waits a full interval");
    svc.cancel(OperationClass::Convert);
}

void test_no_overlapping_polls(TestContext &t) {
    MockOperationTransport mock;
    OperationService svc(&mock, fastSettings(1, 10));
    auto items = makeItems(1);
    OperationHandle handle;
    EngineError err;
    svc.startOperation(OperationClass::Convert, items, {}, handle, err);
    mock.setDeferred(true);
    t.check(waitUntil([&] { return mock.pendingCount() == 1; }), "poll in flight");
    spin(30);
    t.check(mock.progressCalls() == 1, "no second poll while one is in flight");
    mock.setDeferred(false);
    mock.flushPending();
    t.check(waitUntil([&] { return mock.progressCalls() >= 3; }),
            "polling resumes after the reply");
    t.check(mock.maxOverlappingPolls() == 1, "never more than one poll");
    svc.cancel(OperationClass::Convert);
}

void test_start_rejections(TestContext &t) {
    MockOperationTransport mock;
    OperationService svc(&mock, fastSettings(10000));
    Events ev;
    ev.attach(svc);

    auto items = makeItems(1);
    auto other = makeItems(1);
    OperationHandle handle;
    EngineError err;
    t.check(svc.startOperation(OperationClass::Convert, items, {}, handle, err),
            "first start");
    t.check(!svc.startOperation(OperationClass::Convert, other, {}, handle, err),
            "same class rejected");
    t.check(err.kind == ErrorKind::AlreadyActive, "AlreadyActive");
    t.check(mock.startCalls() == 1, "rejection makes no network call");
    t.check(svc.startOperation(OperationClass::Patch, other, {}, handle, err),
            "different class accepted");

    std::vector<Item> none;
    t.check(!svc.startOperation(OperationClass::Publish, none, {}, handle, err) &&
                err.kind == ErrorKind::InvalidInput,
            "empty item list rejected");

    svc.cancel(OperationClass::Convert);
    svc.cancel(OperationClass::Patch);

    StartReply refused;
    refused.failure = TransportFailure::Rejected;
    refused.error = "No files provided";
    mock.queueStartReply(refused);
    auto again = makeItems(2);
    const int abortedBefore = ev.aborted;
    t.check(svc.startOperation(OperationClass::Convert, again, {}, handle, err),
            "start sent");
    t.check(ev.aborted == abortedBefore + 1 &&
                ev.reason == AbortReason::StartFailed,
            "failed start reported as start-failed");
    t.check(!svc.registry().isActive(OperationClass::Convert),
            "slot released after failed start");
    t.check(again[0].status == ItemStatus::Pending, "items back to pending");
}

AuthReply authOk(bool code = false, bool password = false) {
    AuthReply r;
    r.ok = true;
    r.needsCode = code;
    r.needsPassword = password;
    return r;
}

AuthCredentials credentials() {
    AuthCredentials c;
    c.apiId = "123456";
    c.apiHash = "0123456789abcdef";
    c.phoneNumber = "+15550100";
    return c;
}

void test_auth_challenges(TestContext &t) {
    MockOperationTransport mock;
    OperationRegistry registry;
    AuthController auth(&mock, registry, 1);
    int connected = 0;
    std::vector<AuthPhase> phases;
    QObject::connect(&auth, &AuthController::connected, &auth,
                     [&] { ++connected; });
    QObject::connect(&auth, &AuthController::phaseChanged, &auth,
                     [&](AuthPhase p) { phases.push_back(p); });

    mock.queueAuthReply(authOk(true));
    mock.queueAuthReply(authOk(false, true));
    mock.queueAuthReply(authOk());

    EngineError err;
    t.check(auth.submitCredentials(credentials(), err), "credentials sent");
    t.check(auth.phase() == AuthPhase::AwaitingCode, "awaiting code");
    t.check(!registry.isActive(OperationClass::Auth),
            "slot free while waiting for the user");
    t.check(!auth.submitCode("12", err) && err.kind == ErrorKind::InvalidInput,
            "short code rejected locally");
    t.check(mock.codeCalls() == 0, "invalid code never sent");
    t.check(auth.submitCode("12345", err), "code sent");
    t.check(mock.lastCode() == "12345", "code forwarded");
    t.check(auth.phase() == AuthPhase::AwaitingPassword, "awaiting password");
    t.check(auth.submitPassword("x", err), "password sent");
    t.check(auth.phase() == AuthPhase::Connected, "connected");
    t.check(connected == 1, "connected emitted once");
    t.check(phases.size() == 4 && phases.front() == AuthPhase::Connecting &&
                phases.back() == AuthPhase::Connected,
            "every phase announced in order");

    auth.disconnectAccount();
    t.check(auth.phase() == AuthPhase::Disconnected, "disconnected");
    t.check(mock.clearSessionCalls() == 1, "remote session cleared");
}

void test_auth_locked_retry(TestContext &t) {
    MockOperationTransport mock;
    OperationRegistry registry;
    AuthController auth(&mock, registry, 1);
    int failed = 0;
    int retries = 0;
    int connected = 0;
    QObject::connect(&auth, &AuthController::failed, &auth,
                     [&](const EngineError &) { ++failed; });
    QObject::connect(&auth, &AuthController::retryScheduled, &auth,
                     [&](int, int) { ++retries; });
    QObject::connect(&auth, &AuthController::connected, &auth,
                     [&] { ++connected; });

    AuthReply locked;
    locked.failure = TransportFailure::ResourceLocked;
    locked.error = "database is locked";
    mock.queueAuthReply(locked);
    mock.queueAuthReply(locked);
    mock.queueAuthReply(authOk());

    EngineError err;
    t.check(auth.submitCredentials(credentials(), err), "credentials sent");
    t.check(registry.isActive(OperationClass::Auth), "slot held while retrying");
    EngineError second;
    t.check(!auth.submitCredentials(credentials(), second) &&
                second.kind == ErrorKind::AlreadyActive,
            "overlapping submission rejected");
    t.check(waitUntil([&] { return connected == 1; }), "connected after retries");
    t.check(failed == 0, "no error surfaced");
    t.check(retries == 2 && auth.retryCount() == 2, "two retries");
    t.check(mock.connectCalls() == 3, "three connect attempts");
    t.check(!registry.isActive(OperationClass::Auth), "slot released");
}

void test_auth_failure_keeps_step(TestContext &t) {
    MockOperationTransport mock;
    OperationRegistry registry;
    AuthController auth(&mock, registry, 1);
    EngineError lastError;
    QObject::connect(&auth, &AuthController::failed, &auth,
                     [&](const EngineError &e) { lastError = e; });
    mock.queueAuthReply(authOk(true));
    AuthReply wrong;
    wrong.failure = TransportFailure::Rejected;
    wrong.error = "Invalid verification code";
    mock.queueAuthReply(wrong);

    EngineError err;
    auth.submitCredentials(credentials(), err);
    t.check(auth.submitCode("54321", err), "code sent");
    t.check(lastError.kind == ErrorKind::Rejected, "failure surfaced");
    t.checkContains(lastError.message, "Invalid", "backend message kept");
    t.check(auth.phase() == AuthPhase::AwaitingCode, "same step retried");
    t.check(!registry.isActive(OperationClass::Auth), "slot released on failure");
}

void test_snapshot_round_trip(TestContext &t) {
    ProgressSnapshot snap;
    snap.progress = 33;
    snap.currentStage = "Converting clip1.mp4";
    snap.totalCount = 3;
    snap.items = {{0, itemSnap(ItemStatus::Processing, 45)},
                  {1, itemSnap(ItemStatus::Pending)},
                  {2, itemSnap(ItemStatus::Processing, 5)}};
    snap.items[0].stage = std::string("encode");

    ProgressSnapshot decoded;
    QString error;
    t.check(jobwatchclient::snapshotFromJson(jobwatchclient::snapshotToJson(snap),
                                             decoded, &error),
            "round trip decodes");
    t.check(decoded.items.size() == 3 && decoded.progress == 33,
            "round trip keeps content");

    auto items = makeItems(3);
    reconcileItems(items, decoded.items);
    const auto first = items;
    const bool changedAgain = reconcileItems(items, decoded.items);
    t.check(!changedAgain, "second pass is a no-op");
    bool same = true;
    for (std::size_t i = 0; i < items.size(); ++i)
        same = same && items[i].status == first[i].status &&
               items[i].progress == first[i].progress &&
               items[i].stage == first[i].stage;
    t.check(same, "item list identical after both passes");
}

void test_progress_body_normalization(TestContext &t) {
    using jobwatchclient::parseProgressBody;

    auto r = parseProgressBody(
        R"({"success":true,"data":{"data":{"status":"processing","progress":40,)"
        R"("file_statuses":{"0":{"status":"converting","progress":40},)"
        R"("x":{"status":"done"}},"total_files":2}}})");
    t.check(r.ok, "double-wrapped body accepted");
    t.check(r.snapshot.items.size() == 1, "non-integer keys dropped");
    t.check(r.snapshot.items.count(0) &&
                r.snapshot.items.at(0).status == ItemStatus::Processing &&
                r.snapshot.items.at(0).progress == 40,
            "backend vocabulary normalized");

    r = parseProgressBody(
        R"({"success":true,"data":{"progress":{"status":"completed","total_files":1}}})");
    t.check(r.ok && r.snapshot.status == RemoteStatus::Completed,
            "progress-wrapped body accepted");

    r = parseProgressBody(
        R"({"success":true,"data":{"status":"processing","total_files":2,)"
        R"("file_statuses":{"0":{"status":"completed"},"1":{"status":"completed"}}}})");
    t.check(r.ok && r.snapshot.status == RemoteStatus::Completed,
            "all items done counts as completed");

    r = parseProgressBody(R"({"success":true,"data":{"status":"error","current_stage":"ffmpeg missing"}})");
    t.check(r.ok && r.snapshot.errorMessage &&
                *r.snapshot.errorMessage == "ffmpeg missing",
            "error stage becomes the message");

    r = parseProgressBody(R"({"data":{"status":"processing"}})");
    t.check(!r.ok && r.failure == TransportFailure::Malformed,
            "missing success flag is malformed");
    r = parseProgressBody("<html>502</html>");
    t.check(!r.ok && r.failure == TransportFailure::Malformed,
            "non-JSON is malformed");
    r = parseProgressBody(R"({"success":true,"data":{"progress":5}})");
    t.check(!r.ok && r.failure == TransportFailure::Malformed,
            "success without status is malformed");
    r = parseProgressBody(R"({"success":false,"error":"Process not found"})");
    t.check(!r.ok && r.failure == TransportFailure::Rejected,
            "success=false is rejected");
}

void test_other_bodies(TestContext &t) {
    using namespace jobwatchclient;
    auto start = parseStartBody(R"({"success":true,"data":{"process_id":"hex_1"}})",
                                QStringLiteral("hex_proposed"));
    t.check(start.ok && start.operationId == "hex_1", "id read from data");
    start = parseStartBody(R"({"success":true})", QStringLiteral("conv_9"));
    t.check(start.ok && start.operationId == "conv_9", "falls back to proposal");

    auto auth = parseAuthBody(R"({"success":true,"data":{"needs_code":true}})");
    t.check(auth.ok && auth.needsCode && !auth.needsPassword, "needs_code");
    auth = parseAuthBody(R"({"success":false,"error":"database is locked"})");
    t.check(auth.failure == TransportFailure::ResourceLocked, "locked classified");

    t.check(HttpOperationTransport::startPath(OperationClass::Patch) ==
                QStringLiteral("/api/hex-edit"),
            "patch endpoint");
    StartRequest req;
    req.files = {"/a.webm", "/b.webm"};
    req.options["pack_name"] = "mypack";
    const QJsonObject payload = HttpOperationTransport::startPayload(
        OperationClass::Publish, req, QStringLiteral("sticker_1"));
    const QJsonArray media = payload.value("media_files").toArray();
    t.check(media.size() == 2, "one media entry per file");
    t.check(media.at(0).toObject().value("emoji").toString() ==
                QStringLiteral("😀"),
            "default emoji");
    t.check(payload.value("pack_name").toString() == QStringLiteral("mypack"),
            "pack name forwarded");
    t.check(payload.value("process_id").toString() == QStringLiteral("sticker_1"),
            "proposed id forwarded");
}

void test_settings(TestContext &t) {
    QTemporaryDir dir;
    t.check(dir.isValid(), "temp dir");
    const QString path = dir.filePath(QStringLiteral("jobwatch.ini"));
    {
        QSettings s(path, QSettings::IniFormat);
        s.setValue("Backend/baseUrl", "http://worker.local:5001/");
        s.setValue("Polling/patch/intervalMs", -5);
        s.setValue("Polling/convert/maxConsecutiveErrors", 6);
        s.setValue("Auth/retryBackoffMs", 0);
    }
    QSettings s(path, QSettings::IniFormat);
    ClientSettings loaded = ClientSettings::load(s);
    t.check(loaded.baseUrl == QStringLiteral("http://worker.local:5001"),
            "trailing slash stripped");
    t.check(loaded.policyFor(OperationClass::Patch).pollIntervalMs == 250,
            "non-positive interval falls back");
    t.check(loaded.policyFor(OperationClass::Convert).maxConsecutiveErrors == 6,
            "override applied");
    t.check(loaded.authRetryBackoffMs == 1000, "backoff falls back");
    t.check(loaded.requestTimeoutMs == 15000, "default request timeout");

    loaded.policies[OperationClass::Publish].pollIntervalMs = 1500;
    loaded.defaultOutputDir = dir.filePath(QStringLiteral("out"));
    loaded.save(s);
    s.sync();
    const ClientSettings again = ClientSettings::load(s);
    t.check(again.policyFor(OperationClass::Publish).pollIntervalMs == 1500,
            "saved value reloads");
    t.check(again.policyFor(OperationClass::Patch).immediateFirstPoll,
            "class default preserved through save");
    t.check(again.defaultOutputDir ==
                QDir::cleanPath(dir.filePath(QStringLiteral("out"))),
            "output dir saved with the rest");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_convert_completes_once(t);
    test_persistent_error_aborts(t);
    test_pause_resume(t);
    test_late_poll_after_pause_ack(t);
    test_pending_start_cancel_resets_items(t);
    test_backend_pause_is_mirrored(t);
    test_timeout(t);
    test_stale_result_discarded(t);
    test_immediate_first_poll(t);
    test_no_overlapping_polls(t);
    test_start_rejections(t);
    test_auth_challenges(t);
    test_auth_locked_retry(t);
    test_auth_failure_keeps_step(t);
    test_snapshot_round_trip(t);
    test_progress_body_normalization(t);
    test_other_bodies(t);
    test_settings(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] jobwatch_client_tests\n";
    return EXIT_SUCCESS;
}
