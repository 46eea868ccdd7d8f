#include "jobwatch/MockOperationTransport.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace jobwatch {

namespace {

template <typename T> T takeFront(std::deque<T> &q, T fallback) {
    if (q.empty())
        return fallback;
    T v = std::move(q.front());
    q.pop_front();
    return v;
}

AckReply okAck() {
    AckReply r;
    r.ok = true;
    return r;
}

} // namespace

void MockOperationTransport::deliver(std::function<void()> fn) {
    if (deferred_)
        pending_.push_back(std::move(fn));
    else
        fn();
}

std::size_t MockOperationTransport::flushPending() {
    std::vector<std::function<void()>> batch;
    batch.swap(pending_);
    for (auto &fn : batch)
        fn();
    return batch.size();
}

bool MockOperationTransport::deliverPendingAt(std::size_t index) {
    if (index >= pending_.size())
        return false;
    std::function<void()> fn = std::move(pending_[index]);
    pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(index));
    fn();
    return true;
}

void MockOperationTransport::startOperation(OperationClass cls,
                                            const StartRequest &req,
                                            StartCB done) {
    ++startCalls_;
    lastStartClass_ = cls;
    lastStartRequest_ = req;
    StartReply fallback;
    fallback.ok = true;
    fallback.operationId =
        std::string("mock-") + toString(cls) + "-" + std::to_string(nextId_++);
    StartReply r = takeFront(startReplies_, fallback);
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::fetchProgress(const std::string &operationId,
                                           ProgressCB done) {
    ++progressCalls_;
    const int now = ++inFlight_[operationId];
    maxOverlap_ = std::max(maxOverlap_, now);
    ProgressReply fallback;
    fallback.failure = TransportFailure::Network;
    fallback.error = "No scripted progress reply";
    ProgressReply r = takeFront(progressReplies_, fallback);
    deliver([this, operationId, done = std::move(done), r]() {
        --inFlight_[operationId];
        done(r);
    });
}

void MockOperationTransport::pauseOperation(const std::string &, AckCB done) {
    ++pauseCalls_;
    AckReply r = takeFront(pauseReplies_, okAck());
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::resumeOperation(const std::string &,
                                             AckCB done) {
    ++resumeCalls_;
    AckReply r = takeFront(resumeReplies_, okAck());
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::stopOperation(const std::string &, AckCB done) {
    ++stopCalls_;
    AckReply r = okAck();
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::connectAccount(const AuthCredentials &,
                                            AuthCB done) {
    ++connectCalls_;
    AuthReply fallback;
    fallback.failure = TransportFailure::Rejected;
    fallback.error = "No scripted auth reply";
    AuthReply r = takeFront(authReplies_, fallback);
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::verifyCode(const std::string &code, AuthCB done) {
    ++codeCalls_;
    lastCode_ = code;
    AuthReply fallback;
    fallback.failure = TransportFailure::Rejected;
    fallback.error = "Invalid verification code";
    AuthReply r = takeFront(authReplies_, fallback);
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::verifyPassword(const std::string &password,
                                            AuthCB done) {
    ++passwordCalls_;
    lastPassword_ = password;
    AuthReply fallback;
    fallback.failure = TransportFailure::Rejected;
    fallback.error = "Invalid password";
    AuthReply r = takeFront(authReplies_, fallback);
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::clearSession(AckCB done) {
    ++clearSessionCalls_;
    AckReply r = okAck();
    deliver([done = std::move(done), r]() { done(r); });
}

void MockOperationTransport::checkHealth(AckCB done) {
    AckReply r = okAck();
    deliver([done = std::move(done), r]() { done(r); });
}

} // namespace jobwatch
