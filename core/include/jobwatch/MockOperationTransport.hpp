#pragma once
#include "OperationTransport.hpp"

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace jobwatch {

// Scriptable in-process transport. Replies are consumed FIFO per call kind;
// an empty queue falls back to a default reply (start and acks succeed,
// progress and auth fail). In deferred mode callbacks are held until
// flushPending(), which lets tests hold a poll "in flight".
class MockOperationTransport : public OperationTransport {
public:
    void startOperation(OperationClass cls, const StartRequest &req,
                        StartCB done) override;
    void fetchProgress(const std::string &operationId,
                       ProgressCB done) override;
    void pauseOperation(const std::string &operationId, AckCB done) override;
    void resumeOperation(const std::string &operationId, AckCB done) override;
    void stopOperation(const std::string &operationId, AckCB done) override;

    void connectAccount(const AuthCredentials &credentials,
                        AuthCB done) override;
    void verifyCode(const std::string &code, AuthCB done) override;
    void verifyPassword(const std::string &password, AuthCB done) override;
    void clearSession(AckCB done) override;

    void checkHealth(AckCB done) override;

    // Scripting
    void queueStartReply(StartReply r) { startReplies_.push_back(std::move(r)); }
    void queueProgressReply(ProgressReply r) {
        progressReplies_.push_back(std::move(r));
    }
    void queuePauseReply(AckReply r) { pauseReplies_.push_back(std::move(r)); }
    void queueResumeReply(AckReply r) { resumeReplies_.push_back(std::move(r)); }
    void queueAuthReply(AuthReply r) { authReplies_.push_back(std::move(r)); }
    std::size_t remainingProgressReplies() const {
        return progressReplies_.size();
    }

    void setDeferred(bool deferred) { deferred_ = deferred; }
    std::size_t pendingCount() const { return pending_.size(); }
    // Delivers held callbacks in call order. Returns how many ran.
    std::size_t flushPending();
    // Delivers the held callback at `index` (call order) on its own, so
    // replies can be made to arrive out of order.
    bool deliverPendingAt(std::size_t index);

    // Observations
    int startCalls() const { return startCalls_; }
    int progressCalls() const { return progressCalls_; }
    int pauseCalls() const { return pauseCalls_; }
    int resumeCalls() const { return resumeCalls_; }
    int stopCalls() const { return stopCalls_; }
    int connectCalls() const { return connectCalls_; }
    int codeCalls() const { return codeCalls_; }
    int passwordCalls() const { return passwordCalls_; }
    int clearSessionCalls() const { return clearSessionCalls_; }
    // Highest number of simultaneously outstanding progress calls seen for
    // a single operation id.
    int maxOverlappingPolls() const { return maxOverlap_; }
    OperationClass lastStartClass() const { return lastStartClass_; }
    const StartRequest &lastStartRequest() const { return lastStartRequest_; }
    const std::string &lastCode() const { return lastCode_; }
    const std::string &lastPassword() const { return lastPassword_; }

private:
    void deliver(std::function<void()> fn);

    std::deque<StartReply> startReplies_;
    std::deque<ProgressReply> progressReplies_;
    std::deque<AckReply> pauseReplies_;
    std::deque<AckReply> resumeReplies_;
    std::deque<AuthReply> authReplies_;

    bool deferred_ = false;
    std::vector<std::function<void()>> pending_;

    int startCalls_ = 0;
    int progressCalls_ = 0;
    int pauseCalls_ = 0;
    int resumeCalls_ = 0;
    int stopCalls_ = 0;
    int connectCalls_ = 0;
    int codeCalls_ = 0;
    int passwordCalls_ = 0;
    int clearSessionCalls_ = 0;
    int nextId_ = 1;
    std::map<std::string, int> inFlight_;
    int maxOverlap_ = 0;
    OperationClass lastStartClass_ = OperationClass::Convert;
    StartRequest lastStartRequest_;
    std::string lastCode_;
    std::string lastPassword_;
};

} // namespace jobwatch
