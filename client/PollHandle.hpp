// One pending poll. Wraps a single-shot QTimer so "at most one scheduled
// tick" holds by construction: arming again replaces the previous callback.
#pragma once
#include <QObject>
#include <QTimer>
#include <functional>

class PollHandle : public QObject {
    Q_OBJECT
public:
    explicit PollHandle(QObject *parent = nullptr);

    void arm(int delayMs, std::function<void()> fn);
    // Safe to call at any time, including from inside the callback.
    void cancel();
    bool isArmed() const { return timer_.isActive(); }

private:
    QTimer timer_;
    std::function<void()> fn_;
};
