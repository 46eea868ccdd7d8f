#include "PollHandle.hpp"

PollHandle::PollHandle(QObject *parent) : QObject(parent) {
    timer_.setSingleShot(true);
    timer_.setTimerType(Qt::PreciseTimer);
    connect(&timer_, &QTimer::timeout, this, [this] {
        // Moved out first: the callback may re-arm this handle.
        auto fn = std::move(fn_);
        fn_ = nullptr;
        if (fn)
            fn();
    });
}

void PollHandle::arm(int delayMs, std::function<void()> fn) {
    fn_ = std::move(fn);
    timer_.start(delayMs < 0 ? 0 : delayMs);
}

void PollHandle::cancel() {
    timer_.stop();
    fn_ = nullptr;
}
