#include "core/debouncer.hpp"

namespace lanlog {

ToggleDebouncer::ToggleDebouncer(std::chrono::milliseconds quiet_window, QObject* parent)
    : QObject(parent)
    , quiet_window_(quiet_window)
{
    timer_.setSingleShot(true);
    timer_.setInterval(quiet_window_);
    connect(&timer_, &QTimer::timeout, this, &ToggleDebouncer::onTimeout);
}

void ToggleDebouncer::push(bool value) {
    pending_ = value;
    timer_.start();
}

void ToggleDebouncer::flush() {
    timer_.stop();
    onTimeout();
}

void ToggleDebouncer::cancel() {
    timer_.stop();
    pending_.reset();
}

void ToggleDebouncer::onTimeout() {
    if (!pending_) {
        return;
    }
    const bool value = *pending_;
    pending_.reset();
    emit settled(value);
}

} // namespace lanlog
