#pragma once

#include <QObject>
#include <QTimer>
#include <chrono>
#include <optional>

namespace lanlog {

/**
 * ToggleDebouncer - coalesces rapid boolean updates into one delayed value.
 *
 * Every push() restarts the quiet window and replaces the pending value; when
 * the window elapses without another push, settled() fires once with the most
 * recent value.
 */
class ToggleDebouncer : public QObject {
    Q_OBJECT

public:
    explicit ToggleDebouncer(std::chrono::milliseconds quiet_window,
                             QObject* parent = nullptr);

    void push(bool value);

    // Emit the pending value now, if any.
    void flush();

    // Drop the pending value without emitting.
    void cancel();

    [[nodiscard]] bool hasPending() const { return pending_.has_value(); }
    [[nodiscard]] std::chrono::milliseconds quietWindow() const { return quiet_window_; }

signals:
    void settled(bool value);

private:
    void onTimeout();

    std::chrono::milliseconds quiet_window_;
    QTimer timer_;
    std::optional<bool> pending_;
};

} // namespace lanlog
