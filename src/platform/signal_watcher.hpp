#pragma once

#include <QObject>
#include <QTimer>

namespace clipsync::platform {

/**
 * SignalWatcher - turns SIGINT/SIGTERM into a Qt signal.
 *
 * The handler only flips an atomic flag; a timer on the owning thread's
 * event loop notices it and emits shutdownRequested() once.
 */
class SignalWatcher : public QObject {
    Q_OBJECT

public:
    explicit SignalWatcher(QObject* parent = nullptr);

    /**
     * Install the handlers and start watching.
     */
    void install();

    [[nodiscard]] static bool triggered();

signals:
    void shutdownRequested();

private:
    QTimer poll_;
    bool emitted_ = false;
};

} // namespace clipsync::platform
