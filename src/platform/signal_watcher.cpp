#include "platform/signal_watcher.hpp"

#include <atomic>
#include <csignal>

namespace clipsync::platform {

namespace {

std::atomic<bool> shutdown_flag(false);

void signalHandler(int) {
    shutdown_flag = true;
}

} // namespace

SignalWatcher::SignalWatcher(QObject* parent)
    : QObject(parent)
    , poll_(this)
{
    poll_.setInterval(100);
    connect(&poll_, &QTimer::timeout, this, [this]() {
        if (!emitted_ && shutdown_flag.load()) {
            emitted_ = true;
            poll_.stop();
            emit shutdownRequested();
        }
    });
}

void SignalWatcher::install() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    poll_.start();
}

bool SignalWatcher::triggered() {
    return shutdown_flag.load();
}

} // namespace clipsync::platform
