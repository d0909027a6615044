#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcServer)
Q_DECLARE_LOGGING_CATEGORY(lcClient)
Q_DECLARE_LOGGING_CATEGORY(lcSync)
Q_DECLARE_LOGGING_CATEGORY(lcClipboard)

namespace clipsync {

// Installs a Qt message handler that stamps time/level/category on every
// line and writes it to stderr, and additionally appends to `log_file` when
// that is non-empty.
void install_logging(const QString& log_file);

// Turns on debug output for every clipsync.* category.
void enable_debug_logging();

} // namespace clipsync
