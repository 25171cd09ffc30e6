/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace streamlift {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace streamlift

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (streamlift::verboseLogging) qDebug()

#endif // LOGGING_H
