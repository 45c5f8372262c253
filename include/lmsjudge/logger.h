#ifndef INCLUDE_LMSJUDGE_LOGGER_H_
#define INCLUDE_LMSJUDGE_LOGGER_H_

// Register fork handlers so that a forked child never inherits a locked sink.
// Call once from main thread before any fork.
void InitLogger();

#endif  // INCLUDE_LMSJUDGE_LOGGER_H_
