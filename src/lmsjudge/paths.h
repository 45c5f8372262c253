#ifndef LMSJUDGE_PATHS_H_
#define LMSJUDGE_PATHS_H_

#include <lmsjudge/paths.h>
#include <lmsjudge/contest.h>

// one box per invocation; everything inside is removed after the invocation
fs::path BoxPath(long id);
fs::path BoxSource(long id, Language lang);
fs::path BoxProgram(long id, Language lang);
fs::path BoxInput(long id);
fs::path BoxOutput(long id);
fs::path BoxError(long id);
fs::path BoxCompileMessage(long id);

#endif  // LMSJUDGE_PATHS_H_
