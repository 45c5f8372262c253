#ifndef INCLUDE_LMSJUDGE_PATHS_H_
#define INCLUDE_LMSJUDGE_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// scratch directories of ProcessInvoker are created under this root
extern fs::path kBoxRoot;

#endif  // INCLUDE_LMSJUDGE_PATHS_H_
