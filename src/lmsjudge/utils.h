#ifndef LMSJUDGE_UTILS_H_
#define LMSJUDGE_UTILS_H_

#include <string>
#include <filesystem>

#include <lmsjudge/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);
// read at most max_len bytes; truncated is set if the file is longer
std::string ReadFile(const fs::path&, size_t max_len, bool* truncated = nullptr);

#endif  // LMSJUDGE_UTILS_H_
