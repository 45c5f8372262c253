#ifndef INCLUDE_LMSJUDGE_CATALOG_H_
#define INCLUDE_LMSJUDGE_CATALOG_H_

#include <mutex>
#include <filesystem>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>
#include "contest.h"

// Contests loaded from a JSON document.
class ContestCatalog : public ContestSource {
  mutable std::mutex mtx_;
  std::unordered_map<int, Contest> contests_;
 public:
  std::optional<Contest> GetContest(int contest_id) const override;

  void Put(Contest&& contest);
  size_t Size() const;

  // Accept an array of contests or {"contests": [...]}. Return false (and keep
  // the current contents) if the document is malformed.
  bool Load(const nlohmann::json& data);
  bool LoadFile(const std::filesystem::path& path);
};

// throw nlohmann::json::exception or std::invalid_argument on malformed input
Contest ParseContest(const nlohmann::json& data);

#endif  // INCLUDE_LMSJUDGE_CATALOG_H_
