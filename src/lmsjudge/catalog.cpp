#include <lmsjudge/catalog.h>

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

Question ParseQuestion(const nlohmann::json& data) {
  Question ret;
  ret.id = data.at("id").get<int>();
  ret.title = data.value("title", "");
  ret.time_limit = data.value("time_limit", ret.time_limit);
  ret.memory_limit = data.value("memory_limit", ret.memory_limit);
  std::vector<TestCase> test_cases;
  if (data.contains("test_cases")) {
    for (auto& item : data.at("test_cases")) {
      test_cases.emplace_back(
          item.at("id").get<int>(),
          item.value("input", ""),
          item.at("expected_output").get<std::string>(),
          item.at("marks").get<int64_t>(),
          item.value("is_hidden", false));
    }
  }
  ret.SetTestCases(std::move(test_cases));
  return ret;
}

} // namespace

Contest ParseContest(const nlohmann::json& data) {
  Contest ret;
  ret.id = data.at("id").get<int>();
  ret.name = data.value("name", "");
  ret.start_time = data.at("start_time").get<int64_t>();
  ret.end_time = data.at("end_time").get<int64_t>();
  ret.is_active = data.value("is_active", true);
  ret.max_attempts = data.value("max_attempts", ret.max_attempts);
  if (ret.max_attempts < 1) {
    throw std::invalid_argument("Contest " + std::to_string(ret.id) + ": max_attempts must be positive");
  }
  if (data.contains("allowed_languages")) {
    ret.allowed_languages.clear();
    for (auto& item : data.at("allowed_languages")) {
      Language lang = GetLanguage(item.get<std::string>());
      if (lang == Language::UNSUPPORTED) {
        throw std::invalid_argument("Contest " + std::to_string(ret.id) + ": unknown language " + item.dump());
      }
      ret.allowed_languages.insert(lang);
    }
  }
  if (data.contains("questions")) {
    for (auto& item : data.at("questions")) ret.questions.push_back(ParseQuestion(item));
  }
  return ret;
}

std::optional<Contest> ContestCatalog::GetContest(int contest_id) const {
  std::lock_guard lck(mtx_);
  auto it = contests_.find(contest_id);
  if (it == contests_.end()) return std::nullopt;
  return it->second;
}

void ContestCatalog::Put(Contest&& contest) {
  std::lock_guard lck(mtx_);
  int id = contest.id;
  contests_.insert_or_assign(id, std::move(contest));
}

size_t ContestCatalog::Size() const {
  std::lock_guard lck(mtx_);
  return contests_.size();
}

bool ContestCatalog::Load(const nlohmann::json& data) {
  using nlohmann::json;
  std::unordered_map<int, Contest> loaded;
  try {
    const json& list = data.is_object() ? data.at("contests") : data;
    if (!list.is_array()) {
      spdlog::warn("Contest catalog is not an array");
      return false;
    }
    for (auto& item : list) {
      Contest contest = ParseContest(item);
      int id = contest.id;
      if (!loaded.emplace(id, std::move(contest)).second) {
        spdlog::warn("Duplicate contest id {} in catalog", id);
        return false;
      }
    }
  } catch (json::exception& err) {
    spdlog::warn("Contest catalog parsing error: {}", err.what());
    return false;
  } catch (std::invalid_argument& err) {
    spdlog::warn("Invalid contest catalog: {}", err.what());
    return false;
  }
  std::lock_guard lck(mtx_);
  contests_ = std::move(loaded);
  spdlog::info("Loaded {} contests", contests_.size());
  return true;
}

bool ContestCatalog::LoadFile(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::warn("Unable to open contest catalog {}", path.string());
    return false;
  }
  nlohmann::json data;
  try {
    fin >> data;
  } catch (nlohmann::json::exception& err) {
    spdlog::warn("Contest catalog {} is not valid JSON: {}", path.string(), err.what());
    return false;
  }
  return Load(data);
}
