#ifndef INCLUDE_LMSJUDGE_SERIALIZE_H_
#define INCLUDE_LMSJUDGE_SERIALIZE_H_

#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "lifecycle.h"
#include "submission.h"
#include "leaderboard.h"

nlohmann::json TestCaseResultJSON(const TestCaseResult&);
nlohmann::json TestCaseResultsJSON(const std::vector<TestCaseResult>&);
nlohmann::json SubmissionJSON(const Submission&);
nlohmann::json SubmitResponseJSON(const SubmitResponse&);
nlohmann::json RunResponseJSON(const RunResponse&);
nlohmann::json LeaderboardJSON(const std::vector<LeaderboardEntry>&);
nlohmann::json ParticipantsJSON(const std::vector<Participant>&);

#endif  // INCLUDE_LMSJUDGE_SERIALIZE_H_
