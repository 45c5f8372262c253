#include <lmsjudge/submission.h>

#include <cmath>
#include <stdexcept>

#include "utils.h"

bool Submission::IsTerminal() const {
  return status == SubmissionStatus::COMPLETED || status == SubmissionStatus::ERROR;
}

bool CanTransition(SubmissionStatus from, SubmissionStatus to) {
  switch (from) {
    case SubmissionStatus::PENDING:
      return to == SubmissionStatus::RUNNING || to == SubmissionStatus::ERROR;
    case SubmissionStatus::RUNNING:
      return to == SubmissionStatus::COMPLETED || to == SubmissionStatus::ERROR;
    case SubmissionStatus::COMPLETED: [[fallthrough]];
    case SubmissionStatus::ERROR: return false;
  }
  __builtin_unreachable();
}

void Transition(Submission& sub, SubmissionStatus to) {
  if (!CanTransition(sub.status, to)) {
    throw std::logic_error(std::string("Invalid submission transition ") +
        SubmissionStatusName(sub.status) + " -> " + SubmissionStatusName(to) +
        " (submission " + std::to_string(sub.id) + ")");
  }
  sub.status = to;
}

int ScorePercentage(int64_t marks_awarded, int64_t total_marks) {
  if (total_marks <= 0) return 0;
  return (int)std::lround(marks_awarded * 100.0 / total_marks);
}
