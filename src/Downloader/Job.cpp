#include "Job.hpp"

namespace docfetch {

const char* jobStateName(JobState state) {
  switch (state) {
    case JobState::QUEUED:
      return "queued";
    case JobState::DOWNLOADING:
      return "downloading";
    case JobState::PAUSED:
      return "paused";
    case JobState::COMPLETED:
      return "completed";
    case JobState::FAILED:
      return "failed";
    case JobState::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

bool isTerminal(JobState state) {
  return state == JobState::COMPLETED || state == JobState::FAILED ||
         state == JobState::CANCELLED;
}

}  // namespace docfetch
