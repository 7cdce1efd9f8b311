#include "session/model.hpp"

namespace session {

const char* StatusName(Status status) {
  switch (status) {
    case Status::NOT_STARTED:
      return "not_started";
    case Status::IN_PROGRESS:
      return "in_progress";
    case Status::PAUSED:
      return "paused";
    case Status::COMPLETED:
      return "completed";
    case Status::EXPIRED:
      return "expired";
    case Status::TERMINATED:
      return "terminated";
  }
  return "unknown";
}

}  // namespace session
