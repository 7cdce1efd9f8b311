#ifndef SESSION_ERRORS_HPP
#define SESSION_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "adaptive/selector.hpp"
#include "session/model.hpp"

namespace session {

enum class ErrorCode {
  INVALID_SESSION,
  SESSION_CLOSED,
  SESSION_EXPIRED,
  QUESTION_NOT_FOUND,
  UNSUPPORTED_LANGUAGE,
  INVALID_STATE,
  INVALID_TEST,
  SOURCE_TOO_LARGE
};

const char* ErrorCodeName(ErrorCode code);

// Scored outcome of a session, final once the session is terminal.
struct SessionResult {
  std::string session_id;
  Status status = Status::NOT_STARTED;
  double total_score = 0;
  double max_score = 0;
  // 0 to 100.
  double percentage = 0;
  uint32_t questions_answered = 0;
  uint32_t questions_total = 0;
  // Answers waiting for manual review.
  uint32_t pending_review = 0;
  std::string end_reason;
  int64_t completed_at = 0;
  bool has_adaptive_results = false;
  adaptive::Results adaptive_results;
};

class SessionError : public std::runtime_error {
 public:
  SessionError(ErrorCode code, const std::string& message)
      : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message),
        code_(code) {}

  SessionError(ErrorCode code, const std::string& message,
               SessionResult result)
      : SessionError(code, message) {
    has_result_ = true;
    result_ = std::move(result);
  }

  ErrorCode code() const { return code_; }

  // Set for SESSION_CLOSED and SESSION_EXPIRED.
  bool has_result() const { return has_result_; }
  const SessionResult& result() const { return result_; }

 private:
  ErrorCode code_;
  bool has_result_ = false;
  SessionResult result_;
};

}  // namespace session

#endif
