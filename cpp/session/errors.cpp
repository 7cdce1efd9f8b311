#include "session/errors.hpp"

namespace session {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::INVALID_SESSION:
      return "InvalidSession";
    case ErrorCode::SESSION_CLOSED:
      return "SessionClosed";
    case ErrorCode::SESSION_EXPIRED:
      return "SessionExpired";
    case ErrorCode::QUESTION_NOT_FOUND:
      return "QuestionNotFound";
    case ErrorCode::UNSUPPORTED_LANGUAGE:
      return "UnsupportedLanguage";
    case ErrorCode::INVALID_STATE:
      return "InvalidState";
    case ErrorCode::INVALID_TEST:
      return "InvalidTest";
    case ErrorCode::SOURCE_TOO_LARGE:
      return "SourceTooLarge";
  }
  return "Unknown";
}

}  // namespace session
