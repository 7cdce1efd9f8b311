#ifndef CATALOG_CATALOG_HPP
#define CATALOG_CATALOG_HPP

#include <map>
#include <string>
#include <vector>

#include "executor/executor.hpp"

namespace catalog {

enum class QuestionType { MULTIPLE_CHOICE, TRUE_FALSE, CODING, ESSAY };

const char* QuestionTypeName(QuestionType type);

struct Option {
  std::string id;
  std::string text;
  bool is_correct = false;
};

struct Question {
  std::string id;
  std::string title;
  std::string description;
  QuestionType type = QuestionType::MULTIPLE_CHOICE;
  double difficulty = 0.5;
  std::vector<Option> options;
  std::vector<executor::TestCase> test_cases;
  double points = 1;
  // Zero means the default of the language.
  uint32_t time_limit_seconds = 0;
  uint32_t memory_limit_mb = 0;
  // Suggested language of coding questions.
  std::string language;
  std::string starter_code;

  bool IsChoice() const {
    return type == QuestionType::MULTIPLE_CHOICE ||
           type == QuestionType::TRUE_FALSE;
  }
};

struct Test {
  std::string id;
  std::string title;
  std::vector<Question> questions;
};

// Read-only source of question definitions. Implementations must be safe to
// read from many threads, and the returned questions must stay valid and
// unchanged for the lifetime of the catalog.
class QuestionCatalog {
 public:
  // Returns the questions of a test in declared order, nullptr if the test
  // does not exist.
  virtual const std::vector<Question>* GetQuestionsForTest(
      const std::string& test_id) const = 0;

  virtual ~QuestionCatalog() = default;
};

class InMemoryCatalog : public QuestionCatalog {
 public:
  // Validates and adds a test, replacing one with the same id. Throws
  // kj::Exception on invalid questions.
  void AddTest(Test test);

  const std::vector<Question>* GetQuestionsForTest(
      const std::string& test_id) const override;

  std::vector<std::string> TestIds() const;

  // Reads a JSON document shaped like capnproto::Catalog.
  static InMemoryCatalog FromJson(const std::string& json);
  static InMemoryCatalog Load(const std::string& path);

 private:
  std::map<std::string, Test> tests_;
};

}  // namespace catalog

#endif
