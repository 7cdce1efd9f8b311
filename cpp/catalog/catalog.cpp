#include "catalog/catalog.hpp"

#include <set>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/catalog.capnp.h"
#include "util/file.hpp"

namespace {

catalog::QuestionType FromCapnp(capnproto::QuestionType type) {
  switch (type) {
    case capnproto::QuestionType::MULTIPLE_CHOICE:
      return catalog::QuestionType::MULTIPLE_CHOICE;
    case capnproto::QuestionType::TRUE_FALSE:
      return catalog::QuestionType::TRUE_FALSE;
    case capnproto::QuestionType::CODING:
      return catalog::QuestionType::CODING;
    case capnproto::QuestionType::ESSAY:
      return catalog::QuestionType::ESSAY;
  }
  KJ_FAIL_REQUIRE("Unknown question type", static_cast<int>(type));
}

catalog::Question FromCapnp(capnproto::Question::Reader question) {
  catalog::Question ret;
  ret.id = question.getId();
  ret.title = question.getTitle();
  ret.description = question.getDescription();
  ret.type = FromCapnp(question.getType());
  ret.difficulty = question.getDifficulty();
  for (auto option : question.getOptions()) {
    ret.options.push_back(
        {option.getId(), option.getText(), option.getIsCorrect()});
  }
  for (auto test_case : question.getTestCases()) {
    ret.test_cases.push_back({test_case.getInput(),
                              test_case.getExpectedOutput(),
                              test_case.getIsHidden()});
  }
  ret.points = question.getPoints();
  ret.time_limit_seconds = question.getTimeLimitSeconds();
  ret.memory_limit_mb = question.getMemoryLimitMb();
  ret.language = question.getLanguage();
  ret.starter_code = question.getStarterCode();
  return ret;
}

void Validate(const catalog::Question& question) {
  KJ_REQUIRE(!question.id.empty(), "Question without id");
  KJ_REQUIRE(question.difficulty >= 0 && question.difficulty <= 1,
             "Difficulty out of range", question.id, question.difficulty);
  KJ_REQUIRE(question.points >= 0, "Negative points", question.id);
  if (question.IsChoice()) {
    KJ_REQUIRE(!question.options.empty(), "Choice question without options",
               question.id);
    std::set<std::string> ids;
    for (const auto& option : question.options) {
      KJ_REQUIRE(ids.insert(option.id).second, "Duplicate option",
                 question.id, option.id);
    }
  }
  if (question.type == catalog::QuestionType::CODING) {
    KJ_REQUIRE(!question.test_cases.empty(),
               "Coding question without test cases", question.id);
  }
}

}  // namespace

namespace catalog {

const char* QuestionTypeName(QuestionType type) {
  switch (type) {
    case QuestionType::MULTIPLE_CHOICE:
      return "multiple_choice";
    case QuestionType::TRUE_FALSE:
      return "true_false";
    case QuestionType::CODING:
      return "coding";
    case QuestionType::ESSAY:
      return "essay";
  }
  return "unknown";
}

void InMemoryCatalog::AddTest(Test test) {
  KJ_REQUIRE(!test.id.empty(), "Test without id");
  std::set<std::string> ids;
  for (const Question& question : test.questions) {
    Validate(question);
    KJ_REQUIRE(ids.insert(question.id).second, "Duplicate question", test.id,
               question.id);
  }
  std::string id = test.id;
  tests_[id] = std::move(test);
}

const std::vector<Question>* InMemoryCatalog::GetQuestionsForTest(
    const std::string& test_id) const {
  auto it = tests_.find(test_id);
  if (it == tests_.end()) return nullptr;
  return &it->second.questions;
}

std::vector<std::string> InMemoryCatalog::TestIds() const {
  std::vector<std::string> ids;
  for (const auto& kv : tests_) ids.push_back(kv.first);
  return ids;
}

InMemoryCatalog InMemoryCatalog::FromJson(const std::string& json) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnproto::Catalog>();
  codec.decode(kj::StringPtr(json.c_str(), json.size()), root);
  InMemoryCatalog catalog;
  for (auto test : root.asReader().getTests()) {
    Test t;
    t.id = test.getId();
    t.title = test.getTitle();
    for (auto question : test.getQuestions()) {
      t.questions.push_back(FromCapnp(question));
    }
    catalog.AddTest(std::move(t));
  }
  return catalog;
}

InMemoryCatalog InMemoryCatalog::Load(const std::string& path) {
  KJ_LOG(INFO, "Loading catalog", path);
  InMemoryCatalog catalog = FromJson(util::File::ReadAll(path));
  KJ_LOG(INFO, "Catalog loaded", catalog.tests_.size());
  return catalog;
}

}  // namespace catalog
