#include "executor/main.hpp"

#include <iomanip>
#include <iostream>

#include "catalog/catalog.hpp"
#include "executor/executor.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"

namespace executor {

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (Flags::catalog_file.empty()) return kj::str("--catalog is required");
  catalog::InMemoryCatalog catalog =
      catalog::InMemoryCatalog::Load(Flags::catalog_file);
  const auto* questions = catalog.GetQuestionsForTest(test_id_);
  if (questions == nullptr) return kj::str("Unknown test ", test_id_);
  const catalog::Question* question = nullptr;
  for (const catalog::Question& q : *questions) {
    if (q.id == question_id_) question = &q;
  }
  if (question == nullptr || question->type != catalog::QuestionType::CODING) {
    return kj::str("No coding question ", question_id_, " in ", test_id_);
  }

  Executor executor(Flags::languages_file.empty()
                        ? LanguageTable::Default()
                        : LanguageTable::Load(Flags::languages_file));
  ExecutionRequest request;
  request.language = language_.empty() ? question->language : language_;
  if (!executor.Supports(request.language)) {
    return kj::str("Unsupported language ", request.language);
  }
  request.source = util::File::ReadAll(source_path_);
  request.cases = question->test_cases;
  request.time_limit_seconds = question->time_limit_seconds;
  request.memory_limit_mb = question->memory_limit_mb;
  request.run_all_cases = run_all_;
  ExecutionSummary summary = executor.Execute(request);

  for (const std::string& flag : summary.security_flags) {
    std::cout << "flagged: " << flag << std::endl;
  }
  if (!summary.compile_output.empty()) {
    std::cout << summary.compile_output << std::endl;
  }
  for (size_t i = 0; i < summary.cases.size(); i++) {
    const CaseResult& result = summary.cases[i];
    std::cout << "#" << std::left << std::setw(3) << i << " "
              << std::setw(16) << CaseStatusName(result.status)
              << std::right << std::setw(6) << result.time_millis << " ms "
              << std::setw(8) << result.memory_kb << " KiB"
              << (result.hidden ? " (hidden)" : "") << std::endl;
    if (!result.message.empty()) std::cout << "     " << result.message << std::endl;
  }
  std::cout << summary.passed << "/" << summary.total << " passed, "
            << summary.executed << " executed" << std::endl;
  if (!summary.AllPassed()) context.exitError("Some test cases failed");
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Examiner Executor",
                         "Runs a submission against the test cases of a "
                         "coding question")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'c', "catalog"}, util::setString(Flags::catalog_file),
                        "<FILE>", "JSON question catalog")
      .addOptionWithArg({'l', "languages"},
                        util::setString(Flags::languages_file), "<FILE>",
                        "JSON language table replacing the built-in one")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOptionWithArg({'n', "num-cores"}, util::setInt(Flags::num_cores),
                        "<N>", "Number of sandboxes running at the same time")
      .addOption({'k', "keep-sandboxes"}, util::setBool(Flags::keep_sandboxes),
                 "Keep the sandbox directories")
      .addOption({'a', "all"}, util::setBool(run_all_),
                 "Keep running after the first failed case")
      .addOptionWithArg({'x', "language"}, util::setString(language_),
                        "<LANG>", "Language of the source, default is the "
                                  "language of the question")
      .expectArg("<TEST>", util::setString(test_id_))
      .expectArg("<QUESTION>", util::setString(question_id_))
      .expectArg("<SOURCE>", util::setString(source_path_))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace executor
