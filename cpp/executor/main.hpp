#ifndef EXECUTOR_MAIN_HPP
#define EXECUTOR_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace executor {

// Runs a source file against the test cases of a coding question.
class Main {
 public:
  Main(kj::ProcessContext& context) : context(context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string test_id_;
  std::string question_id_;
  std::string source_path_;
  std::string language_;
  bool run_all_ = false;
};
}  // namespace executor
#endif
