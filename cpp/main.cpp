#include "executor/main.hpp"
#include "session/main.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

class ExaminerMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit ExaminerMain(kj::ProcessContext& context)
      : context(context), rm(context), im(context), sm(context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Examiner",
                           "Assessment sessions with sandboxed code execution")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a submission against a coding question")
        .addSubCommand("inspect", KJ_BIND_METHOD(im, getMain),
                       "inspect the stored sessions")
        .addSubCommand("sweep", KJ_BIND_METHOD(sm, getMain),
                       "expire the sessions that ran out of time")
        .build();
  }

 private:
  kj::ProcessContext& context;
  executor::Main rm;
  session::InspectMain im;
  session::SweepMain sm;
};

KJ_MAIN(ExaminerMain);
