#ifndef SESSION_MAIN_HPP
#define SESSION_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace session {

// Lists the sessions of a store, or prints one of them.
class InspectMain {
 public:
  InspectMain(kj::ProcessContext& context) : context(context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string session_id_;
};

// Expires the overdue sessions of a store, once or periodically.
class SweepMain {
 public:
  SweepMain(kj::ProcessContext& context) : context(context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  bool watch_ = false;
};
}  // namespace session
#endif
