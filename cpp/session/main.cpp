#include "session/main.hpp"

#include <chrono>
#include <iostream>
#include <thread>

#include "catalog/catalog.hpp"
#include "executor/executor.hpp"
#include "session/engine.hpp"
#include "store/codec.hpp"
#include "store/store.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"

namespace session {

namespace {
void PrintResult(const SessionResult& result) {
  std::cout << "status:     " << StatusName(result.status) << std::endl;
  if (!result.end_reason.empty()) {
    std::cout << "reason:     " << result.end_reason << std::endl;
  }
  std::cout << "score:      " << result.total_score << "/" << result.max_score
            << " (" << result.percentage << "%)" << std::endl;
  std::cout << "answered:   " << result.questions_answered << "/"
            << result.questions_total << std::endl;
  if (result.pending_review) {
    std::cout << "to review:  " << result.pending_review << std::endl;
  }
  if (result.has_adaptive_results) {
    const adaptive::Results& adaptive = result.adaptive_results;
    std::cout << "ability:    " << adaptive.ability << " (confidence "
              << adaptive.confidence << ", " << adaptive.analysis.trend << ")"
              << std::endl;
  }
}
}  // namespace

kj::MainBuilder::Validity InspectMain::Run() {
  util::LogManager log_manager(context);
  store::FileSessionStore store(Flags::store_directory);
  if (session_id_.empty()) {
    for (const std::string& id : store.List()) {
      store::StoredSession stored;
      if (!store.Get(id, &stored)) continue;
      const Session& session = stored.session;
      std::cout << id << " " << StatusName(session.status) << " "
                << session.candidate_id << " " << session.test_id << " v"
                << stored.version << std::endl;
    }
    return true;
  }
  if (Flags::catalog_file.empty()) {
    store::StoredSession stored;
    if (!store.Get(session_id_, &stored)) {
      return kj::str("No session ", session_id_);
    }
    std::cout << store::ToJson(stored.session) << std::endl;
    return true;
  }
  catalog::InMemoryCatalog catalog =
      catalog::InMemoryCatalog::Load(Flags::catalog_file);
  executor::Executor executor(executor::LanguageTable::Default(), 1);
  Engine engine(&catalog, &store, &executor);
  try {
    std::cout << store::ToJson(engine.Snapshot(session_id_)) << std::endl;
    SessionStats stats = engine.GetSessionStats(session_id_);
    std::cout << "duration:   " << stats.duration_millis / 1000 << " s"
              << std::endl;
    std::cout << "violations: " << stats.violations << std::endl;
    std::cout << "code:       " << stats.code_submissions << " submissions"
              << std::endl;
    PrintResult(engine.GetResult(session_id_));
  } catch (const SessionError& exc) {
    return kj::str(exc.what());
  }
  return true;
}

kj::MainFunc InspectMain::getMain() {
  return kj::MainBuilder(context, "Examiner Inspect",
                         "Lists the stored sessions, or prints one of them "
                         "with its statistics when a catalog is given")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'S', "store-dir"},
                        util::setString(Flags::store_directory), "<DIR>",
                        "Path where the sessions are stored")
      .addOptionWithArg({'c', "catalog"}, util::setString(Flags::catalog_file),
                        "<FILE>", "JSON question catalog")
      .expectOptionalArg("<SESSION>", util::setString(session_id_))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainBuilder::Validity SweepMain::Run() {
  util::LogManager log_manager(context);
  if (Flags::catalog_file.empty()) return kj::str("--catalog is required");
  catalog::InMemoryCatalog catalog =
      catalog::InMemoryCatalog::Load(Flags::catalog_file);
  store::FileSessionStore store(Flags::store_directory);
  executor::Executor executor(executor::LanguageTable::Default(), 1);
  EngineOptions options;
  options.sweep_interval_millis = -1;
  Engine engine(&catalog, &store, &executor, options);
  do {
    size_t expired = engine.SweepExpired();
    std::cout << expired << " sessions expired" << std::endl;
    if (watch_) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(Flags::sweep_interval_millis));
    }
  } while (watch_);
  return true;
}

kj::MainFunc SweepMain::getMain() {
  return kj::MainBuilder(context, "Examiner Sweep",
                         "Expires the sessions that ran out of time")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'S', "store-dir"},
                        util::setString(Flags::store_directory), "<DIR>",
                        "Path where the sessions are stored")
      .addOptionWithArg({'c', "catalog"}, util::setString(Flags::catalog_file),
                        "<FILE>", "JSON question catalog")
      .addOption({'w', "watch"}, util::setBool(watch_), "Sweep periodically")
      .addOptionWithArg({'i', "interval"},
                        util::setInt(Flags::sweep_interval_millis), "<MILLIS>",
                        "Time between two sweeps with --watch")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace session
