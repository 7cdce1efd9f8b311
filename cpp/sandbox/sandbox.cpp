#include "sandbox/sandbox.hpp"

#include <kj/debug.h>
#include <mutex>

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(Sandbox::create_t create, Sandbox::score_t score) {
  Boxes_()->emplace_back(create, score);
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  static std::once_flag chosen;
  static int best_sandbox = -1;
  const store_t& boxes = *Boxes_();
  std::call_once(chosen, [&boxes]() {
    int best_score = 0;
    for (size_t i = 0; i < boxes.size(); i++) {
      int score = boxes[i].second();
      if (score > best_score) {
        best_score = score;
        best_sandbox = i;
      }
    }
    KJ_LOG(INFO, "Sandbox selected", best_sandbox, best_score);
  });
  if (best_sandbox == -1) {
    KJ_LOG(ERROR, "No sandbox could be found");
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(boxes[best_sandbox].first());
}

}  // namespace sandbox
