#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(Sandbox::create_t create, Sandbox::score_t score,
                        std::string name) {
  Boxes_()->push_back(Entry{create, score, std::move(name)});
}

int Sandbox::Best_() {
  // Scores are computed once: some implementations inspect the system.
  static const int best_sandbox = []() {
    const store_t& boxes = *Boxes_();
    int best = -1;
    int best_score = 0;
    for (unsigned i = 0; i < boxes.size(); i++) {
      int score = boxes[i].score();
      VLOG(1) << "Sandbox " << boxes[i].name << " has score " << score;
      if (score > best_score) {
        best_score = score;
        best = i;
      }
    }
    return best;
  }();
  return best_sandbox;
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  int best = Best_();
  if (best == -1) {
    LOG(ERROR) << "No sandbox could be found";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>((*Boxes_())[best].create());
}

std::string Sandbox::BestName() {
  int best = Best_();
  if (best == -1) return "";
  return (*Boxes_())[best].name;
}

}  // namespace sandbox
