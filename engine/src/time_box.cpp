#include "time_box.h"

#include <utility>

namespace poolkit {

TimeBoxRunner::TimeBoxRunner(std::string name) : name_(std::move(name)) {}

TimeBoxRunner::~TimeBoxRunner() { join(); }

void TimeBoxRunner::join() {
  if (helper_.joinable()) {
    helper_.join();
  }
}

}  // namespace poolkit
