#pragma once

#include <optional>
#include <vector>

#include "internal/span/span_id_map.hpp"

namespace tracereplay::replay {

/*
  Spans a replay worker has entered and not yet exited, innermost last.

  Owned by exactly one worker; this is the replayed thread's notion of the
  "current" span. A span may be entered more than once.
*/
class DispatchContext {
 public:
  void Enter(span::LiveSpanId span) {
    stack_.push_back(span);
  }

  // Removes the innermost entry for `span`. False if it was not entered.
  bool Exit(span::LiveSpanId span) {
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
      if (*it == span) {
        stack_.erase(std::next(it).base());
        return true;
      }
    }
    return false;
  }

  std::optional<span::LiveSpanId> Current() const {
    if (stack_.empty()) {
      return std::nullopt;
    }
    return stack_.back();
  }

  std::size_t depth() const {
    return stack_.size();
  }

 private:
  std::vector<span::LiveSpanId> stack_;
};

} // namespace tracereplay::replay
