#pragma once

#include <string>
#include <vector>

#include "internal/metadata/callsite.hpp"

namespace tracereplay::dispatch {

/*
  Static interest decision shared by the bundled backends: a callsite is
  enabled when it is at least as severe as max_level and its target does
  not start with any disabled prefix.
*/
struct InterestFilter {
  metadata::Level          max_level{metadata::Level::kTrace};
  std::vector<std::string> disabled_targets;

  bool Allows(const metadata::Callsite& callsite) const {
    if (callsite.level < max_level) {
      return false;
    }
    for (const auto& prefix : disabled_targets) {
      if (callsite.target.compare(0, prefix.size(), prefix) == 0) {
        return false;
      }
    }
    return true;
  }
};

} // namespace tracereplay::dispatch
