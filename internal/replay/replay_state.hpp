#pragma once

#include "internal/dispatch/dispatch.hpp"
#include "internal/metadata/callsite_registry.hpp"
#include "internal/span/span_id_map.hpp"

namespace tracereplay::replay {

struct ReplayOptions {
  // Sleep so each record is dispatched at its recorded offset. When false
  // records are dispatched as soon as a worker reaches them.
  bool pace{true};
};

/*
  State shared by the coordinator and every worker of one replay.
  Each member guards itself.
*/
struct ReplayState {
  explicit ReplayState(dispatch::DispatchPtr dispatch_in, ReplayOptions options_in)
      : dispatch(std::move(dispatch_in)), options(options_in) {
  }

  dispatch::DispatchPtr      dispatch;
  ReplayOptions              options;
  metadata::CallsiteRegistry callsites;
  span::SpanIdMap            span_ids;
};

} // namespace tracereplay::replay
