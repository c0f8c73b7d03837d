#pragma once

#include "config/config.pb.h"
#include "internal/dispatch/dispatch.hpp"

namespace tracereplay::dispatch {

/*
  Builds the live backend selected by configuration.

      auto dispatch = DispatchFactory::Build(config.dispatch());
      Replay replay(dispatch, options);

  The OTLP backend expects observability::InitializeTracing() to have run.
  Throws util::InvalidConfig for settings the build cannot honour.
*/
class DispatchFactory {
 public:
  static DispatchPtr Build(const tracereplay::runtime::config::DispatchConfig& cfg);
};

} // namespace tracereplay::dispatch
