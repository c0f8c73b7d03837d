#include "dispatch_factory.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "interest_filter.hpp"
#include "internal/util/errors.hpp"
#include "log_dispatch.hpp"
#ifdef ENABLE_OTEL
#include "internal/observability/telemetry.hpp"
#include "otel_dispatch.hpp"
#endif

namespace tracereplay::dispatch {

namespace {

constexpr const char* kReplayLoggerName = "replay";

InterestFilter BuildInterest(const tracereplay::runtime::config::DispatchConfig& cfg) {
  InterestFilter interest;
  if (!cfg.max_level().empty()) {
    auto level = metadata::ParseLevel(cfg.max_level());
    if (!level) {
      throw util::InvalidConfig("dispatch.max_level: unknown level '" + cfg.max_level() + "'");
    }
    interest.max_level = *level;
  }
  interest.disabled_targets.assign(cfg.disabled_targets().begin(), cfg.disabled_targets().end());
  return interest;
}

std::shared_ptr<spdlog::logger> ReplayLogger(const tracereplay::runtime::config::LogDispatchConfig& cfg) {
  auto logger = spdlog::get(kReplayLoggerName);
  if (!logger) {
    logger = spdlog::stdout_logger_mt(kReplayLoggerName);
  }
  logger->set_pattern(cfg.pattern().empty() ? "%Y-%m-%dT%H:%M:%S.%fZ %5l [%t] %v" : cfg.pattern(), spdlog::pattern_time_type::utc);
  logger->set_level(spdlog::level::trace);
  return logger;
}

} // namespace

DispatchPtr DispatchFactory::Build(const tracereplay::runtime::config::DispatchConfig& cfg) {
  auto interest = BuildInterest(cfg);

  switch (cfg.backend()) {
    case tracereplay::runtime::config::DISPATCH_BACKEND_OTLP: {
#ifdef ENABLE_OTEL
      auto tracer = observability::ReplayTracer();
      if (!tracer) {
        throw util::InvalidConfig("dispatch.backend: OTLP tracer is not initialized");
      }
      return std::make_shared<OtelDispatch>(std::move(tracer), std::move(interest));
#else
      throw util::InvalidConfig("dispatch.backend: OTLP requires a build with ENABLE_OTEL");
#endif
    }
    case tracereplay::runtime::config::DISPATCH_BACKEND_LOG:
      break;
    default:
      throw util::InvalidConfig("dispatch.backend: unsupported backend " + std::to_string(cfg.backend()));
  }

  LogDispatchOptions options;
  options.interest    = std::move(interest);
  options.span_events = cfg.log().span_events();
  return std::make_shared<LogDispatch>(ReplayLogger(cfg.log()), std::move(options));
}

} // namespace tracereplay::dispatch
