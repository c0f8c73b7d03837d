#include "callsite.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace tracereplay::metadata {

std::optional<std::size_t> Callsite::FieldIndex(std::string_view field_name) const {
  for (std::size_t i = 0; i < field_names.size(); ++i) {
    if (field_names[i] == field_name) {
      return i;
    }
  }
  return std::nullopt;
}

Callsite CallsiteFromProto(const record::v1::Metadata& metadata) {
  Callsite callsite;
  callsite.capture_id = metadata.id();
  callsite.name       = metadata.name();
  callsite.target     = metadata.target();

  switch (metadata.level()) {
    case record::v1::LEVEL_TRACE:
      callsite.level = Level::kTrace;
      break;
    case record::v1::LEVEL_DEBUG:
      callsite.level = Level::kDebug;
      break;
    case record::v1::LEVEL_INFO:
      callsite.level = Level::kInfo;
      break;
    case record::v1::LEVEL_WARN:
      callsite.level = Level::kWarn;
      break;
    case record::v1::LEVEL_ERROR:
      callsite.level = Level::kError;
      break;
    default:
      throw util::MalformedRecord("metadata " + std::to_string(metadata.id()) + " has no level");
  }

  if (metadata.has_module_path()) {
    callsite.module_path = metadata.module_path();
  }
  if (metadata.has_file()) {
    callsite.file = metadata.file();
  }
  if (metadata.has_line()) {
    callsite.line = metadata.line();
  }

  callsite.field_names.assign(metadata.fields().begin(), metadata.fields().end());
  callsite.kind = metadata.kind() == record::v1::KIND_SPAN ? CallsiteKind::kSpan : CallsiteKind::kEvent;
  return callsite;
}

bool DeclaresSameFields(const Callsite& callsite, const record::v1::Metadata& metadata) {
  if (static_cast<std::size_t>(metadata.fields_size()) != callsite.field_names.size()) {
    return false;
  }
  for (int i = 0; i < metadata.fields_size(); ++i) {
    if (metadata.fields(i) != callsite.field_names[static_cast<std::size_t>(i)]) {
      return false;
    }
  }
  return true;
}

std::string_view LevelName(Level level) {
  switch (level) {
    case Level::kTrace:
      return "TRACE";
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<Level> ParseLevel(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") return Level::kTrace;
  if (lowered == "debug") return Level::kDebug;
  if (lowered == "info") return Level::kInfo;
  if (lowered == "warn" || lowered == "warning") return Level::kWarn;
  if (lowered == "error") return Level::kError;
  return std::nullopt;
}

} // namespace tracereplay::metadata
