#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tracereplay/record/v1/record.pb.h"

namespace tracereplay::metadata {

// Ordered from most to least verbose.
enum class Level {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError,
};

enum class CallsiteKind {
  kSpan,
  kEvent,
};

/*
  Live descriptor of a recorded callsite.

  Built once per capture id and never mutated afterwards; the registry keeps
  it alive for as long as the replay runs.
*/
struct Callsite {
  uint64_t                   capture_id{0};
  std::string                name;
  std::string                target;
  Level                      level{Level::kTrace};
  std::optional<std::string> module_path;
  std::optional<std::string> file;
  std::optional<uint32_t>    line;
  std::vector<std::string>   field_names;
  CallsiteKind               kind{CallsiteKind::kEvent};

  std::optional<std::size_t> FieldIndex(std::string_view field_name) const;
};

Callsite CallsiteFromProto(const record::v1::Metadata& metadata);

// True when `metadata` declares the callsite's field names in the same order.
bool DeclaresSameFields(const Callsite& callsite, const record::v1::Metadata& metadata);

std::string_view LevelName(Level level);

// Accepts trace|debug|info|warn|error, case-insensitive.
std::optional<Level> ParseLevel(std::string_view text);

} // namespace tracereplay::metadata
