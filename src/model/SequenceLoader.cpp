// Repository: Storyline
// Component: Sequence Loader
// Purpose: Reads a JSON sequence manifest into StoryItems.
// Copyright (c) 2025 Storyline

#include "storyline/model/SequenceLoader.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace storyline::model {

namespace {

// =============================================================================
// Minimal JSON helpers (flat objects, one array of objects)
// =============================================================================

// Returns the position of the first character of the value for `key`, or npos.
size_t FindValue(const std::string& json, const std::string& key) {
  const std::string search = "\"" + key + "\"";
  size_t pos = json.find(search);

  // A match is a key only when a ':' follows; "kind": "text" must not match
  // the key "text".
  while (pos != std::string::npos) {
    size_t after = pos + search.size();
    while (after < json.size() && std::isspace(static_cast<unsigned char>(json[after]))) {
      ++after;
    }
    if (after < json.size() && json[after] == ':') {
      pos = after + 1;
      break;
    }
    pos = json.find(search, pos + 1);
  }
  if (pos == std::string::npos) return std::string::npos;

  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
    ++pos;
  }
  return pos < json.size() ? pos : std::string::npos;
}

bool JsonGetString(const std::string& json, const std::string& key, std::string& out) {
  size_t pos = FindValue(json, key);
  if (pos == std::string::npos || json[pos] != '"') return false;

  std::string value;
  for (++pos; pos < json.size(); ++pos) {
    const char c = json[pos];
    if (c == '"') {
      out = value;
      return true;
    }
    if (c == '\\' && pos + 1 < json.size()) {
      const char esc = json[++pos];
      switch (esc) {
        case 'n':
          value += '\n';
          break;
        case 't':
          value += '\t';
          break;
        case 'r':
          value += '\r';
          break;
        default:
          value += esc;  // \" \\ \/
          break;
      }
      continue;
    }
    value += c;
  }
  return false;  // unterminated
}

bool JsonGetInt(const std::string& json, const std::string& key, int64_t& out) {
  size_t pos = FindValue(json, key);
  if (pos == std::string::npos) return false;

  std::string num;
  while (pos < json.size() &&
         (std::isdigit(static_cast<unsigned char>(json[pos])) || json[pos] == '-')) {
    num += json[pos++];
  }
  if (num.empty() || num == "-") return false;

  try {
    out = std::stoll(num);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

bool JsonGetBool(const std::string& json, const std::string& key, bool& out) {
  size_t pos = FindValue(json, key);
  if (pos == std::string::npos) return false;
  if (json.compare(pos, 4, "true") == 0) {
    out = true;
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    out = false;
    return true;
  }
  return false;
}

// Splits the "items" array into its object texts. Braces inside strings are
// ignored. Returns false if the array or an object is unterminated.
bool JsonGetObjects(const std::string& json, const std::string& key,
                    std::vector<std::string>& objects) {
  size_t pos = FindValue(json, key);
  if (pos == std::string::npos || json[pos] != '[') return false;

  int depth = 0;
  bool in_string = false;
  size_t object_start = std::string::npos;

  for (++pos; pos < json.size(); ++pos) {
    const char c = json[pos];
    if (in_string) {
      if (c == '\\') {
        ++pos;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{') {
      if (depth == 0) object_start = pos;
      ++depth;
    } else if (c == '}') {
      if (depth == 0) return false;
      --depth;
      if (depth == 0) {
        objects.push_back(json.substr(object_start, pos - object_start + 1));
      }
    } else if (c == ']' && depth == 0) {
      return true;
    }
  }
  return false;
}

std::string ReadFile(const std::string& path, bool& ok) {
  std::ifstream file(path);
  if (!file.is_open()) {
    ok = false;
    return "";
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  ok = true;
  return buffer.str();
}

ValidationResult ParseItem(const std::string& obj, int32_t index, StoryItem& item) {
  std::string kind_name;
  if (!JsonGetString(obj, "kind", kind_name)) {
    return ValidationResult::Failure(SequenceError::kMalformedManifest, "item has no \"kind\"",
                                     index);
  }
  auto kind = ParseItemKind(kind_name);
  if (!kind) {
    return ValidationResult::Failure(SequenceError::kUnknownKind, "kind=" + kind_name, index);
  }
  if (*kind == ItemKind::kCustom) {
    return ValidationResult::Failure(SequenceError::kMalformedManifest,
                                     "custom items need a code-side view factory", index);
  }
  item.kind = *kind;

  JsonGetString(obj, "source", item.source_locator);

  std::string origin_name;
  if (JsonGetString(obj, "origin", origin_name)) {
    auto origin = ParseSourceOrigin(origin_name);
    if (!origin) {
      return ValidationResult::Failure(SequenceError::kUnknownOrigin, "origin=" + origin_name,
                                       index);
    }
    item.origin = *origin;
  }

  int64_t duration_ms = 0;
  if (JsonGetInt(obj, "duration_ms", duration_ms)) {
    item.configured_duration_ms = duration_ms;
  }
  JsonGetBool(obj, "mute_by_default", item.mute_by_default);

  std::string error_view;
  if (JsonGetString(obj, "error_view", error_view)) {
    item.error_view = error_view;
  }

  switch (item.kind) {
    case ItemKind::kImage: {
      ImageConfig config;
      JsonGetString(obj, "fit", config.fit);
      item.image = config;
      break;
    }
    case ItemKind::kVideo: {
      VideoConfig config;
      JsonGetBool(obj, "loop", config.looping);
      JsonGetBool(obj, "use_aspect_ratio", config.use_aspect_ratio);
      item.video = config;
      break;
    }
    case ItemKind::kAudio: {
      AudioConfig config;
      JsonGetBool(obj, "loop", config.looping);
      item.audio = config;
      break;
    }
    case ItemKind::kText: {
      TextConfig config;
      JsonGetString(obj, "text", config.text);
      JsonGetString(obj, "background", config.background_color);
      JsonGetString(obj, "alignment", config.alignment);
      if (item.source_locator.empty()) {
        item.source_locator = config.text;
      }
      item.text = config;
      break;
    }
    case ItemKind::kWeb: {
      WebConfig config;
      JsonGetString(obj, "user_agent", config.user_agent);
      item.web = config;
      break;
    }
    case ItemKind::kCustom:
      break;
  }

  return ValidationResult::Success();
}

}  // namespace

ValidationResult SequenceLoader::Parse(const std::string& json, LoadedSequence& out) {
  std::vector<std::string> objects;
  if (!JsonGetObjects(json, "items", objects)) {
    return ValidationResult::Failure(SequenceError::kMalformedManifest,
                                     "missing or unterminated \"items\" array");
  }

  LoadedSequence loaded;
  int64_t initial_index = 0;
  JsonGetInt(json, "initial_index", initial_index);
  if (initial_index < std::numeric_limits<int32_t>::min() ||
      initial_index > std::numeric_limits<int32_t>::max()) {
    return ValidationResult::Failure(SequenceError::kMalformedManifest,
                                     "initial_index out of range: " +
                                         std::to_string(initial_index));
  }
  loaded.initial_index = static_cast<int32_t>(initial_index);

  for (size_t i = 0; i < objects.size(); ++i) {
    StoryItem item;
    ValidationResult result = ParseItem(objects[i], static_cast<int32_t>(i), item);
    if (!result.valid) return result;
    loaded.items.push_back(std::move(item));
  }

  ValidationResult result = ValidateSequence(loaded.items, loaded.initial_index);
  if (!result.valid) return result;

  out = std::move(loaded);
  return result;
}

ValidationResult SequenceLoader::LoadFile(const std::string& path, LoadedSequence& out) {
  bool ok = false;
  const std::string json = ReadFile(path, ok);
  if (!ok) {
    return ValidationResult::Failure(SequenceError::kUnreadableManifest, path);
  }
  return Parse(json, out);
}

}  // namespace storyline::model
