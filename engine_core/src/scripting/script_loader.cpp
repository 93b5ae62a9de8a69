#include "TalkGraph/scripting/script_loader.hpp"
#include "TalkGraph/core/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace TalkGraph::scripting {

namespace {

using json = nlohmann::json;

/// Raised while walking the document; converted to an error result in parse().
class DocumentError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

const json* findField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string requireString(const json& object, const char* key, const std::string& where) {
  const json* field = findField(object, key);
  if (field == nullptr) {
    throw DocumentError(where + ": missing required field '" + key + "'");
  }
  if (!field->is_string()) {
    throw DocumentError(where + ": field '" + key + "' must be a string");
  }
  return field->get<std::string>();
}

LineId toLineId(const json& value, const char* key, const std::string& where) {
  if (!value.is_number_integer()) {
    throw DocumentError(where + ": field '" + key + "' must be an integer");
  }
  // Unsigned values above INT64_MAX would wrap in get<i64>().
  if (value.is_number_unsigned() &&
      value.get<u64>() > static_cast<u64>(std::numeric_limits<LineId>::max())) {
    throw DocumentError(where + ": field '" + key + "' is out of range");
  }
  const i64 raw = value.get<i64>();
  if (raw < std::numeric_limits<LineId>::min() || raw > std::numeric_limits<LineId>::max()) {
    throw DocumentError(where + ": field '" + key + "' is out of range");
  }
  return static_cast<LineId>(raw);
}

LineId requireLineId(const json& object, const char* key, const std::string& where) {
  const json* field = findField(object, key);
  if (field == nullptr) {
    throw DocumentError(where + ": missing required field '" + key + "'");
  }
  return toLineId(*field, key, where);
}

std::optional<bool> optionalBool(const json& object, const char* key, const std::string& where) {
  const json* field = findField(object, key);
  if (field == nullptr) {
    return std::nullopt;
  }
  if (!field->is_boolean()) {
    throw DocumentError(where + ": field '" + key + "' must be a boolean");
  }
  return field->get<bool>();
}

const json& requireArray(const json& value, const char* key, const std::string& where) {
  if (!value.is_array()) {
    throw DocumentError(where + ": field '" + key + "' must be an array");
  }
  return value;
}

Talker readTalker(const json& value, usize index) {
  const std::string where = "talker #" + std::to_string(index);
  if (!value.is_object()) {
    throw DocumentError(where + ": expected an object");
  }

  Talker talker;
  talker.name = requireString(value, "name", where);
  if (findField(value, "asset") != nullptr) {
    talker.asset = requireString(value, "asset", where);
  }
  return talker;
}

Choice readChoice(const json& value, const std::string& where) {
  if (!value.is_object()) {
    throw DocumentError(where + ": expected an object");
  }

  Choice choice;
  choice.text = requireString(value, "text", where);
  choice.next = requireLineId(value, "next", where);
  return choice;
}

DialogueLine readLine(const json& value, usize index) {
  std::string where = "line #" + std::to_string(index);
  if (!value.is_object()) {
    throw DocumentError(where + ": expected an object");
  }

  DialogueLine line;
  line.id = requireLineId(value, "id", where);
  where += " (id " + std::to_string(line.id) + ")";

  line.text = requireString(value, "text", where);

  if (findField(value, "talker") != nullptr) {
    line.talker = requireString(value, "talker", where);
  }

  if (const json* talkers = findField(value, "talkers")) {
    for (const auto& name : requireArray(*talkers, "talkers", where)) {
      if (!name.is_string()) {
        throw DocumentError(where + ": field 'talkers' must contain strings");
      }
      line.talkers.push_back(name.get<std::string>());
    }
  }

  if (findField(value, "action") != nullptr) {
    std::string action = requireString(value, "action", where);
    auto parsed = lineActionFromString(action);
    if (!parsed.has_value()) {
      throw DocumentError(where + ": unknown action '" + action +
                          "' (expected talk, enter or exit)");
    }
    line.action = *parsed;
  }

  if (const json* choices = findField(value, "choices")) {
    std::vector<Choice> parsed;
    usize choiceIndex = 0;
    for (const auto& choice : requireArray(*choices, "choices", where)) {
      parsed.push_back(readChoice(choice, where + ", choice #" + std::to_string(choiceIndex++)));
    }
    line.choices = std::move(parsed);
  }

  if (const json* next = findField(value, "next")) {
    line.next = toLineId(*next, "next", where);
  }

  line.start = optionalBool(value, "start", where);
  line.end = optionalBool(value, "end", where);
  return line;
}

} // namespace

Result<TalkScript> ScriptLoader::parse(const std::string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    return Result<TalkScript>::error(std::string("Invalid JSON: ") + e.what());
  }

  if (!document.is_object()) {
    return Result<TalkScript>::error("Script document must be a JSON object");
  }

  try {
    TalkScript script;

    if (const json* talkers = findField(document, "talkers")) {
      usize index = 0;
      for (const auto& talker : requireArray(*talkers, "talkers", "document")) {
        script.talkers.push_back(readTalker(talker, index++));
      }
    }

    const json* lines = findField(document, "lines");
    if (lines == nullptr) {
      return Result<TalkScript>::error("document: missing required field 'lines'");
    }
    usize index = 0;
    for (const auto& line : requireArray(*lines, "lines", "document")) {
      script.lines.push_back(readLine(line, index++));
    }

    return Result<TalkScript>::ok(std::move(script));
  } catch (const DocumentError& e) {
    return Result<TalkScript>::error(e.what());
  } catch (const json::exception& e) {
    return Result<TalkScript>::error(std::string("Malformed script: ") + e.what());
  }
}

Result<TalkScript> ScriptLoader::loadFromFile(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<TalkScript>::error("File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<TalkScript>::error("Cannot open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto result = parse(buffer.str());
  if (result.isError()) {
    return Result<TalkScript>::error(path + ": " + result.error());
  }

  TALKGRAPH_LOG_INFO("Loaded script {} ({} talkers, {} lines)", path,
                     result.value().talkers.size(), result.value().lines.size());
  return result;
}

std::string ScriptLoader::toJson(const TalkScript& script) {
  json document = json::object();

  json talkers = json::array();
  for (const auto& talker : script.talkers) {
    talkers.push_back({{"name", talker.name}, {"asset", talker.asset}});
  }
  document["talkers"] = std::move(talkers);

  json lines = json::array();
  for (const auto& line : script.lines) {
    json entry = {{"id", line.id}, {"text", line.text}};
    if (line.talker.has_value()) {
      entry["talker"] = *line.talker;
    }
    if (!line.talkers.empty()) {
      entry["talkers"] = line.talkers;
    }
    if (line.action != LineAction::Talk) {
      entry["action"] = lineActionToString(line.action);
    }
    if (line.choices.has_value()) {
      json choices = json::array();
      for (const auto& choice : *line.choices) {
        choices.push_back({{"text", choice.text}, {"next", choice.next}});
      }
      entry["choices"] = std::move(choices);
    }
    if (line.next.has_value()) {
      entry["next"] = *line.next;
    }
    if (line.start.has_value()) {
      entry["start"] = *line.start;
    }
    if (line.end.has_value()) {
      entry["end"] = *line.end;
    }
    lines.push_back(std::move(entry));
  }
  document["lines"] = std::move(lines);

  return document.dump(2);
}

} // namespace TalkGraph::scripting
