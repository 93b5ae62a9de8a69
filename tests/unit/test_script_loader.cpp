#include "TalkGraph/scripting/script_loader.hpp"
#include "TalkGraph/scripting/talk_compiler.hpp"
#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>

using namespace TalkGraph::scripting;
namespace fs = std::filesystem;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

class TestDirectory {
public:
  TestDirectory() {
    m_path = fs::temp_directory_path() / "talkgraph_loader_test";
    fs::create_directories(m_path);
  }

  ~TestDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  [[nodiscard]] std::string file(const std::string& name, const std::string& content) const {
    fs::path path = m_path / name;
    std::ofstream out(path);
    out << content;
    return path.string();
  }

  [[nodiscard]] const fs::path& path() const { return m_path; }

private:
  fs::path m_path;
};

const char* kMinimal = R"({
  "talkers": [ { "name": "Bob", "asset": "bob.png" } ],
  "lines": [
    { "id": 1, "text": "Hello", "talker": "Bob", "start": true, "next": 2 },
    { "id": 2, "text": "Bye", "talker": "Bob", "end": true }
  ]
})";

} // namespace

TEST_CASE("ScriptLoader: minimal document", "[loader]") {
  auto result = ScriptLoader::parse(kMinimal);

  REQUIRE(result.isOk());
  const TalkScript& script = result.value();
  REQUIRE(script.talkers.size() == 1);
  CHECK(script.talkers[0] == Talker{"Bob", "bob.png"});

  REQUIRE(script.lines.size() == 2);
  const DialogueLine& first = script.lines[0];
  CHECK(first.id == 1);
  CHECK(first.text == "Hello");
  CHECK(first.talker == std::optional<std::string>("Bob"));
  CHECK(first.isStart());
  CHECK(first.next == std::optional<LineId>(2));
  CHECK(first.action == LineAction::Talk);

  CHECK(script.lines[1].isEnd());
  CHECK_FALSE(script.lines[1].next.has_value());
}

TEST_CASE("ScriptLoader: optional fields", "[loader]") {
  SECTION("Talkers section may be omitted") {
    auto result = ScriptLoader::parse(R"({"lines": [{"id": 1, "text": "Hi", "start": true}]})");
    REQUIRE(result.isOk());
    CHECK(result.value().talkers.empty());
  }

  SECTION("Asset may be omitted") {
    auto result = ScriptLoader::parse(
        R"({"talkers": [{"name": "Bob"}], "lines": [{"id": 1, "text": "Hi"}]})");
    REQUIRE(result.isOk());
    CHECK(result.value().talkers[0].asset.empty());
  }

  SECTION("Null counts as absent") {
    auto result = ScriptLoader::parse(
        R"({"lines": [{"id": 1, "text": "Hi", "talker": null, "next": null, "end": null}]})");
    REQUIRE(result.isOk());
    const DialogueLine& l = result.value().lines[0];
    CHECK_FALSE(l.talker.has_value());
    CHECK_FALSE(l.next.has_value());
    CHECK_FALSE(l.end.has_value());
  }

  SECTION("Unknown fields are ignored") {
    auto result = ScriptLoader::parse(
        R"({"meta": {"author": "x"}, "lines": [{"id": 1, "text": "Hi", "mood": "happy"}]})");
    CHECK(result.isOk());
  }
}

TEST_CASE("ScriptLoader: choices, actions and extra talkers", "[loader]") {
  auto result = ScriptLoader::parse(R"({
    "talkers": [ { "name": "Bob" }, { "name": "Alice" } ],
    "lines": [
      { "id": 1, "text": "", "action": "enter", "talker": "Bob", "talkers": ["Alice"],
        "start": true, "next": 2 },
      { "id": 2, "text": "Well?", "talker": "Bob",
        "choices": [ { "text": "Yes", "next": 3 }, { "text": "No", "next": 3 } ] },
      { "id": 3, "text": "", "action": "leave", "talkers": ["Bob", "Alice"] }
    ]
  })");

  REQUIRE(result.isOk());
  const auto& lines = result.value().lines;

  CHECK(lines[0].action == LineAction::Enter);
  CHECK(lines[0].talkerNames() == std::vector<std::string>{"Bob", "Alice"});

  REQUIRE(lines[1].choices.has_value());
  REQUIRE(lines[1].choices->size() == 2);
  CHECK((*lines[1].choices)[0] == Choice{"Yes", 3});

  CHECK(lines[2].action == LineAction::Exit);
}

TEST_CASE("ScriptLoader: structural errors", "[loader]") {
  SECTION("Malformed JSON") {
    auto result = ScriptLoader::parse("{ \"lines\": [ ");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "Invalid JSON"));
  }

  SECTION("Top level is not an object") {
    auto result = ScriptLoader::parse("[]");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "must be a JSON object"));
  }

  SECTION("Missing lines") {
    auto result = ScriptLoader::parse(R"({"talkers": []})");
    REQUIRE(result.isError());
    CHECK(result.error() == "document: missing required field 'lines'");
  }

  SECTION("Lines is not an array") {
    auto result = ScriptLoader::parse(R"({"lines": {}})");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "field 'lines' must be an array"));
  }

  SECTION("Missing id") {
    auto result = ScriptLoader::parse(R"({"lines": [{"text": "Hi"}]})");
    REQUIRE(result.isError());
    CHECK(result.error() == "line #0: missing required field 'id'");
  }

  SECTION("Text of the wrong type names the line") {
    auto result = ScriptLoader::parse(R"({"lines": [{"id": 1, "text": 5}]})");
    REQUIRE(result.isError());
    CHECK(result.error() == "line #0 (id 1): field 'text' must be a string");
  }

  SECTION("Non-integer next") {
    auto result = ScriptLoader::parse(R"({"lines": [{"id": 1, "text": "a", "next": "2"}]})");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "field 'next' must be an integer"));
  }

  SECTION("Id out of range") {
    auto result = ScriptLoader::parse(R"({"lines": [{"id": 4294967296, "text": "a"}]})");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "out of range"));
  }

  SECTION("Unsigned ids too large for a line id") {
    auto id = ScriptLoader::parse(R"({"lines": [{"id": 18446744073709551615, "text": "a"}]})");
    REQUIRE(id.isError());
    CHECK(id.error() == "line #0: field 'id' is out of range");

    auto next = ScriptLoader::parse(
        R"({"lines": [{"id": 1, "text": "a", "next": 9223372036854775808}]})");
    REQUIRE(next.isError());
    CHECK(next.error() == "line #0 (id 1): field 'next' is out of range");

    auto largest = ScriptLoader::parse(R"({"lines": [{"id": 2147483647, "text": "a"}]})");
    REQUIRE(largest.isOk());
    CHECK(largest.value().lines[0].id == 2147483647);
  }

  SECTION("Unknown action") {
    auto result = ScriptLoader::parse(R"({"lines": [{"id": 1, "text": "a", "action": "dance"}]})");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "unknown action 'dance' (expected talk, enter or exit)"));
  }

  SECTION("Choice without target") {
    auto result =
        ScriptLoader::parse(R"({"lines": [{"id": 1, "text": "a", "choices": [{"text": "x"}]}]})");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "choice #0: missing required field 'next'"));
  }

  SECTION("Talker without name") {
    auto result = ScriptLoader::parse(R"({"talkers": [{"asset": "a.png"}], "lines": []})");
    REQUIRE(result.isError());
    CHECK(result.error() == "talker #0: missing required field 'name'");
  }

  SECTION("Start flag of the wrong type") {
    auto result = ScriptLoader::parse(R"({"lines": [{"id": 1, "text": "a", "start": 1}]})");
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "field 'start' must be a boolean"));
  }
}

TEST_CASE("ScriptLoader: empty line list loads but does not compile", "[loader]") {
  auto result = ScriptLoader::parse(R"({"lines": []})");

  REQUIRE(result.isOk());
  auto compiled = TalkCompiler().compile(result.value());
  REQUIRE(compiled.isError());
  CHECK(compiled.error().code == CompileErrorCode::NoLines);
}

TEST_CASE("ScriptLoader: toJson output parses back", "[loader]") {
  auto original = ScriptLoader::parse(R"({
    "talkers": [ { "name": "Bob", "asset": "bob.png" } ],
    "lines": [
      { "id": 1, "text": "Hi", "talker": "Bob", "start": true,
        "choices": [ { "text": "Go", "next": 2 } ] },
      { "id": 2, "text": "", "action": "exit", "talkers": ["Bob"], "end": true }
    ]
  })");
  REQUIRE(original.isOk());

  auto reparsed = ScriptLoader::parse(ScriptLoader::toJson(original.value()));

  REQUIRE(reparsed.isOk());
  const auto& lines = reparsed.value().lines;
  REQUIRE(lines.size() == 2);
  CHECK(lines[0].choices == original.value().lines[0].choices);
  CHECK(lines[1].action == LineAction::Exit);
  CHECK(lines[1].talkers == std::vector<std::string>{"Bob"});
  CHECK(lines[1].isEnd());
}

TEST_CASE("ScriptLoader: files", "[loader]") {
  TestDirectory dir;

  SECTION("Valid file") {
    auto result = ScriptLoader::loadFromFile(dir.file("ok.talk.json", kMinimal));
    REQUIRE(result.isOk());
    CHECK(result.value().lines.size() == 2);
  }

  SECTION("Missing file") {
    auto result = ScriptLoader::loadFromFile((dir.path() / "nope.json").string());
    REQUIRE(result.isError());
    CHECK(contains(result.error(), "File not found"));
  }

  SECTION("Errors are prefixed with the path") {
    std::string path = dir.file("bad.talk.json", R"({"lines": [{"id": 1}]})");
    auto result = ScriptLoader::loadFromFile(path);
    REQUIRE(result.isError());
    CHECK(result.error().rfind(path + ": ", 0) == 0);
  }
}

TEST_CASE("ScriptLoader: bundled sample compiles", "[loader]") {
  auto script = ScriptLoader::loadFromFile(std::string(TALKGRAPH_ASSETS_DIR) +
                                           "/talks/full.talk.json");
  REQUIRE(script.isOk());

  auto convo = TalkCompiler().compile(script.value());
  REQUIRE(convo.isOk());
  CHECK(convo.value().nodeCount() == 9);
  CHECK(convo.value().currentId() == 1);
  CHECK(convo.value().currentKind() == NodeKind::Join);
}
