#include "TalkGraph/scripting/talk_compiler.hpp"
#include <catch2/catch.hpp>
#include <algorithm>

using namespace TalkGraph;
using namespace TalkGraph::scripting;

namespace {

DialogueLine line(LineId id, std::string text) {
  DialogueLine l;
  l.id = id;
  l.text = std::move(text);
  return l;
}

DialogueLine startLine(LineId id, std::string text) {
  DialogueLine l = line(id, std::move(text));
  l.start = true;
  return l;
}

bool hasEdge(const Conversation& convo, LineId from, LineId to) {
  auto fromIndex = convo.indexOf(from);
  auto toIndex = convo.indexOf(to);
  if (!fromIndex || !toIndex) {
    return false;
  }
  const auto& edges = convo.edges();
  return std::find(edges.begin(), edges.end(), DialogueEdge{*fromIndex, *toIndex}) != edges.end();
}

} // namespace

// =============================================================================
// Compile errors
// =============================================================================

TEST_CASE("TalkCompiler: empty line list is rejected", "[compiler]") {
  TalkScript script;
  script.talkers.push_back({"Bob", "bob.png"});

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isError());
  CHECK(result.error() == CompileError::noLines());
}

TEST_CASE("TalkCompiler: unknown talker is rejected", "[compiler]") {
  SECTION("No talkers declared at all") {
    TalkScript script;
    DialogueLine l = startLine(1, "Hello");
    l.talker = "Bob";
    script.lines.push_back(l);

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::talkerNotFound(1, "Bob"));
  }

  SECTION("Declared talker does not match") {
    TalkScript script;
    script.talkers.push_back({"Bob", "bob.png"});
    DialogueLine l = startLine(1, "Hello");
    l.talker = "Alice";
    script.lines.push_back(l);

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error().code == CompileErrorCode::TalkerNotFound);
    CHECK(result.error().lineId == 1);
    CHECK(result.error().talkerName == "Alice");
  }

  SECTION("Unknown name in the extra talkers list") {
    TalkScript script;
    script.talkers.push_back({"Bob", "bob.png"});
    DialogueLine l = startLine(4, "");
    l.action = LineAction::Enter;
    l.talkers = {"Bob", "Carol"};
    script.lines.push_back(l);

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::talkerNotFound(4, "Carol"));
  }
}

TEST_CASE("TalkCompiler: unknown talker error suggests close names", "[compiler]") {
  TalkScript script;
  script.talkers.push_back({"Villain", "villain.png"});
  script.talkers.push_back({"Hero", "hero.png"});
  DialogueLine l = startLine(1, "Mwahaha");
  l.talker = "Villian";
  script.lines.push_back(l);

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isError());
  REQUIRE(result.error().suggestions.size() == 1);
  CHECK(result.error().suggestions[0] == "Villain");
  CHECK(result.error().formatRich().find("did you mean 'Villain'?") != std::string::npos);
}

TEST_CASE("TalkCompiler: talker name suggestions", "[compiler]") {
  SECTION("Edit distance") {
    CHECK(editDistance("", "") == 0);
    CHECK(editDistance("Bob", "") == 3);
    CHECK(editDistance("", "Bob") == 3);
    CHECK(editDistance("Alice", "Alise") == 1);
    CHECK(editDistance("kitten", "sitting") == 3);
    CHECK(editDistance("sitting", "kitten") == 3);
  }

  SECTION("Closest names first, ties in declaration order") {
    const std::vector<std::string> known = {"Bobby", "Rob", "Bob", "Bo", "Alice"};
    CHECK(suggestNames("Bob", known) == std::vector<std::string>{"Rob", "Bo", "Bobby"});
  }

  SECTION("Limit and exact matches") {
    const std::vector<std::string> known = {"Ann", "Anna", "Anne", "Annie"};
    CHECK(suggestNames("Ann", known, 2, 2) == std::vector<std::string>{"Anna", "Anne"});
    CHECK(suggestNames("Zed", known).empty());
  }
}

TEST_CASE("TalkCompiler: dangling next is rejected", "[compiler]") {
  TalkScript script;
  script.talkers.push_back({"Bob", "bob.png"});
  DialogueLine l = startLine(1, "Hello");
  l.talker = "Bob";
  l.next = 2;
  script.lines.push_back(l);

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isError());
  CHECK(result.error() == CompileError::nextLineNotFound(1, 2));
}

TEST_CASE("TalkCompiler: dangling choice target is rejected", "[compiler]") {
  TalkScript script;
  DialogueLine l = startLine(1, "Hello");
  l.choices = std::vector<Choice>{{"Whatup", 2}};
  script.lines.push_back(l);

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isError());
  CHECK(result.error() == CompileError::nextLineNotFound(1, 2));
}

TEST_CASE("TalkCompiler: repeated id is rejected", "[compiler]") {
  TalkScript script;
  DialogueLine first = startLine(1, "Hello");
  first.next = 1;
  DialogueLine second = line(1, "Whatup");
  second.next = 2;
  script.lines = {first, second};

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isError());
  CHECK(result.error() == CompileError::repeatedId(1));
}

TEST_CASE("TalkCompiler: start line count must be exactly one", "[compiler]") {
  SECTION("No start line") {
    TalkScript script;
    script.lines.push_back(line(1, "Hello"));

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::noStartingDialogue());
  }

  SECTION("Two start lines") {
    TalkScript script;
    script.lines = {startLine(1, "Hello"), startLine(2, "Whatup")};

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::multipleStartingDialogues());
  }

  SECTION("Explicit start: false does not count") {
    TalkScript script;
    DialogueLine l = line(1, "Hello");
    l.start = false;
    script.lines.push_back(l);

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::noStartingDialogue());
  }
}

TEST_CASE("TalkCompiler: first error in input order wins", "[compiler]") {
  SECTION("Talker lookup happens before the duplicate-id check") {
    TalkScript script;
    DialogueLine first = startLine(1, "Hello");
    DialogueLine second = line(1, "Again");
    second.talker = "Ghost";
    script.lines = {first, second};

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::talkerNotFound(1, "Ghost"));
  }

  SECTION("A second start line is reported before its repeated id") {
    TalkScript script;
    script.lines = {startLine(1, "Hello"), startLine(1, "Again")};

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::multipleStartingDialogues());
  }

  SECTION("Missing start is reported before dangling links") {
    TalkScript script;
    DialogueLine l = line(1, "Hello");
    l.next = 42;
    script.lines.push_back(l);

    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::noStartingDialogue());
  }
}

TEST_CASE("TalkCompiler: error messages name the offending ids", "[compiler]") {
  CHECK(CompileError::nextLineNotFound(1, 2).message() ==
        "the dialogue line 1 is pointing to id 2 which was not found");
  CHECK(CompileError::talkerNotFound(3, "Bob").message() ==
        "the dialogue line 3 has specified a non existent talker Bob");
  CHECK(CompileError::repeatedId(7).format() ==
        "error[E104]: the dialogue line 7 has the same id as another dialogue");
}

// =============================================================================
// Graph shape
// =============================================================================

TEST_CASE("TalkCompiler: single line compiles to one node and no edges", "[compiler]") {
  TalkScript script;
  script.lines.push_back(startLine(1, "Hello"));

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  const Conversation& convo = result.value();
  CHECK(convo.nodeCount() == 1);
  CHECK(convo.edgeCount() == 0);
  CHECK(convo.currentIndex() == 0);
  CHECK(convo.currentText() == "Hello");
}

TEST_CASE("TalkCompiler: two linear lines compile to one edge", "[compiler]") {
  TalkScript script;
  DialogueLine first = startLine(1, "Hello");
  first.next = 2;
  script.lines = {first, line(2, "Whatup")};

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  CHECK(result.value().nodeCount() == 2);
  CHECK(result.value().edgeCount() == 1);
  CHECK(hasEdge(result.value(), 1, 2));
}

TEST_CASE("TalkCompiler: self loop is allowed", "[compiler]") {
  TalkScript script;
  DialogueLine l = startLine(1, "Hello");
  l.next = 1;
  script.lines.push_back(l);

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  CHECK(result.value().nodeCount() == 1);
  CHECK(result.value().edgeCount() == 1);
  CHECK(hasEdge(result.value(), 1, 1));
}

TEST_CASE("TalkCompiler: choice edges point at the choice targets", "[compiler]") {
  TalkScript script;
  DialogueLine first = startLine(1, "Hello");
  first.choices = std::vector<Choice>{{"Choice 1", 2}, {"Choice 2", 3}};
  DialogueLine second = line(2, "Hello");
  second.next = 3;
  script.lines = {first, second, line(3, "Hello")};

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  const Conversation& convo = result.value();
  CHECK(convo.nodeCount() == 3);
  CHECK(convo.edgeCount() == 3);
  CHECK(convo.currentIndex() == 0);
  CHECK(hasEdge(convo, 1, 2));
  CHECK(hasEdge(convo, 1, 3));
  CHECK(hasEdge(convo, 2, 3));
  CHECK_FALSE(hasEdge(convo, 1, 1));
}

TEST_CASE("TalkCompiler: start line need not be the first line", "[compiler]") {
  TalkScript script;
  DialogueLine intro = startLine(20, "Intro");
  intro.next = 10;
  script.lines = {line(10, "Later"), intro};

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  CHECK(result.value().currentId() == 20);
  CHECK(result.value().startIndex() == 1);
}

TEST_CASE("TalkCompiler: next takes priority over choices", "[compiler]") {
  TalkScript script;
  DialogueLine first = startLine(1, "Hello");
  first.next = 2;
  first.choices = std::vector<Choice>{{"Go to 3", 3}};
  script.lines = {first, line(2, "Two"), line(3, "Three")};

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  const Conversation& convo = result.value();
  CHECK(convo.edgeCount() == 1);
  CHECK(hasEdge(convo, 1, 2));
  CHECK(convo.currentKind() == NodeKind::Talk);
  CHECK_FALSE(convo.currentChoices().has_value());
}

TEST_CASE("TalkCompiler: dangling choice is ignored when next is present", "[compiler]") {
  TalkScript script;
  DialogueLine first = startLine(1, "Hello");
  first.next = 2;
  first.choices = std::vector<Choice>{{"Nowhere", 99}};
  script.lines = {first, line(2, "Two")};

  auto result = TalkCompiler().compile(script);

  CHECK(result.isOk());
}

TEST_CASE("TalkCompiler: empty choice list makes a terminal talk node", "[compiler]") {
  TalkScript script;
  DialogueLine l = startLine(1, "Hello");
  l.choices = std::vector<Choice>{};
  script.lines.push_back(l);

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  CHECK(result.value().currentKind() == NodeKind::Talk);
  CHECK(result.value().edgeCount() == 0);
}

TEST_CASE("TalkCompiler: end flag handling", "[compiler]") {
  TalkScript script;
  DialogueLine first = startLine(1, "Goodbye");
  first.next = 2;
  first.end = true;
  script.lines = {first, line(2, "Epilogue")};

  SECTION("Honoured by default: no outgoing edges") {
    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isOk());
    CHECK(result.value().edgeCount() == 0);
    CHECK_FALSE(result.value().hasNext());
  }

  SECTION("Informational when disabled") {
    auto result = TalkCompiler(CompileOptions{false}).compile(script);

    REQUIRE(result.isOk());
    CHECK(result.value().edgeCount() == 1);
  }

  SECTION("Targets of end lines are still checked") {
    script.lines[0].next = 77;
    auto result = TalkCompiler().compile(script);

    REQUIRE(result.isError());
    CHECK(result.error() == CompileError::nextLineNotFound(1, 77));
  }
}

TEST_CASE("TalkCompiler: later talker declarations win", "[compiler]") {
  TalkScript script;
  script.talkers.push_back({"Bob", "old.png"});
  script.talkers.push_back({"Bob", "new.png"});
  DialogueLine l = startLine(1, "Hello");
  l.talker = "Bob";
  script.lines.push_back(l);

  auto result = TalkCompiler().compile(script);

  REQUIRE(result.isOk());
  auto talkers = result.value().currentTalkers();
  REQUIRE(talkers.size() == 1);
  CHECK(talkers[0].asset == "new.png");
}

TEST_CASE("TalkCompiler: node kinds follow the line action", "[compiler]") {
  TalkScript script;
  script.talkers = {{"Bob", "bob.png"}, {"Alice", "alice.png"}};

  DialogueLine enter = startLine(1, "");
  enter.action = LineAction::Enter;
  enter.talker = "Bob";
  enter.talkers = {"Alice"};
  enter.next = 2;

  DialogueLine ask = line(2, "Stay or go?");
  ask.talker = "Bob";
  ask.choices = std::vector<Choice>{{"Stay", 1}, {"Go", 3}};

  DialogueLine exit = line(3, "");
  exit.action = LineAction::Exit;
  exit.talkers = {"Bob", "Alice"};

  script.lines = {enter, ask, exit};

  auto result = TalkCompiler().compile(script);
  REQUIRE(result.isOk());
  const Conversation& convo = result.value();

  CHECK(convo.node(0).kind() == NodeKind::Join);
  CHECK(convo.node(1).kind() == NodeKind::Choice);
  CHECK(convo.node(2).kind() == NodeKind::Leave);

  const auto& joined = convo.node(0).talkers();
  REQUIRE(joined.size() == 2);
  CHECK(joined[0].name == "Bob");
  CHECK(joined[1].name == "Alice");
}
