/**
 * @file talk_player.cpp
 * @brief Terminal player implementation
 */

#include "TalkGraph/runtime/talk_player.hpp"
#include "TalkGraph/core/logger.hpp"
#include "TalkGraph/scripting/script_loader.hpp"
#include "TalkGraph/scripting/talk_compiler.hpp"

#include <charconv>
#include <iostream>

#ifndef TALKGRAPH_VERSION_MAJOR
#define TALKGRAPH_VERSION_MAJOR 0
#define TALKGRAPH_VERSION_MINOR 1
#define TALKGRAPH_VERSION_PATCH 0
#endif

namespace TalkGraph::runtime {

using scripting::NodeKind;

namespace {

std::string trim(const std::string& s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::optional<i32> parseInt(const std::string& s) {
  i32 value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string joinNames(const std::vector<scripting::Talker>& talkers, const char* separator) {
  std::string names;
  for (const auto& talker : talkers) {
    if (!names.empty()) {
      names += separator;
    }
    names += talker.name;
  }
  return names;
}

} // namespace

TalkPlayer::TalkPlayer() {
  m_host.setOnNodeEntered([this](TalkHandle, const Conversation&) {
    if (m_out != nullptr) {
      printCurrent(*m_out);
    }
  });
}

int TalkPlayer::exec(int argc, const char* const argv[], std::istream& in, std::ostream& out,
                     std::ostream& err) {
  const char* programName = argc > 0 ? argv[0] : "talk_player";
  PlayerOptions options = parseArgs(argc, argv);

  if (options.help) {
    printHelp(out, programName);
    return 0;
  }
  if (options.version) {
    printVersion(out);
    return 0;
  }
  if (!options.errors.empty()) {
    for (const auto& error : options.errors) {
      err << "Error: " << error << "\n";
    }
    err << "Run '" << programName << " --help' for usage.\n";
    return 1;
  }

  auto result = initialize(options, err);
  if (options.validateOnly) {
    if (result.isError()) {
      err << "Error: " << result.error() << "\n";
      return m_validation.isValid ? 1 : 2;
    }
    out << "Script OK: " << conversation()->nodeCount() << " lines, "
        << conversation()->edgeCount() << " links\n";
    return 0;
  }

  if (result.isError()) {
    err << "Error: " << result.error() << "\n";
    return 1;
  }
  return run(in, out);
}

PlayerOptions TalkPlayer::parseArgs(int argc, const char* const argv[]) {
  PlayerOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        opts.configPath = argv[++i];
      } else {
        opts.errors.push_back("--config requires a path");
      }
    } else if (arg == "--start") {
      if (i + 1 < argc) {
        std::string value = argv[++i];
        auto id = parseInt(value);
        if (id.has_value()) {
          opts.startOverride = *id;
        } else {
          opts.errors.push_back("--start expects a line id, got '" + value + "'");
        }
      } else {
        opts.errors.push_back("--start requires a line id");
      }
    } else if (arg == "--validate") {
      opts.validateOnly = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--quiet" || arg == "-q") {
      opts.quiet = true;
    } else if (!arg.empty() && arg[0] == '-') {
      opts.errors.push_back("unknown option '" + arg + "'");
    } else if (opts.scriptPath.empty()) {
      opts.scriptPath = arg;
    } else {
      opts.errors.push_back("unexpected argument '" + arg + "'");
    }
  }

  if (!opts.help && !opts.version && opts.scriptPath.empty() && opts.errors.empty()) {
    opts.errors.push_back("no script file given");
  }
  return opts;
}

Result<void> TalkPlayer::initialize(const PlayerOptions& options, std::ostream& diag) {
  if (!options.configPath.empty()) {
    auto configResult = m_config.loadFromFile(options.configPath);
    if (configResult.isError()) {
      return configResult;
    }
  }

  auto logResult = initializeLogging(options);
  if (logResult.isError()) {
    return logResult;
  }

  auto script = scripting::ScriptLoader::loadFromFile(options.scriptPath);
  if (script.isError()) {
    return Result<void>::error(script.error());
  }

  const CompileSettings& settings = m_config.getConfig().compile;

  if (settings.runValidator || options.validateOnly) {
    scripting::TalkValidator validator;
    validator.setReportUnused(settings.reportUnused);
    validator.setReportUnreachable(settings.reportUnreachable);
    validator.setWarningsAsErrors(settings.warningsAsErrors);
    validator.setHonourEndFlag(settings.honourEndFlag);
    m_validation = validator.validate(script.value());

    for (const auto& diagnostic : m_validation.diagnostics.all()) {
      diag << diagnostic.format() << "\n";
    }
    if (!m_validation.isValid) {
      return Result<void>::error("script has " +
                                 std::to_string(m_validation.diagnostics.size()) +
                                 " validation problem(s)");
    }
  }

  scripting::TalkCompiler compiler(scripting::CompileOptions{settings.honourEndFlag});
  auto compiled = compiler.compile(script.value());
  if (compiled.isError()) {
    diag << compiled.error().formatRich();
    return Result<void>::error("cannot compile " + options.scriptPath);
  }

  if (m_talk.has_value()) {
    m_host.despawn(*m_talk);
    m_talk.reset();
  }
  m_seenNodes.clear();
  TalkHandle handle = m_host.spawn(std::move(compiled).value());

  if (options.startOverride.has_value()) {
    auto jumped = m_host.apply(JumpToActionRequest{handle, *options.startOverride});
    if (jumped.isError()) {
      m_host.despawn(handle);
      return Result<void>::error("start line " + std::to_string(*options.startOverride) +
                                 " does not exist");
    }
  }

  m_talk = handle;
  return Result<void>::ok();
}

int TalkPlayer::run(std::istream& in, std::ostream& out) {
  if (!m_talk.has_value()) {
    return 1;
  }

  m_out = &out;
  printCurrent(out);

  std::string input;
  while (true) {
    const Conversation* convo = conversation();
    if (!convo->hasNext() && !convo->currentNode().isChoice()) {
      out << "(end of conversation)\n";
      break;
    }

    out << "> " << std::flush;
    if (!std::getline(in, input)) {
      out << "\n";
      break;
    }
    if (!handleInput(trim(input), out)) {
      break;
    }
  }

  m_out = nullptr;
  return 0;
}

const Conversation* TalkPlayer::conversation() const {
  return m_talk.has_value() ? m_host.find(*m_talk) : nullptr;
}

void TalkPlayer::printHelp(std::ostream& out, const char* programName) {
  out << "Usage: " << programName << " [options] <script.talk.json>\n\n";
  out << "TalkGraph player - play a branching conversation in the terminal.\n\n";
  out << "Options:\n";
  out << "  --config <path>   Load settings from a talkgraph.json file\n";
  out << "  --start <id>      Start from a specific line id\n";
  out << "  --validate        Check the script and exit\n";
  out << "  -v, --verbose     Verbose logging\n";
  out << "  -q, --quiet       Only log errors\n";
  out << "  -h, --help        Show this help message\n";
  out << "  --version         Show version information\n\n";
  out << "While playing:\n";
  out << "  <Enter>           Advance to the next line\n";
  out << "  <n>               Pick choice number n\n";
  out << "  j <id>            Jump to line <id>\n";
  out << "  q                 Quit\n";
}

void TalkPlayer::printVersion(std::ostream& out) {
  out << "TalkGraph player version " << TALKGRAPH_VERSION_MAJOR << "." << TALKGRAPH_VERSION_MINOR
      << "." << TALKGRAPH_VERSION_PATCH << "\n";
}

Result<void> TalkPlayer::initializeLogging(const PlayerOptions& options) {
  if (options.verbose) {
    m_config.setLogLevel("debug");
  } else if (options.quiet) {
    m_config.setLogLevel("error");
  }
  return m_config.applyLogging();
}

void TalkPlayer::printCurrent(std::ostream& out) {
  const Conversation* convo = conversation();
  if (convo == nullptr) {
    return;
  }

  const PlayerSettings& settings = m_config.getConfig().player;
  const auto talkers = convo->currentTalkers();
  const std::string& text = convo->currentText();

  if (settings.markSeenLines && m_seenNodes.count(convo->currentIndex()) != 0) {
    out << "(seen) ";
  }
  m_seenNodes.insert(convo->currentIndex());

  std::string speaker = talkers.empty() ? settings.narratorName : joinNames(talkers, " & ");

  switch (convo->currentKind()) {
  case NodeKind::Talk:
    out << speaker << ": " << text << "\n";
    break;
  case NodeKind::Join:
  case NodeKind::Leave: {
    const bool joining = convo->currentKind() == NodeKind::Join;
    const char* verb = joining ? (talkers.size() == 1 ? "enters" : "enter")
                               : (talkers.size() == 1 ? "exits" : "exit");
    out << "--- " << joinNames(talkers, ", ") << " " << verb << " the scene.";
    if (!text.empty()) {
      out << " " << text;
    }
    out << "\n";
    break;
  }
  case NodeKind::Choice: {
    if (!text.empty()) {
      out << speaker << ": " << text << "\n";
    }
    out << "Choices:\n";
    const auto choices = convo->currentChoices().value_or(std::vector<scripting::Choice>{});
    for (usize i = 0; i < choices.size(); ++i) {
      if (settings.showChoiceNumbers) {
        out << "  " << (i + 1) << ": " << choices[i].text << "\n";
      } else {
        out << "  - " << choices[i].text << "\n";
      }
    }
    break;
  }
  }
}

bool TalkPlayer::handleInput(const std::string& input, std::ostream& out) {
  if (input == "q" || input == "quit") {
    return false;
  }

  Result<void, scripting::TraversalError> result = Result<void, scripting::TraversalError>::ok();

  if (input.empty()) {
    result = m_host.apply(NextActionRequest{*m_talk});
  } else if (input.rfind("j ", 0) == 0) {
    auto id = parseInt(trim(input.substr(2)));
    if (!id.has_value()) {
      out << "! expected a line id after 'j'\n";
      return true;
    }
    result = m_host.apply(JumpToActionRequest{*m_talk, *id});
  } else if (auto number = parseInt(input)) {
    auto choices = conversation()->currentChoices();
    if (!choices.has_value()) {
      out << "! there are no choices here; press Enter to continue\n";
      return true;
    }
    if (*number < 1 || static_cast<usize>(*number) > choices->size()) {
      out << "! pick a choice between 1 and " << choices->size() << "\n";
      return true;
    }
    result = m_host.apply(JumpToActionRequest{*m_talk, (*choices)[*number - 1].next});
  } else {
    out << "! unknown command '" << input << "'\n";
    return true;
  }

  if (result.isError()) {
    out << "! " << result.error().message() << "\n";
  }
  return true;
}

} // namespace TalkGraph::runtime
