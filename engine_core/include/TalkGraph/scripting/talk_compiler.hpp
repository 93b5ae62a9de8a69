#pragma once

/**
 * @file talk_compiler.hpp
 * @brief Compiles a TalkScript into a traversable Conversation
 *
 * Compilation is fail-fast: the first problem found is returned and no
 * partial graph is ever produced.
 *
 * Example usage:
 * @code
 * TalkCompiler compiler;
 * auto result = compiler.compile(script);
 * if (result.isError()) {
 *     std::cerr << result.error().formatRich();
 * }
 * @endcode
 */

#include "TalkGraph/core/result.hpp"
#include "TalkGraph/scripting/conversation.hpp"
#include "TalkGraph/scripting/talk_error.hpp"
#include "TalkGraph/scripting/talk_script.hpp"

namespace TalkGraph::scripting {

struct CompileOptions {
  /// Lines flagged `end: true` get no outgoing edges. Their targets are
  /// still checked.
  bool honourEndFlag = true;
};

class TalkCompiler {
public:
  TalkCompiler() = default;
  explicit TalkCompiler(CompileOptions options) : m_options(options) {}

  [[nodiscard]] const CompileOptions& options() const { return m_options; }
  void setOptions(CompileOptions options) { m_options = options; }

  /**
   * @brief Validate @p script and build its conversation graph
   *
   * Checks, in order: the line list is non-empty; every line's talkers
   * exist; at most one start line; ids are unique; a start line exists;
   * every `next` and choice target exists. The returned conversation's
   * cursor is on the start line.
   */
  [[nodiscard]] Result<Conversation, CompileError> compile(const TalkScript& script) const;

private:
  CompileOptions m_options;
};

} // namespace TalkGraph::scripting
