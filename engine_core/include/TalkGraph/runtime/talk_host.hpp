#pragma once

/**
 * @file talk_host.hpp
 * @brief Owner of several live conversations, driven by requests
 *
 * Each conversation spawned into the host gets a TalkHandle. Callers drive
 * them either directly with apply() or by queueing requests with send()
 * and draining them once per frame with update(). Requests addressed to a
 * handle the host does not know fail with TraversalError::NoTalk.
 *
 * Conversations share no state, so hosts need no locking of their own; a
 * single host must still be used from one thread at a time.
 */

#include "TalkGraph/core/result.hpp"
#include "TalkGraph/core/types.hpp"
#include "TalkGraph/scripting/conversation.hpp"
#include <functional>
#include <map>
#include <variant>
#include <vector>

namespace TalkGraph::runtime {

using scripting::Choice;
using scripting::Conversation;
using scripting::LineId;
using scripting::TraversalError;

using TalkHandle = u64;

/**
 * @brief Ask a conversation to move along its outgoing edge
 */
struct NextActionRequest {
  TalkHandle talk = 0;
};

/**
 * @brief Ask a conversation to jump to a line, usually a picked choice
 */
struct JumpToActionRequest {
  TalkHandle talk = 0;
  LineId target = 0;
};

using TalkRequest = std::variant<NextActionRequest, JumpToActionRequest>;

/**
 * @brief A queued request that failed during update()
 */
struct FailedRequest {
  TalkRequest request;
  TraversalError error;
};

/// Called after a conversation's cursor moved.
using NodeEnteredCallback = std::function<void(TalkHandle, const Conversation&)>;

/// Called after a conversation's cursor moved onto a choice node.
using ChoicesReachedCallback = std::function<void(TalkHandle, const std::vector<Choice>&)>;

class TalkHost {
public:
  TalkHost() = default;
  ~TalkHost() = default;

  TalkHost(const TalkHost&) = delete;
  TalkHost& operator=(const TalkHost&) = delete;

  /**
   * @brief Take ownership of a compiled conversation
   * @return Handle addressing it in later requests; never reused
   */
  TalkHandle spawn(Conversation conversation);

  /**
   * @brief Drop a conversation
   * @return false if the handle was unknown
   */
  bool despawn(TalkHandle handle);

  [[nodiscard]] const Conversation* find(TalkHandle handle) const;
  [[nodiscard]] bool contains(TalkHandle handle) const { return m_talks.count(handle) > 0; }
  [[nodiscard]] usize size() const { return m_talks.size(); }

  Result<void, TraversalError> apply(const NextActionRequest& request);
  Result<void, TraversalError> apply(const JumpToActionRequest& request);
  Result<void, TraversalError> apply(const TalkRequest& request);

  /**
   * @brief Queue a request for the next update()
   */
  void send(TalkRequest request);

  [[nodiscard]] usize pendingRequests() const { return m_queue.size(); }

  /**
   * @brief Apply queued requests in the order they were sent
   *
   * Failures are logged and returned; they do not stop later requests.
   */
  std::vector<FailedRequest> update();

  void setOnNodeEntered(NodeEnteredCallback callback);
  void setOnChoicesReached(ChoicesReachedCallback callback);

private:
  Result<void, TraversalError> finishMove(TalkHandle handle,
                                          const Result<void, TraversalError>& moved);

  // Ordered so iteration follows spawn order.
  std::map<TalkHandle, Conversation> m_talks;
  std::vector<TalkRequest> m_queue;
  TalkHandle m_nextHandle = 1;

  NodeEnteredCallback m_onNodeEntered;
  ChoicesReachedCallback m_onChoicesReached;
};

} // namespace TalkGraph::runtime
