#include "TalkGraph/runtime/talk_host.hpp"
#include "TalkGraph/core/logger.hpp"

namespace TalkGraph::runtime {

TalkHandle TalkHost::spawn(Conversation conversation) {
  TalkHandle handle = m_nextHandle++;
  m_talks.emplace(handle, std::move(conversation));
  TALKGRAPH_LOG_DEBUG("Spawned talk {}", handle);
  return handle;
}

bool TalkHost::despawn(TalkHandle handle) {
  if (m_talks.erase(handle) == 0) {
    return false;
  }
  TALKGRAPH_LOG_DEBUG("Despawned talk {}", handle);
  return true;
}

const Conversation* TalkHost::find(TalkHandle handle) const {
  auto it = m_talks.find(handle);
  return it != m_talks.end() ? &it->second : nullptr;
}

Result<void, TraversalError> TalkHost::apply(const NextActionRequest& request) {
  auto it = m_talks.find(request.talk);
  if (it == m_talks.end()) {
    return Result<void, TraversalError>::error(TraversalError::noTalk());
  }
  return finishMove(request.talk, it->second.advance());
}

Result<void, TraversalError> TalkHost::apply(const JumpToActionRequest& request) {
  auto it = m_talks.find(request.talk);
  if (it == m_talks.end()) {
    return Result<void, TraversalError>::error(TraversalError::noTalk());
  }
  return finishMove(request.talk, it->second.jumpTo(request.target));
}

Result<void, TraversalError> TalkHost::apply(const TalkRequest& request) {
  return std::visit([this](const auto& r) { return apply(r); }, request);
}

void TalkHost::send(TalkRequest request) {
  m_queue.push_back(std::move(request));
}

std::vector<FailedRequest> TalkHost::update() {
  // Callbacks may send() more requests; those wait for the next update.
  std::vector<TalkRequest> queue;
  queue.swap(m_queue);

  std::vector<FailedRequest> failures;
  for (const auto& request : queue) {
    auto result = apply(request);
    if (result.isError()) {
      TalkHandle handle = std::visit([](const auto& r) { return r.talk; }, request);
      TALKGRAPH_LOG_ERROR("Request for talk {} failed: {}", handle, result.error().message());
      failures.push_back(FailedRequest{request, result.error()});
    }
  }
  return failures;
}

void TalkHost::setOnNodeEntered(NodeEnteredCallback callback) {
  m_onNodeEntered = std::move(callback);
}

void TalkHost::setOnChoicesReached(ChoicesReachedCallback callback) {
  m_onChoicesReached = std::move(callback);
}

Result<void, TraversalError> TalkHost::finishMove(TalkHandle handle,
                                                  const Result<void, TraversalError>& moved) {
  if (moved.isError()) {
    return moved;
  }

  // Callbacks run from local copies so they may replace themselves, and the
  // conversation is looked up again because a callback may despawn it.
  if (NodeEnteredCallback onEntered = m_onNodeEntered) {
    if (const Conversation* convo = find(handle)) {
      onEntered(handle, *convo);
    }
  }
  if (ChoicesReachedCallback onChoices = m_onChoicesReached) {
    if (const Conversation* convo = find(handle)) {
      if (const auto* choices = convo->currentNode().choices()) {
        onChoices(handle, *choices);
      }
    }
  }
  return moved;
}

} // namespace TalkGraph::runtime
