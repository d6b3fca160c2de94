#include "planid/core/session_registry.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

#include "planid/core/log.hpp"

namespace planid::core {

SessionRegistry::SessionRegistry() : entropy_(&default_entropy_) {}

SessionRegistry::SessionRegistry(EntropySource& entropy) : entropy_(&entropy) {}

SessionId SessionRegistry::mint_session_id() {
  std::lock_guard<std::mutex> lock(entropy_mutex_);
  return format_session_id(Clock::now(), *entropy_);
}

SessionId SessionRegistry::OpenSession() {
  for (;;) {
    SessionId candidate = mint_session_id();
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    if (session_by_suffix_.contains(candidate.suffix)) {
      log::get()->debug("suffix {} already active; minting again", candidate.suffix);
      continue;
    }
    auto state = std::make_shared<SessionState>();
    state->id = candidate;
    sessions_.emplace(candidate.text, std::move(state));
    session_by_suffix_.emplace(candidate.suffix, candidate.text);
    log::get()->info("opened session {}", candidate.text);
    return candidate;
  }
}

Result<SessionId> SessionRegistry::AcceptClientSession(std::string_view text) {
  auto parsed = parse_session_id(text);
  if (!parsed.ok) {
    log::get()->warn("rejected client session '{}'", text);
    return make_error<SessionId>(ErrorCode::kInvalidSessionFormat, parsed.error);
  }

  std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
  if (auto it = sessions_.find(parsed.value.text); it != sessions_.end()) {
    log::get()->debug("resumed session {}", parsed.value.text);
    return make_ok(it->second->id);
  }
  if (auto owner = session_by_suffix_.find(parsed.value.suffix); owner != session_by_suffix_.end()) {
    log::get()->warn("rejected client session {}: suffix {} belongs to active session {}", parsed.value.text,
                     parsed.value.suffix, owner->second);
    return make_error<SessionId>(ErrorCode::kInvalidSessionFormat,
                                 "suffix '" + parsed.value.suffix + "' is already in use; request a new session");
  }
  auto state = std::make_shared<SessionState>();
  state->id = parsed.value;
  sessions_.emplace(parsed.value.text, std::move(state));
  session_by_suffix_.emplace(parsed.value.suffix, parsed.value.text);
  log::get()->info("accepted client session {}", parsed.value.text);
  return parsed;
}

Result<bool> SessionRegistry::CloseSession(const SessionId& session) {
  std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session.text);
  if (it == sessions_.end()) {
    return make_error<bool>(ErrorCode::kUnknownSession, "session '" + session.text + "' is not active");
  }
  session_by_suffix_.erase(it->second->id.suffix);
  sessions_.erase(it);
  log::get()->info("closed session {}", session.text);
  return make_ok(true);
}

NormalizeResult SessionRegistry::Plan(const SessionId& session, const RawGoalPlanTree& raw_tree) {
  std::shared_ptr<SessionState> state = find_state(session.text);
  if (!state) {
    NormalizeResult result;
    result.code = ErrorCode::kUnknownSession;
    result.error = "session '" + session.text + "' is not active";
    return result;
  }

  std::lock_guard<std::mutex> planning_lock(state->planning_mutex);
  NormalizeResult result = normalize(state->id, raw_tree, state->goal_sequence.peek());
  if (result.ok) {
    state->goal_sequence.advance(static_cast<Sequence>(result.value.goals.size()));
  }
  return result;
}

bool SessionRegistry::is_active(const SessionId& session) const { return find_state(session.text) != nullptr; }

std::optional<Sequence> SessionRegistry::next_goal_sequence(const SessionId& session) const {
  std::shared_ptr<SessionState> state = find_state(session.text);
  if (!state) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> planning_lock(state->planning_mutex);
  return state->goal_sequence.peek();
}

std::size_t SessionRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  return sessions_.size();
}

std::shared_ptr<SessionRegistry::SessionState> SessionRegistry::find_state(const std::string& session_text) const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_text);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

}  // namespace planid::core
