#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "planid/core/entities.hpp"
#include "planid/core/id.hpp"
#include "planid/core/id_format.hpp"
#include "planid/core/normalizer.hpp"
#include "planid/core/result.hpp"

namespace planid::core {

// Active-session set plus per-session planning serialization.
class SessionRegistry {
 public:
  SessionRegistry();
  // Entropy must outlive the registry.
  explicit SessionRegistry(EntropySource& entropy);

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Mints a server-side session id whose suffix no active session uses.
  SessionId OpenSession();

  // Accepts a client-supplied session string. A string already active resumes
  // that session. A non-canonical string, or one whose suffix already belongs
  // to a different active session, fails with kInvalidSessionFormat; the
  // client should then ask for a server-minted session.
  Result<SessionId> AcceptClientSession(std::string_view text);

  Result<bool> CloseSession(const SessionId& session);

  // Normalizes one planning call for an active session. Calls for the same
  // session run one at a time; goal sequences continue from the last
  // successful call and a rejected call consumes none.
  NormalizeResult Plan(const SessionId& session, const RawGoalPlanTree& raw_tree);

  [[nodiscard]] bool is_active(const SessionId& session) const;
  [[nodiscard]] std::optional<Sequence> next_goal_sequence(const SessionId& session) const;
  [[nodiscard]] std::size_t size() const;

 private:
  struct SessionState {
    SessionId id{};
    std::mutex planning_mutex;
    SequenceCounter goal_sequence{};
  };

  std::shared_ptr<SessionState> find_state(const std::string& session_text) const;
  SessionId mint_session_id();

  mutable std::shared_mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;
  // Goal ids embed only the suffix, so it must be unique among active sessions.
  std::unordered_map<std::string, std::string> session_by_suffix_;
  std::mutex entropy_mutex_;
  RandomEntropySource default_entropy_;
  EntropySource* entropy_ = nullptr;
};

}  // namespace planid::core
