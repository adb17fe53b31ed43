#pragma once
/** @file  SessionStore.hpp
 *  @brief Abstract persistence gateway for sealed sessions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace cardia {
  namespace core { // forward decls only
    class Session;
  } // namespace core

  namespace gateways {

    using SessionId = std::string;

    /**
 * @struct SessionSummary
 * @brief List view of a stored session (no samples).
 */
    struct SessionSummary {
      SessionId id;
      std::string userId;
      std::string name;                 ///< "Session N" unless renamed
      int number{ 0 };
      std::chrono::system_clock::time_point timestamp{};
      long durationSeconds{ 0 };
      std::size_t sampleCount{ 0 };
      double avgBpm{ 0.0 };
      double minBpm{ 0.0 };
      double maxBpm{ 0.0 };
      std::string rhythm{ "Normal Sinus Rhythm" };
      std::string status{ "Normal" };
      std::string outcome{ "completed" };
    };

    /**
 * @class SessionStore
 * @brief Common polymorphic interface for every persistence backend.
 *
 *  * All methods throw core::PersistenceError on failure.
 *  * Implementations must be callable from a worker thread.
 */
    class SessionStore {
    public:
      virtual ~SessionStore() = default;

      /// Persist a sealed session for `session.userId()`; returns the stored id.
      virtual SessionId saveSession(const core::Session& session) = 0;

      /// Newest first.
      virtual std::vector<SessionSummary> listSessions(const std::string& userId) = 0;

      virtual void renameSession(const std::string& userId, const SessionId& id, const std::string& newName) = 0;
      virtual void deleteSession(const std::string& userId, const SessionId& id) = 0;
    };

  } // namespace gateways
} // namespace cardia
