#pragma once
/** @file  JsonFileSessionStore.hpp
 *  @brief SessionStore writing one JSON document per session.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "gateways/SessionStore.hpp"

namespace cardia {
  namespace core {
    class Logger;
  } // namespace core

  namespace gateways {

    /**
 * @class JsonFileSessionStore
 * @brief Layout: `<root>/<userId>/<sessionId>.json`.
 *
 *  * Sessions are named "Session N", N = stored sessions for the user + 1.
 *  * Documents that fail to parse are skipped by `listSessions()` (logged).
 *  * A mutex serialises writers; safe to share between threads.
 */
    class JsonFileSessionStore : public SessionStore {
    public:
      explicit JsonFileSessionStore(std::filesystem::path root,
                                    std::shared_ptr<core::Logger> logger = nullptr);

      SessionId saveSession(const core::Session& session) override;
      std::vector<SessionSummary> listSessions(const std::string& userId) override;
      void renameSession(const std::string& userId, const SessionId& id, const std::string& newName) override;
      void deleteSession(const std::string& userId, const SessionId& id) override;

      const std::filesystem::path& root() const { return root_; }

    private:
      std::filesystem::path userDir(const std::string& userId) const;
      std::filesystem::path documentPath(const std::string& userId, const SessionId& id) const;
      std::size_t countDocuments(const std::filesystem::path& dir) const;
      void warn(const std::string& msg) const;

      std::filesystem::path root_;
      std::shared_ptr<core::Logger> logger_;
      mutable std::mutex mtx_;
    };

  } // namespace gateways
} // namespace cardia
