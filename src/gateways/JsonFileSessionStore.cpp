/* @file JsonFileSessionStore.cpp
 * @brief per-user directory of JSON session documents
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <system_error>

// third-party headers
#include <nlohmann/json.hpp>

// Cardia headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/Session.hpp"
#include "gateways/JsonFileSessionStore.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace cardia {
  namespace gateways {

    namespace {

      void checkName(const std::string& what, const std::string& value) {
        if (value.empty() || value == "." || value == ".." ||
            value.find_first_of("/\\") != std::string::npos)
          throw core::PersistenceError("[JsonFileSessionStore] invalid " + what + ": \"" + value + "\"",
                                       "invalid-argument");
      }

      std::int64_t toMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
      }

      json toDocument(const core::Session& s, const std::string& name, int number) {
        const auto& m = s.metrics();
        json ecg = json::array();
        const double dt = 1.0 / static_cast<double>(s.sampleRateHz() ? s.sampleRateHz() : 1);
        const auto& samples = s.samples();
        for (std::size_t i = 0; i < samples.size(); ++i)
          ecg.push_back({ { "x", static_cast<double>(i) * dt }, { "y", samples[i] } });

        return json{
          { "userId", s.userId() },
          { "sessionName", name },
          { "sessionNumber", number },
          { "timestamp", toMillis(s.startedAt()) },
          { "duration", std::chrono::duration_cast<std::chrono::seconds>(s.duration()).count() },
          { "sampleRate", s.sampleRateHz() },
          { "sampleCount", samples.size() },
          { "ecgData", std::move(ecg) },
          { "heartRates", s.heartRates() },
          { "avgBPM", m.avgBpm },
          { "minBPM", m.minBpm },
          { "maxBPM", m.maxBpm },
          { "rhythm", s.rhythm() },
          { "status", m.heartRateStatus() },
          { "outcome", core::toString(s.outcome()) },
        };
      }

      SessionSummary toSummary(const SessionId& id, const std::string& userId, const json& doc) {
        SessionSummary out;
        out.id = id;
        out.userId = doc.value("userId", userId);
        out.number = doc.value("sessionNumber", 0);
        out.name = doc.value("sessionName", out.number > 0 ? "Session " + std::to_string(out.number)
                                                           : std::string("Session Unknown"));
        out.timestamp = std::chrono::system_clock::time_point{ std::chrono::milliseconds{
            doc.value("timestamp", std::int64_t{ 0 }) } };
        out.durationSeconds = doc.value("duration", 0L);
        if (doc.contains("sampleCount"))
          out.sampleCount = doc.at("sampleCount").get<std::size_t>();
        else if (doc.contains("ecgData") && doc.at("ecgData").is_array())
          out.sampleCount = doc.at("ecgData").size();
        out.avgBpm = doc.value("avgBPM", 0.0);
        out.minBpm = doc.value("minBPM", 0.0);
        out.maxBpm = doc.value("maxBPM", 0.0);
        out.rhythm = doc.value("rhythm", std::string("Normal Sinus Rhythm"));
        out.status = doc.value("status", std::string("Normal"));
        out.outcome = doc.value("outcome", std::string("completed"));
        return out;
      }

      json readDocument(const fs::path& path) {
        std::ifstream in(path);
        if (!in)
          throw core::PersistenceError("[JsonFileSessionStore] cannot read " + path.string());
        return json::parse(in);
      }

      void writeDocument(const fs::path& path, const json& doc) {
        const fs::path tmp = path.string() + ".tmp";
        {
          std::ofstream out(tmp, std::ios::trunc);
          if (!out)
            throw core::PersistenceError("[JsonFileSessionStore] cannot write " + tmp.string());
          out << doc.dump(2);
          if (!out.flush())
            throw core::PersistenceError("[JsonFileSessionStore] short write to " + tmp.string());
        }
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec)
          throw core::PersistenceError("[JsonFileSessionStore] rename to " + path.string() +
                                       " failed: " + ec.message());
      }

    } // namespace

    JsonFileSessionStore::JsonFileSessionStore(fs::path root, std::shared_ptr<core::Logger> logger)
        : root_(std::move(root)), logger_(std::move(logger)) {}

    fs::path JsonFileSessionStore::userDir(const std::string& userId) const {
      checkName("user id", userId);
      return root_ / userId;
    }

    fs::path JsonFileSessionStore::documentPath(const std::string& userId, const SessionId& id) const {
      checkName("session id", id);
      return userDir(userId) / (id + ".json");
    }

    std::size_t JsonFileSessionStore::countDocuments(const fs::path& dir) const {
      std::error_code ec;
      std::size_t n = 0;
      for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        if (it->path().extension() == ".json")
          ++n;
      if (ec)
        throw core::PersistenceError("[JsonFileSessionStore] cannot list " + dir.string() + ": " + ec.message());
      return n;
    }

    void JsonFileSessionStore::warn(const std::string& msg) const {
      if (logger_)
        logger_->log(core::LogLevel::Warning, "JsonFileSessionStore", msg);
    }

    SessionId JsonFileSessionStore::saveSession(const core::Session& session) {
      if (!session.sealed())
        throw core::PersistenceError("[JsonFileSessionStore] refusing to save unsealed session " + session.id(),
                                     "invalid-argument");

      std::lock_guard<std::mutex> lock(mtx_);
      const fs::path dir = userDir(session.userId());
      const fs::path path = documentPath(session.userId(), session.id());

      std::error_code ec;
      fs::create_directories(dir, ec);
      if (ec)
        throw core::PersistenceError("[JsonFileSessionStore] cannot create " + dir.string() + ": " + ec.message());
      if (fs::exists(path, ec))
        throw core::PersistenceError("[JsonFileSessionStore] session " + session.id() + " already stored",
                                     "already-exists");

      const int number = static_cast<int>(countDocuments(dir)) + 1;
      writeDocument(path, toDocument(session, "Session " + std::to_string(number), number));

      if (logger_)
        logger_->log(core::LogLevel::Info, "JsonFileSessionStore",
                     "saved " + session.id() + " as Session " + std::to_string(number) + " (" +
                         std::to_string(session.sampleCount()) + " samples)");
      return session.id();
    }

    std::vector<SessionSummary> JsonFileSessionStore::listSessions(const std::string& userId) {
      std::lock_guard<std::mutex> lock(mtx_);
      const fs::path dir = userDir(userId);

      std::vector<SessionSummary> out;
      std::error_code ec;
      if (!fs::exists(dir, ec))
        return out;

      for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() != ".json")
          continue;
        try {
          out.push_back(toSummary(p.stem().string(), userId, readDocument(p)));
        } catch (const json::exception& e) {
          warn("skipping malformed session " + p.string() + ": " + e.what());
        }
      }
      if (ec)
        throw core::PersistenceError("[JsonFileSessionStore] cannot list " + dir.string() + ": " + ec.message());

      std::sort(out.begin(), out.end(),
                [](const SessionSummary& a, const SessionSummary& b) { return a.timestamp > b.timestamp; });
      return out;
    }

    void JsonFileSessionStore::renameSession(const std::string& userId, const SessionId& id,
                                             const std::string& newName) {
      if (newName.empty())
        throw core::PersistenceError("[JsonFileSessionStore] session name must not be empty", "invalid-argument");

      std::lock_guard<std::mutex> lock(mtx_);
      const fs::path path = documentPath(userId, id);
      std::error_code ec;
      if (!fs::exists(path, ec))
        throw core::PersistenceError("[JsonFileSessionStore] no session " + id + " for " + userId, "not-found");

      json doc;
      try {
        doc = readDocument(path);
      } catch (const json::exception& e) {
        throw core::PersistenceError("[JsonFileSessionStore] session " + id + " is corrupt: " + e.what());
      }
      doc["sessionName"] = newName;
      writeDocument(path, doc);
    }

    void JsonFileSessionStore::deleteSession(const std::string& userId, const SessionId& id) {
      std::lock_guard<std::mutex> lock(mtx_);
      const fs::path path = documentPath(userId, id);
      std::error_code ec;
      if (!fs::remove(path, ec)) {
        if (ec)
          throw core::PersistenceError("[JsonFileSessionStore] cannot delete " + path.string() + ": " + ec.message());
        throw core::PersistenceError("[JsonFileSessionStore] no session " + id + " for " + userId, "not-found");
      }
    }

  } // namespace gateways
} // namespace cardia
