#pragma once
// Store: the coordination store
//
// Agents, messages, file locks and shared memory in one SQLite file.
// Each public operation is a single transaction; write operations take
// the write lock up front (BEGIN IMMEDIATE). Failures throw bridge::Error.
//
// Lock expiry is lazy: a lock is active iff expires_at > clock(), checked
// whenever locks are read or taken. Nothing reclaims them in the
// background.

#include "config.hpp"
#include "error.hpp"
#include "sqlite.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

class Store {
public:
    explicit Store(StoreConfig config);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    const StoreConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════
    // Agent registry
    // ═══════════════════════════════════════════════════════════════

    // Insert or refresh. Unset program, model and task keep their stored
    // value; status falls back to "active" unless given.
    Agent register_agent(const std::string& name, const AgentInfo& info = {});

    // Most recently seen first
    std::vector<Agent> list_agents();

    std::optional<Agent> find_agent(const std::string& name);

    // ═══════════════════════════════════════════════════════════════
    // Messaging
    // ═══════════════════════════════════════════════════════════════

    Message send(const std::string& sender,
                 const std::string& recipient,
                 const std::string& subject,
                 const std::string& body = "",
                 const std::string& thread_id = "");

    // Oldest first. limit == 0 returns everything.
    std::vector<Message> inbox(const std::string& agent,
                               bool unread_only = false,
                               int limit = 0);

    // agent, when non-empty, must be the recipient
    Message mark_read(int64_t message_id, const std::string& agent = "");
    Message ack(int64_t message_id, const std::string& agent = "");

    // ═══════════════════════════════════════════════════════════════
    // File locks
    // ═══════════════════════════════════════════════════════════════

    // ttl_seconds == 0 uses config().default_lock_ttl_seconds.
    // Throws LockConflict if another agent holds an active lock.
    LockResult lock(const std::string& path,
                    const std::string& agent,
                    int64_t ttl_seconds = 0,
                    const std::string& reason = "");

    UnlockOutcome unlock(const std::string& path, const std::string& agent);

    std::vector<FileLock> list_locks(bool active_only = true,
                                     const std::string& agent = "");

    // ═══════════════════════════════════════════════════════════════
    // Shared memory
    // ═══════════════════════════════════════════════════════════════

    // Content is the key: remembering known text replaces its tags and
    // keeps its id and created_at.
    Memory remember(const std::string& content,
                    const std::vector<std::string>& tags = {});

    // Case-insensitive substring over content and tags, newest first.
    // limit == 0 uses config().default_recall_limit.
    std::vector<Memory> recall(const std::string& query, int limit = 0);

    void forget(int64_t memory_id);

    Timestamp current_time() const { return config_.clock(); }

private:
    StoreConfig config_;
    std::unique_ptr<sqlite::Database> db_;

    void init();
    void migrate(int from_version);
    void touch_agent(const std::string& name, Timestamp t);
    std::optional<Message> load_message(int64_t id);
    std::optional<FileLock> load_lock(const std::string& path);
    Message set_message_flag(int64_t message_id, const std::string& agent,
                             const char* column, const char* verb);
};

} // namespace bridge
