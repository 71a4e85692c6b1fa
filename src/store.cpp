#include <bridge/store.hpp>
#include <bridge/log.hpp>
#include <bridge/version.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace bridge {

using json = nlohmann::json;

namespace {

constexpr const char* AGENT_COLUMNS =
    "name, program, model, task, status, registered_at, last_seen";
constexpr const char* MESSAGE_COLUMNS =
    "id, sender, recipient, subject, body, thread_id, created_at, read_at, acked_at";
constexpr const char* LOCK_COLUMNS =
    "path, agent, reason, acquired_at, expires_at";
constexpr const char* MEMORY_COLUMNS =
    "id, content, tags, created_at";

std::string select_from(const char* columns, const char* rest) {
    return std::string("SELECT ") + columns + " " + rest;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_ci(const std::string& haystack, const std::string& needle_lower) {
    return to_lower(haystack).find(needle_lower) != std::string::npos;
}

void bind_optional(sqlite::Statement& st, int idx, const std::optional<std::string>& value) {
    if (value) st.bind_text(idx, *value);
    else st.bind_null(idx);
}

void require(const std::string& value, const char* name) {
    if (value.empty()) {
        throw invalid_input(std::string("Missing required parameter: ") + name);
    }
}

Agent read_agent(const sqlite::Statement& st) {
    Agent a;
    a.name = st.column_text(0);
    a.program = st.column_text(1);
    a.model = st.column_text(2);
    a.task = st.column_text(3);
    a.status = st.column_text(4);
    a.registered_at = st.column_int64(5);
    a.last_seen = st.column_int64(6);
    return a;
}

Message read_message(const sqlite::Statement& st) {
    Message m;
    m.id = st.column_int64(0);
    m.sender = st.column_text(1);
    m.recipient = st.column_text(2);
    m.subject = st.column_text(3);
    m.body = st.column_text(4);
    m.thread_id = st.column_text(5);
    m.created_at = st.column_int64(6);
    m.read_at = st.column_optional_int64(7);
    m.acked_at = st.column_optional_int64(8);
    return m;
}

FileLock read_lock(const sqlite::Statement& st) {
    FileLock l;
    l.path = st.column_text(0);
    l.agent = st.column_text(1);
    l.reason = st.column_text(2);
    l.acquired_at = st.column_int64(3);
    l.expires_at = st.column_int64(4);
    return l;
}

Memory read_memory(const sqlite::Statement& st) {
    Memory m;
    m.id = st.column_int64(0);
    m.content = st.column_text(1);
    m.created_at = st.column_int64(3);

    auto tags = json::parse(st.column_text(2), nullptr, false);
    if (tags.is_array()) {
        for (const auto& t : tags) {
            if (t.is_string()) m.tags.push_back(t.get<std::string>());
        }
    } else {
        log_warn("store", "memory %lld has unreadable tags", static_cast<long long>(m.id));
    }
    return m;
}

} // namespace

Store::Store(StoreConfig config) : config_(std::move(config)) {
    if (config_.path.empty()) {
        throw invalid_input("Store path is empty");
    }
    if (!config_.clock) {
        config_.clock = now;
    }

    if (config_.path != ":memory:") {
        namespace fs = std::filesystem;
        fs::path parent = fs::path(config_.path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                throw Error(ErrorKind::Storage,
                            "Cannot create " + parent.string() + ": " + ec.message());
            }
        }
    }

    db_ = std::make_unique<sqlite::Database>(config_.path, config_.busy_timeout_ms);
    init();
    log_debug("store", "opened %s", config_.path.c_str());
}

Store::~Store() = default;

// ═══════════════════════════════════════════════════════════════════
// Schema
// ═══════════════════════════════════════════════════════════════════

void Store::init() {
    db_->exec("PRAGMA journal_mode=WAL;");

    int on_disk = db_->user_version();
    if (!version::schema_compatible(on_disk)) {
        throw Error(ErrorKind::Storage,
                    "Database schema v" + std::to_string(on_disk) +
                    " is newer than this build supports (v" +
                    std::to_string(BRIDGE_SCHEMA_VERSION) + ")");
    }
    migrate(on_disk);
}

// Sequential upgrades, each idempotent. v0 is an empty file.
void Store::migrate(int from_version) {
    if (from_version >= BRIDGE_SCHEMA_VERSION) return;

    sqlite::Transaction tx(*db_);

    if (from_version < 1) {
        db_->exec(
            "CREATE TABLE IF NOT EXISTS agents (\n"
            "  name TEXT PRIMARY KEY,\n"
            "  program TEXT NOT NULL DEFAULT 'unknown',\n"
            "  model TEXT NOT NULL DEFAULT 'unknown',\n"
            "  task TEXT NOT NULL DEFAULT '',\n"
            "  status TEXT NOT NULL DEFAULT 'active',\n"
            "  registered_at INTEGER NOT NULL,\n"
            "  last_seen INTEGER NOT NULL\n"
            ");");
        db_->exec(
            "CREATE TABLE IF NOT EXISTS messages (\n"
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
            "  sender TEXT NOT NULL,\n"
            "  recipient TEXT NOT NULL,\n"
            "  subject TEXT NOT NULL,\n"
            "  body TEXT NOT NULL DEFAULT '',\n"
            "  thread_id TEXT NOT NULL DEFAULT '',\n"
            "  created_at INTEGER NOT NULL,\n"
            "  read_at INTEGER,\n"
            "  acked_at INTEGER\n"
            ");");
        db_->exec("CREATE INDEX IF NOT EXISTS idx_messages_recipient ON messages(recipient, id);");
        db_->exec(
            "CREATE TABLE IF NOT EXISTS file_locks (\n"
            "  path TEXT PRIMARY KEY,\n"
            "  agent TEXT NOT NULL,\n"
            "  reason TEXT NOT NULL DEFAULT '',\n"
            "  acquired_at INTEGER NOT NULL,\n"
            "  expires_at INTEGER NOT NULL\n"
            ");");
        db_->exec(
            "CREATE TABLE IF NOT EXISTS memory (\n"
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
            "  content TEXT NOT NULL,\n"
            "  tags TEXT NOT NULL DEFAULT '[]',\n"
            "  created_at INTEGER NOT NULL\n"
            ");");
    }

    if (from_version < 2) {
        // One row per distinct content: oldest id, newest tags
        db_->exec(
            "UPDATE memory SET tags = (\n"
            "  SELECT newer.tags FROM memory AS newer WHERE newer.content = memory.content\n"
            "  ORDER BY newer.id DESC LIMIT 1);");
        db_->exec("DELETE FROM memory WHERE id NOT IN (SELECT MIN(id) FROM memory GROUP BY content);");
        db_->exec("CREATE UNIQUE INDEX IF NOT EXISTS idx_memory_content ON memory(content);");
    }

    db_->set_user_version(BRIDGE_SCHEMA_VERSION);
    tx.commit();
    log_debug("store", "schema v%d -> v%d", from_version, BRIDGE_SCHEMA_VERSION);
}

void Store::touch_agent(const std::string& name, Timestamp t) {
    sqlite::Statement st(*db_,
        "UPDATE agents SET last_seen = MAX(last_seen, ?2), status = 'active' WHERE name = ?1;");
    st.bind_text(1, name);
    st.bind_int64(2, t);
    st.step();
}

// ═══════════════════════════════════════════════════════════════════
// Agent registry
// ═══════════════════════════════════════════════════════════════════

Agent Store::register_agent(const std::string& name, const AgentInfo& info) {
    require(name, "name");

    sqlite::Transaction tx(*db_);
    Timestamp t = config_.clock();

    sqlite::Statement upsert(*db_,
        "INSERT INTO agents (name, program, model, task, status, registered_at, last_seen)\n"
        "VALUES (?1, COALESCE(?2, 'unknown'), COALESCE(?3, 'unknown'), COALESCE(?4, ''),\n"
        "        COALESCE(?5, 'active'), ?6, ?6)\n"
        "ON CONFLICT(name) DO UPDATE SET\n"
        "  program = COALESCE(?2, program),\n"
        "  model = COALESCE(?3, model),\n"
        "  task = COALESCE(?4, task),\n"
        "  status = COALESCE(?5, 'active'),\n"
        "  last_seen = MAX(last_seen, ?6);");
    upsert.bind_text(1, name);
    bind_optional(upsert, 2, info.program);
    bind_optional(upsert, 3, info.model);
    bind_optional(upsert, 4, info.task);
    bind_optional(upsert, 5, info.status);
    upsert.bind_int64(6, t);
    upsert.step();

    auto agent = find_agent(name);
    if (!agent) {
        throw Error(ErrorKind::Storage, "Agent " + name + " vanished after upsert");
    }

    tx.commit();
    log_debug("store", "registered %s (%s/%s)", name.c_str(),
              agent->program.c_str(), agent->model.c_str());
    return *agent;
}

std::vector<Agent> Store::list_agents() {
    sqlite::Transaction tx(*db_, false);
    sqlite::Statement st(*db_,
        select_from(AGENT_COLUMNS, "FROM agents ORDER BY last_seen DESC, name ASC;").c_str());

    std::vector<Agent> agents;
    while (st.step()) {
        agents.push_back(read_agent(st));
    }
    tx.commit();
    return agents;
}

std::optional<Agent> Store::find_agent(const std::string& name) {
    sqlite::Statement st(*db_, select_from(AGENT_COLUMNS, "FROM agents WHERE name = ?1;").c_str());
    st.bind_text(1, name);
    if (!st.step()) return std::nullopt;
    return read_agent(st);
}

// ═══════════════════════════════════════════════════════════════════
// Messaging
// ═══════════════════════════════════════════════════════════════════

Message Store::send(const std::string& sender,
                    const std::string& recipient,
                    const std::string& subject,
                    const std::string& body,
                    const std::string& thread_id) {
    require(sender, "sender");
    require(recipient, "recipient");
    require(subject, "subject");

    sqlite::Transaction tx(*db_);
    Timestamp t = config_.clock();

    if (config_.strict_recipients && !find_agent(recipient)) {
        throw not_found("Unknown recipient: " + recipient + " (not a registered agent)");
    }

    sqlite::Statement ins(*db_,
        "INSERT INTO messages (sender, recipient, subject, body, thread_id, created_at)\n"
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6);");
    ins.bind_text(1, sender);
    ins.bind_text(2, recipient);
    ins.bind_text(3, subject);
    ins.bind_text(4, body);
    ins.bind_text(5, thread_id);
    ins.bind_int64(6, t);
    ins.step();

    Message m;
    m.id = db_->last_insert_rowid();
    m.sender = sender;
    m.recipient = recipient;
    m.subject = subject;
    m.body = body;
    m.thread_id = thread_id;
    m.created_at = t;

    touch_agent(sender, t);
    tx.commit();

    log_debug("store", "message %lld %s -> %s", static_cast<long long>(m.id),
              sender.c_str(), recipient.c_str());
    return m;
}

std::vector<Message> Store::inbox(const std::string& agent, bool unread_only, int limit) {
    require(agent, "agent");
    if (limit < 0) {
        throw invalid_input("limit must be >= 0");
    }

    sqlite::Transaction tx(*db_);
    sqlite::Statement st(*db_, select_from(MESSAGE_COLUMNS,
        "FROM messages WHERE recipient = ?1 AND (?2 = 0 OR read_at IS NULL)\n"
        "ORDER BY id ASC LIMIT ?3;").c_str());
    st.bind_text(1, agent);
    st.bind_int64(2, unread_only ? 1 : 0);
    st.bind_int64(3, limit > 0 ? limit : -1);

    std::vector<Message> messages;
    while (st.step()) {
        messages.push_back(read_message(st));
    }

    touch_agent(agent, config_.clock());
    tx.commit();
    return messages;
}

std::optional<Message> Store::load_message(int64_t id) {
    sqlite::Statement st(*db_, select_from(MESSAGE_COLUMNS, "FROM messages WHERE id = ?1;").c_str());
    st.bind_int64(1, id);
    if (!st.step()) return std::nullopt;
    return read_message(st);
}

Message Store::set_message_flag(int64_t message_id, const std::string& agent,
                                const char* column, const char* verb) {
    sqlite::Transaction tx(*db_);
    Timestamp t = config_.clock();

    auto msg = load_message(message_id);
    if (!msg) {
        throw not_found("Message " + std::to_string(message_id) + " not found");
    }
    if (!agent.empty() && agent != msg->recipient) {
        throw Error(ErrorKind::Forbidden,
                    "Message " + std::to_string(message_id) + " is addressed to " +
                    msg->recipient + ", not " + agent);
    }

    // First mark wins; repeating is a no-op
    std::string sql = std::string("UPDATE messages SET ") + column + " = ?2 WHERE id = ?1 AND " +
                      column + " IS NULL;";
    sqlite::Statement upd(*db_, sql.c_str());
    upd.bind_int64(1, message_id);
    upd.bind_int64(2, t);
    upd.step();

    touch_agent(agent.empty() ? msg->recipient : agent, t);

    msg = load_message(message_id);
    tx.commit();

    log_debug("store", "message %lld %s", static_cast<long long>(message_id), verb);
    return *msg;
}

Message Store::mark_read(int64_t message_id, const std::string& agent) {
    return set_message_flag(message_id, agent, "read_at", "read");
}

Message Store::ack(int64_t message_id, const std::string& agent) {
    return set_message_flag(message_id, agent, "acked_at", "acknowledged");
}

// ═══════════════════════════════════════════════════════════════════
// File locks
// ═══════════════════════════════════════════════════════════════════

std::optional<FileLock> Store::load_lock(const std::string& path) {
    sqlite::Statement st(*db_, select_from(LOCK_COLUMNS, "FROM file_locks WHERE path = ?1;").c_str());
    st.bind_text(1, path);
    if (!st.step()) return std::nullopt;
    return read_lock(st);
}

LockResult Store::lock(const std::string& path,
                       const std::string& agent,
                       int64_t ttl_seconds,
                       const std::string& reason) {
    require(path, "path");
    require(agent, "agent");
    if (ttl_seconds == 0) ttl_seconds = config_.default_lock_ttl_seconds;
    if (ttl_seconds <= 0 || ttl_seconds > MAX_LOCK_TTL_SECONDS) {
        throw invalid_input("ttl_seconds must be between 1 and " +
                            std::to_string(MAX_LOCK_TTL_SECONDS));
    }

    sqlite::Transaction tx(*db_);
    Timestamp t = config_.clock();
    Timestamp expires = t + ttl_seconds * 1000;

    LockResult result;
    auto existing = load_lock(path);

    if (existing && existing->active_at(t)) {
        if (existing->agent != agent) {
            throw LockConflict(path, existing->agent, remaining_seconds(*existing, t));
        }

        sqlite::Statement renew(*db_,
            "UPDATE file_locks SET expires_at = ?2, reason = CASE WHEN ?3 = '' THEN reason ELSE ?3 END\n"
            "WHERE path = ?1;");
        renew.bind_text(1, path);
        renew.bind_int64(2, expires);
        renew.bind_text(3, reason);
        renew.step();

        result.outcome = LockOutcome::Renewed;
        result.lock = *existing;
        result.lock.expires_at = expires;
        if (!reason.empty()) result.lock.reason = reason;
    } else {
        if (existing) {
            log_debug("store", "reclaiming expired lock on %s from %s",
                      path.c_str(), existing->agent.c_str());
        }

        sqlite::Statement acquire(*db_,
            "INSERT OR REPLACE INTO file_locks (path, agent, reason, acquired_at, expires_at)\n"
            "VALUES (?1, ?2, ?3, ?4, ?5);");
        acquire.bind_text(1, path);
        acquire.bind_text(2, agent);
        acquire.bind_text(3, reason);
        acquire.bind_int64(4, t);
        acquire.bind_int64(5, expires);
        acquire.step();

        result.outcome = LockOutcome::Acquired;
        result.lock = FileLock{path, agent, reason, t, expires};
    }

    touch_agent(agent, t);
    tx.commit();

    log_debug("store", "lock %s %s by %s for %llds", path.c_str(),
              to_string(result.outcome), agent.c_str(), static_cast<long long>(ttl_seconds));
    return result;
}

UnlockOutcome Store::unlock(const std::string& path, const std::string& agent) {
    require(path, "path");
    require(agent, "agent");

    sqlite::Transaction tx(*db_);
    Timestamp t = config_.clock();

    UnlockOutcome outcome = UnlockOutcome::NotLocked;
    auto existing = load_lock(path);

    if (existing && existing->active_at(t) && existing->agent != agent) {
        throw Error(ErrorKind::Forbidden,
                    path + " is locked by " + existing->agent +
                    "; only the holder can unlock it");
    }

    if (existing) {
        // Either ours, or expired and free for anyone to clear
        sqlite::Statement del(*db_, "DELETE FROM file_locks WHERE path = ?1;");
        del.bind_text(1, path);
        del.step();
        if (existing->active_at(t)) outcome = UnlockOutcome::Released;
    }

    touch_agent(agent, t);
    tx.commit();

    log_debug("store", "unlock %s by %s: %s", path.c_str(), agent.c_str(), to_string(outcome));
    return outcome;
}

std::vector<FileLock> Store::list_locks(bool active_only, const std::string& agent) {
    sqlite::Transaction tx(*db_, false);
    sqlite::Statement st(*db_, select_from(LOCK_COLUMNS,
        "FROM file_locks WHERE (?1 = 0 OR expires_at > ?2) AND (?3 = '' OR agent = ?3)\n"
        "ORDER BY path ASC;").c_str());
    st.bind_int64(1, active_only ? 1 : 0);
    st.bind_int64(2, config_.clock());
    st.bind_text(3, agent);

    std::vector<FileLock> locks;
    while (st.step()) {
        locks.push_back(read_lock(st));
    }
    tx.commit();
    return locks;
}

// ═══════════════════════════════════════════════════════════════════
// Shared memory
// ═══════════════════════════════════════════════════════════════════

Memory Store::remember(const std::string& content, const std::vector<std::string>& tags) {
    require(content, "content");

    std::vector<std::string> kept;
    for (const auto& tag : tags) {
        if (!tag.empty()) kept.push_back(tag);
    }

    sqlite::Transaction tx(*db_);

    // Same content again refreshes the tags of the existing memory
    {
        sqlite::Statement upsert(*db_,
            "INSERT INTO memory (content, tags, created_at) VALUES (?1, ?2, ?3)\n"
            "ON CONFLICT(content) DO UPDATE SET tags = excluded.tags;");
        upsert.bind_text(1, content);
        upsert.bind_text(2, json(kept).dump());
        upsert.bind_int64(3, config_.clock());
        upsert.step();
    }

    std::optional<Memory> stored;
    {
        sqlite::Statement st(*db_, select_from(MEMORY_COLUMNS, "FROM memory WHERE content = ?1;").c_str());
        st.bind_text(1, content);
        if (st.step()) stored = read_memory(st);
    }
    if (!stored) {
        throw Error(ErrorKind::Storage, "Memory vanished after upsert");
    }

    tx.commit();
    log_debug("store", "remembered %lld (%zu tags)", static_cast<long long>(stored->id),
              stored->tags.size());
    return *stored;
}

std::vector<Memory> Store::recall(const std::string& query, int limit) {
    if (limit == 0) limit = config_.default_recall_limit;
    if (limit <= 0) {
        throw invalid_input("limit must be >= 1");
    }

    const std::string needle = to_lower(query);
    std::vector<Memory> results;

    sqlite::Transaction tx(*db_, false);

    if (needle.empty()) {
        sqlite::Statement st(*db_, select_from(MEMORY_COLUMNS,
            "FROM memory ORDER BY created_at DESC, id DESC LIMIT ?1;").c_str());
        st.bind_int64(1, limit);
        while (st.step()) {
            results.push_back(read_memory(st));
        }
    } else {
        // SQL narrows to content hits plus anything tagged; tags are
        // matched one by one below since the column holds JSON text
        sqlite::Statement st(*db_, select_from(MEMORY_COLUMNS,
            "FROM memory WHERE instr(lower(content), ?1) > 0 OR tags <> '[]'\n"
            "ORDER BY created_at DESC, id DESC;").c_str());
        st.bind_text(1, needle);
        while (static_cast<int>(results.size()) < limit && st.step()) {
            Memory m = read_memory(st);
            bool hit = contains_ci(m.content, needle) ||
                       std::any_of(m.tags.begin(), m.tags.end(),
                                   [&](const std::string& tag) { return contains_ci(tag, needle); });
            if (hit) results.push_back(std::move(m));
        }
    }

    tx.commit();
    return results;
}

void Store::forget(int64_t memory_id) {
    sqlite::Transaction tx(*db_);
    sqlite::Statement del(*db_, "DELETE FROM memory WHERE id = ?1;");
    del.bind_int64(1, memory_id);
    del.step();
    if (db_->changes() == 0) {
        throw not_found("Memory " + std::to_string(memory_id) + " not found");
    }
    tx.commit();
    log_debug("store", "forgot %lld", static_cast<long long>(memory_id));
}

} // namespace bridge
