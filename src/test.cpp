#undef NDEBUG
#include <bridge/cli.hpp>
#include <bridge/config.hpp>
#include <bridge/error.hpp>
#include <bridge/rpc/handler.hpp>
#include <bridge/rpc/server.hpp>
#include <bridge/store.hpp>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace bridge;
using json = nlohmann::json;

// 2023-11-14T22:13:20Z
constexpr Timestamp T0 = 1700000000000;

struct Clock {
    std::shared_ptr<Timestamp> t = std::make_shared<Timestamp>(T0);

    void advance_seconds(int64_t s) { *t += s * 1000; }

    std::function<Timestamp()> fn() const {
        auto shared = t;
        return [shared]() { return *shared; };
    }
};

StoreConfig memory_config(const Clock& clock) {
    StoreConfig config;
    config.path = ":memory:";
    config.clock = clock.fn();
    return config;
}

std::string temp_db(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() /
                ("bridge_test_" + std::to_string(getpid()) + "_" + name + ".db");
    return path.string();
}

void remove_db(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path + "-wal", ec);
    std::filesystem::remove(path + "-shm", ec);
}

template <typename F>
ErrorKind expect_error(F&& f) {
    try {
        f();
    } catch (const Error& e) {
        return e.kind();
    }
    assert(false && "expected bridge::Error");
    return ErrorKind::Storage;
}

// ═══════════════════════════════════════════════════════════════════
// Agent registry
// ═══════════════════════════════════════════════════════════════════

void test_register_idempotent() {
    std::cout << "Testing register idempotent..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    Agent first = store.register_agent("worker", {"claude-code", "opus", std::nullopt, std::nullopt});
    clock.advance_seconds(5);
    Agent second = store.register_agent("worker");

    auto agents = store.list_agents();
    assert(agents.size() == 1);
    assert(agents[0].name == "worker");
    assert(second.registered_at == first.registered_at);
    assert(second.last_seen == T0 + 5000);
    assert(second.status == "active");

    std::cout << "  PASS" << std::endl;
}

void test_register_keeps_unsupplied_fields() {
    std::cout << "Testing register keeps unsupplied fields..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    AgentInfo info;
    info.program = "opencode";
    info.model = "sonnet";
    info.task = "auth refactor";
    store.register_agent("worker", info);

    AgentInfo update;
    update.model = "opus";
    Agent a = store.register_agent("worker", update);
    assert(a.program == "opencode");
    assert(a.model == "opus");
    assert(a.task == "auth refactor");

    Agent bare = store.register_agent("newcomer");
    assert(bare.program == "unknown");
    assert(bare.model == "unknown");
    assert(bare.task.empty());

    assert(expect_error([&] { store.register_agent(""); }) == ErrorKind::InvalidInput);

    std::cout << "  PASS" << std::endl;
}

void test_list_agents_order() {
    std::cout << "Testing list_agents order..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    store.register_agent("alpha");
    clock.advance_seconds(1);
    store.register_agent("beta");
    clock.advance_seconds(1);
    store.register_agent("gamma");

    auto agents = store.list_agents();
    assert(agents.size() == 3);
    assert(agents[0].name == "gamma");
    assert(agents[2].name == "alpha");

    // Any call by alpha makes it the most recent
    clock.advance_seconds(1);
    store.inbox("alpha");
    agents = store.list_agents();
    assert(agents[0].name == "alpha");
    assert(agents[0].last_seen == T0 + 3000);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Messaging
// ═══════════════════════════════════════════════════════════════════

void test_send_inbox_mark_read() {
    std::cout << "Testing send/inbox/mark_read..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    store.register_agent("a");
    store.register_agent("b");

    Message sent = store.send("a", "b", "[TASK] build x", "details");
    assert(sent.id > 0);

    auto inbox = store.inbox("b");
    assert(inbox.size() == 1);
    assert(inbox[0].subject == "[TASK] build x");
    assert(inbox[0].body == "details");
    assert(!inbox[0].read());
    assert(!inbox[0].acknowledged());

    Message read = store.mark_read(inbox[0].id);
    assert(read.read());
    assert(store.inbox("b", true).empty());
    assert(store.inbox("b").size() == 1);

    // Second mark is a no-op and keeps the first timestamp
    clock.advance_seconds(10);
    Message again = store.mark_read(inbox[0].id);
    assert(again.read_at == read.read_at);

    std::cout << "  PASS" << std::endl;
}

void test_inbox_recipient_fifo() {
    std::cout << "Testing inbox filters by recipient, FIFO..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    store.register_agent("a");
    store.register_agent("b");
    store.register_agent("c");

    store.send("a", "b", "[TASK] one");
    store.send("a", "c", "[TASK] not for b");
    store.send("c", "b", "[QUESTION] two");
    store.send("a", "b", "[DONE] three", "", "thread-7");

    auto inbox = store.inbox("b");
    assert(inbox.size() == 3);
    assert(inbox[0].subject == "[TASK] one");
    assert(inbox[1].subject == "[QUESTION] two");
    assert(inbox[2].subject == "[DONE] three");
    assert(inbox[2].thread_id == "thread-7");
    for (const auto& m : inbox) assert(m.recipient == "b");

    auto limited = store.inbox("b", false, 2);
    assert(limited.size() == 2);
    assert(limited[0].subject == "[TASK] one");

    assert(store.inbox("nobody").empty());
    assert(expect_error([&] { store.inbox("b", false, -1); }) == ErrorKind::InvalidInput);

    std::cout << "  PASS" << std::endl;
}

void test_send_recipient_validation() {
    std::cout << "Testing send recipient validation..." << std::endl;

    Clock clock;
    Store strict(memory_config(clock));
    strict.register_agent("a");
    assert(expect_error([&] { strict.send("a", "ghost", "[TASK] x"); }) == ErrorKind::NotFound);
    assert(expect_error([&] { strict.send("a", "", "[TASK] x"); }) == ErrorKind::InvalidInput);
    assert(expect_error([&] { strict.send("a", "a", ""); }) == ErrorKind::InvalidInput);
    assert(strict.inbox("ghost").empty());

    StoreConfig config = memory_config(clock);
    config.strict_recipients = false;
    Store lenient(config);
    Message m = lenient.send("a", "ghost", "[TASK] x");
    assert(lenient.inbox("ghost").size() == 1);
    assert(lenient.inbox("ghost")[0].id == m.id);

    std::cout << "  PASS" << std::endl;
}

void test_read_and_ack_independent() {
    std::cout << "Testing read and ack are independent..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    store.register_agent("a");
    store.register_agent("b");

    Message m1 = store.send("a", "b", "[HANDOFF] one");
    Message m2 = store.send("a", "b", "[HANDOFF] two");

    Message acked = store.ack(m1.id, "b");
    assert(acked.acknowledged());
    assert(!acked.read());

    Message read = store.mark_read(m2.id);
    assert(read.read());
    assert(!read.acknowledged());

    auto unread = store.inbox("b", true);
    assert(unread.size() == 1);
    assert(unread[0].id == m1.id);

    assert(expect_error([&] { store.mark_read(9999); }) == ErrorKind::NotFound);
    assert(expect_error([&] { store.ack(9999); }) == ErrorKind::NotFound);
    assert(expect_error([&] { store.ack(m1.id, "a"); }) == ErrorKind::Forbidden);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// File locks
// ═══════════════════════════════════════════════════════════════════

void test_lock_conflict_then_expiry() {
    std::cout << "Testing lock conflict then expiry..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    store.register_agent("worker");
    store.register_agent("coordinator");

    LockResult r = store.lock("src/auth.ts", "worker", 60);
    assert(r.outcome == LockOutcome::Acquired);
    assert(r.lock.expires_at == T0 + 60000);

    clock.advance_seconds(30);
    try {
        store.lock("src/auth.ts", "coordinator", 60);
        assert(false && "expected conflict");
    } catch (const LockConflict& e) {
        assert(e.kind() == ErrorKind::Conflict);
        assert(e.holder() == "worker");
        assert(e.remaining_seconds() == 30);
    }
    assert(expect_error([&] { store.unlock("src/auth.ts", "coordinator"); }) == ErrorKind::Forbidden);

    clock.advance_seconds(31);
    LockResult taken = store.lock("src/auth.ts", "coordinator", 60);
    assert(taken.outcome == LockOutcome::Acquired);
    assert(taken.lock.agent == "coordinator");

    auto locks = store.list_locks();
    assert(locks.size() == 1);
    assert(locks[0].agent == "coordinator");

    std::cout << "  PASS" << std::endl;
}

void test_lock_renewal() {
    std::cout << "Testing lock renewal..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    LockResult first = store.lock("README.md", "worker", 60, "docs pass");
    clock.advance_seconds(50);
    LockResult renewed = store.lock("README.md", "worker", 120);

    assert(renewed.outcome == LockOutcome::Renewed);
    assert(renewed.lock.acquired_at == first.lock.acquired_at);
    assert(renewed.lock.expires_at == T0 + 50000 + 120000);
    assert(renewed.lock.reason == "docs pass");

    // Default TTL when none is given
    LockResult dflt = store.lock("Makefile", "worker");
    assert(dflt.lock.expires_at - dflt.lock.acquired_at ==
           store.config().default_lock_ttl_seconds * 1000);

    assert(expect_error([&] { store.lock("x", "worker", -5); }) == ErrorKind::InvalidInput);
    assert(expect_error([&] { store.lock("", "worker", 5); }) == ErrorKind::InvalidInput);

    std::cout << "  PASS" << std::endl;
}

void test_unlock_outcomes() {
    std::cout << "Testing unlock outcomes..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    assert(store.unlock("never/locked.c", "worker") == UnlockOutcome::NotLocked);

    store.lock("main.c", "worker", 60);
    assert(store.unlock("main.c", "worker") == UnlockOutcome::Released);
    assert(store.list_locks(false).empty());

    // An expired lock is nobody's; clearing it is not an error
    store.lock("util.c", "worker", 10);
    clock.advance_seconds(11);
    assert(store.unlock("util.c", "coordinator") == UnlockOutcome::NotLocked);
    assert(store.list_locks(false).empty());

    std::cout << "  PASS" << std::endl;
}

void test_list_locks_lazy_expiry() {
    std::cout << "Testing list_locks lazy expiry..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    store.lock("a.c", "worker", 10);
    store.lock("b.c", "coordinator", 100);
    store.lock("c.c", "worker", 100);

    clock.advance_seconds(20);
    auto active = store.list_locks();
    assert(active.size() == 2);
    assert(active[0].path == "b.c");
    assert(active[1].path == "c.c");

    auto all = store.list_locks(false);
    assert(all.size() == 3);
    assert(!all[0].active_at(store.current_time()));

    auto mine = store.list_locks(true, "worker");
    assert(mine.size() == 1);
    assert(mine[0].path == "c.c");

    std::cout << "  PASS" << std::endl;
}

void test_locks_shared_between_connections() {
    std::cout << "Testing locks shared between connections..." << std::endl;

    std::string path = temp_db("shared");
    remove_db(path);
    {
        Clock clock;
        StoreConfig config;
        config.path = path;
        config.clock = clock.fn();

        Store one(config);
        Store two(config);

        one.lock("src/auth.ts", "worker", 60);
        assert(expect_error([&] { two.lock("src/auth.ts", "coordinator", 60); }) ==
               ErrorKind::Conflict);

        two.register_agent("coordinator");
        assert(one.list_agents().size() == 1);
    }
    remove_db(path);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Shared memory
// ═══════════════════════════════════════════════════════════════════

void test_recall_matching() {
    std::cout << "Testing recall matching..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    Memory m1 = store.remember("Auth tokens live in Redis", {"backend"});
    clock.advance_seconds(1);
    Memory m2 = store.remember("Run the linter before committing");
    clock.advance_seconds(1);
    Memory m3 = store.remember("Deploys go through staging", {"Release-Process"});

    auto hits = store.recall("AUTH");
    assert(hits.size() == 1);
    assert(hits[0].id == m1.id);
    assert(hits[0].tags.size() == 1 && hits[0].tags[0] == "backend");

    // Tag match, case-insensitive
    hits = store.recall("release");
    assert(hits.size() == 1);
    assert(hits[0].id == m3.id);

    // Characters from the stored tag encoding never match
    assert(store.recall("\"").empty());
    assert(store.recall("[").empty());

    // Empty query returns newest first, capped
    auto all = store.recall("", 10);
    assert(all.size() == 3);
    assert(all[0].id == m3.id);
    assert(all[1].id == m2.id);
    assert(all[2].id == m1.id);
    assert(store.recall("", 2).size() == 2);

    assert(store.recall("nothing like this").empty());
    assert(expect_error([&] { store.recall("x", -1); }) == ErrorKind::InvalidInput);
    assert(expect_error([&] { store.remember(""); }) == ErrorKind::InvalidInput);

    std::cout << "  PASS" << std::endl;
}

void test_remember_forget_roundtrip() {
    std::cout << "Testing remember/forget..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    Memory m = store.remember("The build cache lives in /tmp/cache");
    auto hits = store.recall("The build cache lives in /tmp/cache");
    assert(hits.size() == 1);
    assert(hits[0].content == m.content);

    store.forget(m.id);
    for (const auto& r : store.recall("", 100)) assert(r.id != m.id);
    assert(store.recall("build cache").empty());

    assert(expect_error([&] { store.forget(m.id); }) == ErrorKind::NotFound);

    std::cout << "  PASS" << std::endl;
}

void test_remember_same_content() {
    std::cout << "Testing remember same content..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));

    Memory first = store.remember("Use pnpm, not npm", {"tooling"});
    clock.advance_seconds(30);
    Memory again = store.remember("Use pnpm, not npm", {"js", "build"});

    assert(again.id == first.id);
    assert(again.created_at == T0);
    assert((again.tags == std::vector<std::string>{"js", "build"}));

    auto hits = store.recall("pnpm", 10);
    assert(hits.size() == 1);
    assert((hits[0].tags == std::vector<std::string>{"js", "build"}));
    assert(store.recall("tooling").empty());

    // Case differs, so it is a different memory
    Memory other = store.remember("use PNPM, not npm");
    assert(other.id != first.id);
    assert(store.recall("pnpm", 10).size() == 2);

    store.forget(first.id);
    hits = store.recall("pnpm", 10);
    assert(hits.size() == 1);
    assert(hits[0].id == other.id);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Schema and configuration
// ═══════════════════════════════════════════════════════════════════

void test_schema_reopen() {
    std::cout << "Testing schema reopen..." << std::endl;

    std::string path = temp_db("reopen");
    remove_db(path);

    StoreConfig config;
    config.path = path;
    {
        Store store(config);
        store.register_agent("worker");
        store.remember("persisted");
    }
    {
        Store store(config);
        assert(store.list_agents().size() == 1);
        assert(store.recall("persisted").size() == 1);
    }
    {
        sqlite::Database db(path, 1000);
        db.set_user_version(BRIDGE_SCHEMA_VERSION + 1);
    }
    assert(expect_error([&] { Store store(config); }) == ErrorKind::Storage);

    remove_db(path);
    std::cout << "  PASS" << std::endl;
}

void test_schema_upgrade_collapses_duplicates() {
    std::cout << "Testing schema upgrade collapses duplicate memories..." << std::endl;

    std::string path = temp_db("upgrade");
    remove_db(path);

    StoreConfig config;
    config.path = path;
    int64_t kept_id = 0;
    {
        Store store(config);
        kept_id = store.remember("dup", {"old"}).id;
    }
    {
        // Rewind to a v1 file that holds the same content twice
        sqlite::Database db(path, 1000);
        db.exec("DROP INDEX idx_memory_content;");
        db.exec("INSERT INTO memory (content, tags, created_at) VALUES ('dup', '[\"new\"]', 1);");
        db.set_user_version(1);
    }
    {
        Store store(config);
        auto hits = store.recall("dup", 10);
        assert(hits.size() == 1);
        assert(hits[0].id == kept_id);
        assert((hits[0].tags == std::vector<std::string>{"new"}));
        assert(store.remember("dup").id == kept_id);
    }
    {
        sqlite::Database db(path, 1000);
        assert(db.user_version() == BRIDGE_SCHEMA_VERSION);
    }

    remove_db(path);
    std::cout << "  PASS" << std::endl;
}

void test_config_from_env() {
    std::cout << "Testing config from env..." << std::endl;

    setenv("BRIDGE_DB_PATH", "/tmp/bridge-env-test.db", 1);
    setenv("BRIDGE_LOCK_TTL", "90", 1);
    setenv("BRIDGE_STRICT_RECIPIENTS", "false", 1);

    StoreConfig config = StoreConfig::from_env();
    assert(config.path == "/tmp/bridge-env-test.db");
    assert(config.default_lock_ttl_seconds == 90);
    assert(!config.strict_recipients);

    setenv("BRIDGE_LOCK_TTL", "soon", 1);
    assert(StoreConfig::from_env().default_lock_ttl_seconds == 1800);

    // Past the lock cap the default stays, so default-TTL locks still work
    setenv("BRIDGE_LOCK_TTL", "999999999999", 1);
    StoreConfig capped = StoreConfig::from_env();
    assert(capped.default_lock_ttl_seconds == 1800);
    capped.path = ":memory:";
    Store store(capped);
    assert(store.lock("a.c", "worker").outcome == LockOutcome::Acquired);

    setenv("BRIDGE_LOCK_TTL", std::to_string(MAX_LOCK_TTL_SECONDS).c_str(), 1);
    assert(StoreConfig::from_env().default_lock_ttl_seconds == MAX_LOCK_TTL_SECONDS);

    unsetenv("BRIDGE_DB_PATH");
    unsetenv("BRIDGE_LOCK_TTL");
    unsetenv("BRIDGE_STRICT_RECIPIENTS");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Tool surface
// ═══════════════════════════════════════════════════════════════════

json rpc_call(rpc::Handler& handler, int id, const std::string& method, const json& params) {
    json req = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return json::parse(handler.handle(req.dump()));
}

json tool_call(rpc::Handler& handler, const std::string& name, const json& arguments) {
    static int next_id = 100;
    return rpc_call(handler, next_id++, "tools/call", {{"name", name}, {"arguments", arguments}});
}

void test_rpc_initialize_and_list() {
    std::cout << "Testing RPC initialize/tools/list..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Handler handler(&store);

    json init = rpc_call(handler, 1, "initialize", json::object());
    assert(init["id"] == 1);
    assert(init["result"]["serverInfo"]["name"] == "agent-bridge");
    assert(init["result"]["protocolVersion"] == BRIDGE_MCP_PROTOCOL_VERSION);

    json list = rpc_call(handler, 2, "tools/list", json::object());
    const json& tools = list["result"]["tools"];
    assert(tools.size() == 12);
    for (const char* name : {"register", "agents", "send", "inbox", "mark_read", "ack",
                             "lock", "unlock", "locks", "remember", "recall", "forget"}) {
        bool found = false;
        for (const auto& t : tools) {
            if (t["name"] == name) {
                found = true;
                assert(t["inputSchema"]["type"] == "object");
            }
        }
        assert(found);
    }

    std::cout << "  PASS" << std::endl;
}

void test_rpc_tool_calls() {
    std::cout << "Testing RPC tool calls..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Handler handler(&store);

    json r = tool_call(handler, "register", {{"name", "worker"}, {"program", "claude-code"}});
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structured"]["agent"]["program"] == "claude-code");
    tool_call(handler, "register", {{"name", "coordinator"}});

    r = tool_call(handler, "send", {{"sender", "coordinator"}, {"recipient", "worker"},
                                    {"subject", "[TASK] build x"}, {"body", "details"}});
    int64_t id = r["result"]["structured"]["id"];

    r = tool_call(handler, "inbox", {{"agent", "worker"}, {"unread_only", true}});
    assert(r["result"]["structured"]["messages"].size() == 1);
    assert(r["result"]["structured"]["messages"][0]["read"] == false);

    r = tool_call(handler, "mark_read", {{"message_id", id}, {"agent", "worker"}});
    assert(r["result"]["structured"]["message"]["read"] == true);

    r = tool_call(handler, "remember", {{"content", "use pnpm"}, {"tags", json::array({"tooling"})}});
    int64_t mem = r["result"]["structured"]["id"];
    r = tool_call(handler, "recall", {{"query", "TOOLING"}});
    assert(r["result"]["structured"]["memories"].size() == 1);
    r = tool_call(handler, "forget", {{"id", mem}});
    assert(r["result"]["isError"] == false);

    r = tool_call(handler, "send", {{"sender", "worker"}, {"recipient", "ghost"},
                                    {"subject", "[QUESTION] hello?"}});
    assert(r["result"]["isError"] == true);
    assert(r["result"]["structured"]["error"]["kind"] == "not_found");

    r = tool_call(handler, "send", {{"sender", "worker"}});
    assert(r["result"]["isError"] == true);
    assert(r["result"]["structured"]["error"]["kind"] == "invalid_input");

    r = tool_call(handler, "mark_read", {{"message_id", "not-a-number"}});
    assert(r["result"]["structured"]["error"]["kind"] == "invalid_input");

    std::cout << "  PASS" << std::endl;
}

void test_rpc_lock_conflict() {
    std::cout << "Testing RPC lock conflict..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Handler handler(&store);

    json r = tool_call(handler, "lock", {{"path", "src/auth.ts"}, {"agent", "worker"},
                                         {"ttl_seconds", 60}, {"reason", "refactor"}});
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structured"]["status"] == "acquired");

    clock.advance_seconds(10);
    r = tool_call(handler, "lock", {{"path", "src/auth.ts"}, {"agent", "coordinator"}});
    assert(r["result"]["isError"] == true);
    const json& err = r["result"]["structured"]["error"];
    assert(err["kind"] == "conflict");
    assert(err["holder"] == "worker");
    assert(err["remaining_seconds"] == 50);

    r = tool_call(handler, "unlock", {{"path", "src/auth.ts"}, {"agent", "coordinator"}});
    assert(r["result"]["structured"]["error"]["kind"] == "forbidden");

    r = tool_call(handler, "locks", json::object());
    assert(r["result"]["structured"]["locks"].size() == 1);
    assert(r["result"]["structured"]["locks"][0]["remaining_seconds"] == 50);

    r = tool_call(handler, "lock", {{"path", "x"}, {"agent", "worker"}, {"ttl_seconds", 0}});
    assert(r["result"]["structured"]["error"]["kind"] == "invalid_input");

    std::cout << "  PASS" << std::endl;
}

void test_rpc_protocol_errors() {
    std::cout << "Testing RPC protocol errors..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Handler handler(&store);

    json r = json::parse(handler.handle("{not json"));
    assert(r["error"]["code"] == rpc::code(rpc::ErrorCode::ParseError));

    r = json::parse(handler.handle(R"({"id":1,"method":"tools/list"})"));
    assert(r["error"]["code"] == rpc::code(rpc::ErrorCode::InvalidRequest));

    r = rpc_call(handler, 3, "resources/list", json::object());
    assert(r["error"]["code"] == rpc::code(rpc::ErrorCode::MethodNotFound));

    r = tool_call(handler, "teleport", json::object());
    assert(r["error"]["code"] == rpc::code(rpc::ErrorCode::UnknownTool));

    assert(handler.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").empty());

    // Without an id the call still runs; only the reply is dropped
    assert(handler.handle(R"({"jsonrpc":"2.0","method":"tools/call",)"
                          R"("params":{"name":"register","arguments":{"name":"quiet"}}})").empty());
    assert(store.find_agent("quiet").has_value());
    assert(handler.handle(R"({"jsonrpc":"2.0","method":"resources/list"})").empty());

    r = rpc_call(handler, 4, "ping", json::object());
    assert(r["result"].is_object());

    std::cout << "  PASS" << std::endl;
}

void test_server_loop() {
    std::cout << "Testing server loop..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Server server(&store);

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"register","arguments":{"name":"w"}}})" "\r\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        json resp = json::parse(line);
        assert(resp["jsonrpc"] == "2.0");
        ++count;
    }
    assert(count == 2);
    assert(store.list_agents().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_server_survives_bad_utf8() {
    std::cout << "Testing server survives invalid UTF-8..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Server server(&store);

    std::string bad = std::string(R"({"jsonrpc":"2.0","id":1,"method":"ping","x":")") +
                      '\xFF' + R"("})" + "\n";
    std::istringstream in(bad + R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> replies;
    while (std::getline(lines, line)) replies.push_back(json::parse(line));

    assert(replies.size() == 2);
    assert(replies[0]["error"]["code"] == rpc::code(rpc::ErrorCode::ParseError));
    assert(replies[0]["id"].is_null());
    assert(replies[1]["id"] == 2);
    assert(replies[1]["result"].is_object());

    // Stored bytes that are not UTF-8 come back replaced, not thrown
    rpc::Handler handler(&store);
    store.remember(std::string("caf\xE9 notes"));
    json r = tool_call(handler, "recall", {{"query", "caf"}});
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structured"]["memories"].size() == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// CLI surface
// ═══════════════════════════════════════════════════════════════════

int run_cli(rpc::Handler& handler, const std::string& command, const std::vector<std::string>& args,
        std::string* out_text = nullptr, bool json_output = false) {
    std::ostringstream out, err;
    int code = cli::run(handler, command, args, out, err, json_output);
    if (out_text) *out_text = out.str();
    return code;
}

void test_cli_arguments() {
    std::cout << "Testing CLI argument mapping..." << std::endl;

    const cli::Command* lock = cli::find_command("lock");
    assert(lock);
    json args = cli::build_arguments(*lock, {"src/a.c", "worker", "60", "--reason", "fix"});
    assert(args["path"] == "src/a.c");
    assert(args["agent"] == "worker");
    assert(args["ttl_seconds"] == "60");
    assert(args["reason"] == "fix");

    const cli::Command* send = cli::find_command("send");
    args = cli::build_arguments(*send, {"a", "b", "--", "-1 is odd"});
    assert(args["subject"] == "-1 is odd");

    const cli::Command* locks = cli::find_command("locks");
    args = cli::build_arguments(*locks, {"--all"});
    assert(args["active_only"] == false);

    const cli::Command* recall = cli::find_command("recall");
    args = cli::build_arguments(*recall, {});
    assert(args["query"] == "");

    assert(expect_error([&] { cli::build_arguments(*lock, {"only-path"}); }) ==
           ErrorKind::InvalidInput);
    assert(expect_error([&] { cli::build_arguments(*locks, {"extra"}); }) ==
           ErrorKind::InvalidInput);
    assert(cli::find_command("teleport") == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_cli_exit_codes() {
    std::cout << "Testing CLI exit codes..." << std::endl;

    Clock clock;
    Store store(memory_config(clock));
    rpc::Handler handler(&store);

    std::string out;
    assert(run_cli(handler, "register", {"worker", "claude-code", "opus"}, &out) == cli::EXIT_OK);
    assert(out.find("Registered worker") != std::string::npos);
    assert(run_cli(handler, "register", {"coordinator"}) == cli::EXIT_OK);

    assert(run_cli(handler, "send", {"coordinator", "worker", "[TASK] build x", "details"}) == cli::EXIT_OK);
    assert(run_cli(handler, "inbox", {"worker", "--unread"}, &out) == cli::EXIT_OK);
    assert(out.find("[TASK] build x") != std::string::npos);

    assert(run_cli(handler, "inbox", {"worker"}, &out, true) == cli::EXIT_OK);
    json parsed = json::parse(out);
    assert(parsed["messages"].size() == 1);

    assert(run_cli(handler, "lock", {"src/auth.ts", "worker", "60"}) == cli::EXIT_OK);
    assert(run_cli(handler, "lock", {"src/auth.ts", "coordinator"}) == cli::EXIT_CONFLICT);
    assert(run_cli(handler, "unlock", {"src/auth.ts", "coordinator"}) == cli::EXIT_FORBIDDEN);
    assert(run_cli(handler, "forget", {"42"}) == cli::EXIT_NOT_FOUND);
    assert(run_cli(handler, "send", {"worker", "ghost", "[DONE] x"}) == cli::EXIT_NOT_FOUND);
    assert(run_cli(handler, "lock", {"src/auth.ts"}) == cli::EXIT_INVALID_INPUT);
    assert(run_cli(handler, "mark_read", {"abc"}) == cli::EXIT_INVALID_INPUT);
    assert(run_cli(handler, "teleport", {}) == cli::EXIT_INVALID_INPUT);

    assert(run_cli(handler, "remember", {"use pnpm", "--tags", "tooling, js"}) == cli::EXIT_OK);
    assert(run_cli(handler, "recall", {"JS"}, &out) == cli::EXIT_OK);
    assert(out.find("use pnpm") != std::string::npos);

    // Latin-1 from argv is stored as given and still prints as JSON
    assert(run_cli(handler, "remember", {"caf\xE9 notes"}, &out, true) == cli::EXIT_OK);
    parsed = json::parse(out);
    assert(parsed["status"] == "stored");
    assert(run_cli(handler, "recall", {"caf"}, &out, true) == cli::EXIT_OK);
    parsed = json::parse(out);
    assert(parsed["memories"].size() == 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Agent Bridge Tests ===" << std::endl;
    std::cout << std::endl;

    test_register_idempotent();
    test_register_keeps_unsupplied_fields();
    test_list_agents_order();

    test_send_inbox_mark_read();
    test_inbox_recipient_fifo();
    test_send_recipient_validation();
    test_read_and_ack_independent();

    test_lock_conflict_then_expiry();
    test_lock_renewal();
    test_unlock_outcomes();
    test_list_locks_lazy_expiry();
    test_locks_shared_between_connections();

    test_recall_matching();
    test_remember_forget_roundtrip();
    test_remember_same_content();

    test_schema_reopen();
    test_schema_upgrade_collapses_duplicates();
    test_config_from_env();

    std::cout << std::endl;
    std::cout << "=== Tool Surface Tests ===" << std::endl;
    test_rpc_initialize_and_list();
    test_rpc_tool_calls();
    test_rpc_lock_conflict();
    test_rpc_protocol_errors();
    test_server_loop();
    test_server_survives_bad_utf8();

    std::cout << std::endl;
    std::cout << "=== CLI Tests ===" << std::endl;
    test_cli_arguments();
    test_cli_exit_codes();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
