#include <gtest/gtest.h>
#include <managers/session_registry.hpp>
#include <core/errors.hpp>
#include "fake_process_control.hpp"

namespace {

const char* LINK = "https://x.example.com:8888/?token=abc123";
const char* LINK_B = "http://localhost:9999/lab?token=other";

class SessionRegistryTest : public ::testing::Test {
protected:
    FakeProcessControl proc;
    std::vector<std::string> messages;
    SessionRegistry registry{proc, [this](const std::string& m) { messages.push_back(m); }};

    ErrorKind error_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const SessionError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected SessionError";
        return ErrorKind::IOError;
    }
};

} // namespace

// ── create ──────────────────────────────────────────────────

TEST_F(SessionRegistryTest, CreateRegistersUnderDerivedKey) {
    registry.create(LINK, "myhost");

    const Tunnel* t = registry.find("myhost:8888");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->token, "abc123");
    EXPECT_EQ(t->port, 8888);
    EXPECT_TRUE(t->pid.has_value());
    EXPECT_EQ(messages.back(), "Created new session myhost:8888.");
}

TEST_F(SessionRegistryTest, CreateDuplicateKeyLeavesRegistryUnchanged) {
    registry.create(LINK, "myhost");
    Tunnel before = *registry.find("myhost:8888");

    // Different link, same host and port
    EXPECT_EQ(error_of([&] {
        registry.create("http://other:8888/?token=zzz", "myhost");
    }), ErrorKind::DuplicateKey);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(*registry.find("myhost:8888"), before);
    EXPECT_EQ(proc.spawned.size(), 1u);
}

TEST_F(SessionRegistryTest, DuplicateKeyMessageSuggestsReconnect) {
    registry.create(LINK, "myhost");
    try {
        registry.create(LINK, "myhost");
        FAIL();
    } catch (const SessionError& e) {
        EXPECT_NE(std::string(e.what()).find("rjy rc"), std::string::npos);
    }
}

TEST_F(SessionRegistryTest, CreateInvalidLink) {
    EXPECT_EQ(error_of([&] { registry.create("https://x.example.com/?token=a", "h"); }),
              ErrorKind::InvalidLink);
    EXPECT_TRUE(registry.empty());
}

TEST_F(SessionRegistryTest, CreateSpawnFailureInsertsNothing) {
    proc.fail_spawn = true;
    EXPECT_EQ(error_of([&] { registry.create(LINK, "myhost"); }), ErrorKind::SpawnError);
    EXPECT_TRUE(registry.empty());
}

TEST_F(SessionRegistryTest, SamePortDifferentHostsCoexist) {
    registry.create(LINK, "a");
    registry.create(LINK, "b");
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("a:8888"));
    EXPECT_TRUE(registry.contains("b:8888"));
}

// ── list ────────────────────────────────────────────────────

TEST_F(SessionRegistryTest, ListEmpty) {
    EXPECT_TRUE(registry.list().empty());
}

TEST_F(SessionRegistryTest, ListHidesStalePids) {
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    proc.kill(*registry.find("b:9999")->pid);

    auto rows = registry.list();
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].key, "a:8888");
    EXPECT_EQ(rows[0].status, SessionStatus::Connected);
    EXPECT_EQ(rows[0].pid, registry.find("a:8888")->pid);
    EXPECT_EQ(rows[0].link, LINK);

    EXPECT_EQ(rows[1].key, "b:9999");
    EXPECT_EQ(rows[1].status, SessionStatus::Disconnected);
    EXPECT_FALSE(rows[1].pid.has_value());

    // Listing does not clear the stale pid
    EXPECT_TRUE(registry.find("b:9999")->pid.has_value());
}

// ── reconnect ───────────────────────────────────────────────

TEST_F(SessionRegistryTest, ReconnectAliveIsNoop) {
    registry.create(LINK, "myhost");
    Tunnel before = *registry.find("myhost:8888");

    registry.reconnect("myhost:8888");
    EXPECT_EQ(*registry.find("myhost:8888"), before);
    EXPECT_EQ(proc.spawned.size(), 1u);
}

TEST_F(SessionRegistryTest, ReconnectDeadSpawnsNewProcess) {
    registry.create(LINK, "myhost");
    uint32_t old_pid = *registry.find("myhost:8888")->pid;
    proc.kill(old_pid);

    registry.reconnect("myhost:8888");
    const Tunnel* t = registry.find("myhost:8888");
    ASSERT_NE(t, nullptr);
    ASSERT_TRUE(t->pid.has_value());
    EXPECT_NE(*t->pid, old_pid);
    EXPECT_EQ(t->link, LINK);
    EXPECT_EQ(t->status(proc), SessionStatus::Connected);
    EXPECT_EQ(proc.spawned.size(), 2u);
    EXPECT_EQ(messages.back(), "Reconnected session myhost:8888.");
}

TEST_F(SessionRegistryTest, ReconnectAfterDisconnect) {
    registry.create(LINK, "myhost");
    registry.disconnect("myhost:8888");
    registry.reconnect("myhost:8888");
    EXPECT_EQ(registry.find("myhost:8888")->status(proc), SessionStatus::Connected);
}

TEST_F(SessionRegistryTest, ReconnectMissingKey) {
    EXPECT_EQ(error_of([&] { registry.reconnect("nope:1"); }), ErrorKind::KeyNotFound);
}

TEST_F(SessionRegistryTest, ReconnectSpawnFailureKeepsEntry) {
    registry.create(LINK, "myhost");
    proc.kill(*registry.find("myhost:8888")->pid);
    proc.fail_spawn = true;

    EXPECT_EQ(error_of([&] { registry.reconnect("myhost:8888"); }), ErrorKind::SpawnError);
    EXPECT_TRUE(registry.contains("myhost:8888"));
}

TEST_F(SessionRegistryTest, ReconnectAllRestartsOnlyDead) {
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    proc.kill(*registry.find("a:8888")->pid);

    registry.reconnect_all();
    EXPECT_EQ(proc.spawned.size(), 3u);
    EXPECT_EQ(registry.find("a:8888")->status(proc), SessionStatus::Connected);
    EXPECT_EQ(registry.find("b:9999")->status(proc), SessionStatus::Connected);
}

// ── disconnect ──────────────────────────────────────────────

TEST_F(SessionRegistryTest, DisconnectKeepsEntryWithoutPid) {
    registry.create(LINK, "myhost");
    registry.disconnect("myhost:8888");

    const Tunnel* t = registry.find("myhost:8888");
    ASSERT_NE(t, nullptr);
    EXPECT_FALSE(t->pid.has_value());
    EXPECT_EQ(t->status(proc), SessionStatus::Disconnected);
    EXPECT_EQ(proc.signaled.size(), 1u);
}

TEST_F(SessionRegistryTest, DisconnectMissingKey) {
    EXPECT_EQ(error_of([&] { registry.disconnect("myhost:8888"); }), ErrorKind::KeyNotFound);
}

TEST_F(SessionRegistryTest, DisconnectAll) {
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    registry.disconnect_all();

    EXPECT_EQ(registry.size(), 2u);
    for (const auto& [key, t] : registry.tunnels()) {
        EXPECT_FALSE(t.pid.has_value()) << key;
    }
    EXPECT_EQ(proc.signaled.size(), 2u);
}

TEST_F(SessionRegistryTest, DisconnectAllStopsAtFirstFailure) {
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    uint32_t b_pid = *registry.find("b:9999")->pid;
    proc.fail_signal.insert(*registry.find("a:8888")->pid);

    EXPECT_EQ(error_of([&] { registry.disconnect_all(); }), ErrorKind::SignalError);
    EXPECT_EQ(registry.find("b:9999")->pid, b_pid);
    EXPECT_EQ(proc.signaled.size(), 1u);
}

// ── drop ────────────────────────────────────────────────────

TEST_F(SessionRegistryTest, DropRemovesAndTerminates) {
    registry.create(LINK, "myhost");
    uint32_t pid = *registry.find("myhost:8888")->pid;

    registry.drop("myhost:8888");
    EXPECT_FALSE(registry.contains("myhost:8888"));
    EXPECT_FALSE(proc.is_alive(pid));

    EXPECT_EQ(error_of([&] { registry.drop("myhost:8888"); }), ErrorKind::KeyNotFound);
}

TEST_F(SessionRegistryTest, DropDisconnectedEntry) {
    registry.create(LINK, "myhost");
    registry.disconnect("myhost:8888");
    registry.drop("myhost:8888");
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(proc.signaled.size(), 1u);
}

TEST_F(SessionRegistryTest, DropAll) {
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    registry.drop_all();
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(proc.alive.empty());
}

TEST_F(SessionRegistryTest, DropAllStopsAtFirstFailure) {
    // Keys iterate in order, so "a:8888" is attempted first
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    uint32_t a_pid = *registry.find("a:8888")->pid;
    proc.fail_signal.insert(a_pid);

    try {
        registry.drop_all();
        FAIL() << "expected SignalError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SignalError);
    }

    EXPECT_FALSE(registry.contains("a:8888"));
    EXPECT_TRUE(registry.contains("b:9999"));
    ASSERT_EQ(proc.signaled.size(), 1u);
    EXPECT_EQ(proc.signaled[0], a_pid);
}

TEST_F(SessionRegistryTest, DropRequestRejectsKeyAndAll) {
    registry.create(LINK, "myhost");
    EXPECT_EQ(error_of([&] { registry.drop_request(std::string("myhost:8888"), true); }),
              ErrorKind::AmbiguousArguments);
    EXPECT_TRUE(registry.contains("myhost:8888"));
    EXPECT_TRUE(proc.signaled.empty());
}

TEST_F(SessionRegistryTest, DropRequestRequiresKeyOrAll) {
    EXPECT_EQ(error_of([&] { registry.drop_request(std::nullopt, false); }),
              ErrorKind::AmbiguousArguments);
}

TEST_F(SessionRegistryTest, DropRequestDispatches) {
    registry.create(LINK, "a");
    registry.create(LINK_B, "b");
    registry.drop_request(std::string("a:8888"), false);
    EXPECT_EQ(registry.size(), 1u);
    registry.drop_request(std::nullopt, true);
    EXPECT_TRUE(registry.empty());
}

// ── insert_loaded ───────────────────────────────────────────

TEST_F(SessionRegistryTest, InsertLoadedRejectsMismatchedKey) {
    Tunnel t;
    t.host = "myhost";
    t.port = 8888;
    EXPECT_EQ(error_of([&] { registry.insert_loaded("otherhost:8888", t); }),
              ErrorKind::CorruptState);
    registry.insert_loaded("myhost:8888", t);
    EXPECT_TRUE(registry.contains("myhost:8888"));
}
