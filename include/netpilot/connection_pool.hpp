#ifndef NETPILOT_CONNECTION_POOL_HPP
#define NETPILOT_CONNECTION_POOL_HPP

#include "netpilot/command_runner.hpp"
#include "netpilot/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace netpilot {

struct ConnectionParams {
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::string credential; // identity file path; never logged
};

// One live command channel to a device. Destroying it closes it.
class RemoteConnection {
public:
    virtual ~RemoteConnection() = default;

    // Runs `command` with `input` on its stdin. Throws ConnectionError on
    // transport failure or timeout.
    virtual CommandOutput execute(const std::string& command, const std::string& input,
                                  std::chrono::seconds timeout) = 0;
    virtual bool is_alive() = 0;
    virtual void close() = 0;
};

class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;
    // Throws ConnectionError when the device cannot be reached.
    virtual std::unique_ptr<RemoteConnection> connect(const ConnectionParams& params) = 0;
};

// Maps a logical device id to live connection parameters.
class ConnectionAllocator {
public:
    virtual ~ConnectionAllocator() = default;
    // Throws ConnectionError for unknown devices.
    virtual ConnectionParams resolve(const std::string& device_id) = 0;
};

struct PoolStats {
    std::size_t active_sessions = 0;
    std::size_t open_connections = 0;
    uint64_t establishments = 0;
    uint64_t retries = 0;
    uint64_t evicted_connections = 0;
    uint64_t expired_sessions = 0;
};

struct PoolOptions {
    std::chrono::seconds connection_idle{300};
    std::chrono::seconds session_idle{1800};
    std::chrono::seconds reaper_interval{30};
};

// Session-scoped connections keyed by (session id, device id). The mutex only
// guards the maps; connecting, running commands and closing happen outside it.
class ConnectionPool {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionPool(ConnectionFactory& factory, ConnectionAllocator& allocator, PilotLogger& logger,
                   PoolOptions options = PoolOptions());
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    void start_session(const std::string& session_id);
    void end_session(const std::string& session_id);
    bool has_session(const std::string& session_id) const;

    // Throws SessionExpiredError, or ConnectionError once the single retry
    // with a fresh connection has also failed.
    CommandOutput execute(const std::string& session_id, const std::string& device_id,
                          const std::string& command, std::chrono::seconds timeout,
                          const std::string& input = std::string());

    // Evicts idle connections and expires idle sessions as of `now`.
    void reap_idle(Clock::time_point now);

    void start_reaper();
    void stop_reaper();
    bool is_reaper_running() const { return running_.load(); }

    PoolStats stats() const;

    // Drops every session and closes every connection.
    void shutdown();

private:
    using Key = std::pair<std::string, std::string>;

    struct Entry {
        std::shared_ptr<RemoteConnection> connection;
        Clock::time_point last_used;
        std::size_t in_flight = 0;
    };

    // Holds one in-flight use of a pooled connection and gives it back on
    // scope exit, whatever the command threw.
    class Lease {
    public:
        Lease(ConnectionPool& pool, Key key, std::shared_ptr<RemoteConnection> connection)
            : pool_(pool), key_(std::move(key)), connection_(std::move(connection)) {}
        ~Lease() { pool_.finish(key_, connection_, broken_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        RemoteConnection& operator*() const { return *connection_; }
        RemoteConnection* operator->() const { return connection_.get(); }
        void mark_broken() { broken_ = true; }

    private:
        ConnectionPool& pool_;
        Key key_;
        std::shared_ptr<RemoteConnection> connection_;
        bool broken_ = false;
    };

    std::shared_ptr<RemoteConnection> acquire(const Key& key);
    std::shared_ptr<RemoteConnection> establish(const Key& key);
    // Ends one in-flight use. A broken connection leaves the pool; it is
    // closed now if nobody else is using it, otherwise by its last user.
    void finish(const Key& key, const std::shared_ptr<RemoteConnection>& connection, bool broken);
    void retire_locked(Entry entry, std::vector<std::shared_ptr<RemoteConnection>>& to_close);
    void require_session(const std::string& session_id);
    void close_all(std::vector<std::shared_ptr<RemoteConnection>>& connections);
    void reaper_loop();

    ConnectionFactory& factory_;
    ConnectionAllocator& allocator_;
    PilotLogger& logger_;
    PoolOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, Clock::time_point> sessions_;
    std::map<Key, Entry> connections_;
    std::vector<Entry> retired_; // out of the pool but still in use
    PoolStats counters_;

    std::thread reaper_thread_;
    std::atomic<bool> running_{false};
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
};

// Binds one (session, device) pair of a pool to the CommandRunner interface.
class PooledCommandRunner : public CommandRunner {
public:
    PooledCommandRunner(ConnectionPool& pool, std::string session_id, std::string device_id,
                        std::chrono::seconds timeout)
        : pool_(pool), session_id_(std::move(session_id)), device_id_(std::move(device_id)), timeout_(timeout) {}

    using CommandRunner::run;
    CommandOutput run(const std::string& command, const std::string& input) override {
        return pool_.execute(session_id_, device_id_, command, timeout_, input);
    }

    const std::string& device_id() const { return device_id_; }

private:
    ConnectionPool& pool_;
    std::string session_id_;
    std::string device_id_;
    std::chrono::seconds timeout_;
};

} // namespace netpilot

#endif // NETPILOT_CONNECTION_POOL_HPP
