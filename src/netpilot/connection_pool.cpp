#include "netpilot/connection_pool.hpp"
#include "netpilot/errors.hpp"

#include <algorithm>

namespace netpilot {

ConnectionPool::ConnectionPool(ConnectionFactory& factory, ConnectionAllocator& allocator, PilotLogger& logger,
                               PoolOptions options)
    : factory_(factory), allocator_(allocator), logger_(logger), options_(options) {}

ConnectionPool::~ConnectionPool() {
    stop_reaper();
    shutdown();
}

void ConnectionPool::start_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool is_new = sessions_.find(session_id) == sessions_.end();
    sessions_[session_id] = Clock::now();
    if (is_new) {
        logger_.debug("ConnectionPool", "Session started: " + session_id);
    }
}

void ConnectionPool::end_session(const std::string& session_id) {
    std::vector<std::shared_ptr<RemoteConnection>> to_close;
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(session_id) == 0) {
            return;
        }
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->first.first == session_id) {
                retire_locked(std::move(it->second), to_close);
                it = connections_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    close_all(to_close);
    logger_.debug("ConnectionPool", "Session ended: " + session_id + ", released " +
                  std::to_string(removed) + " connections");
}

bool ConnectionPool::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.find(session_id) != sessions_.end();
}

void ConnectionPool::require_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw SessionExpiredError(session_id);
    }
    it->second = Clock::now();
}

CommandOutput ConnectionPool::execute(const std::string& session_id, const std::string& device_id,
                                      const std::string& command, std::chrono::seconds timeout,
                                      const std::string& input) {
    require_session(session_id);
    const Key key{session_id, device_id};

    {
        Lease lease(*this, key, acquire(key));
        try {
            return lease->execute(command, input, timeout);
        } catch (const ConnectionError& e) {
            logger_.warning("ConnectionPool", "Execution failed on " + device_id +
                            ", retrying with a fresh connection: " + e.what());
            lease.mark_broken();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.retries++;
    }
    require_session(session_id);
    Lease lease(*this, key, establish(key));
    try {
        return lease->execute(command, input, timeout);
    } catch (const ConnectionError& e) {
        logger_.error("ConnectionPool", "Retry failed on " + device_id + ": " + e.what());
        lease.mark_broken();
        throw;
    }
}

std::shared_ptr<RemoteConnection> ConnectionPool::acquire(const Key& key) {
    std::shared_ptr<RemoteConnection> existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(key);
        if (it != connections_.end()) {
            existing = it->second.connection;
            it->second.in_flight++;
            it->second.last_used = Clock::now();
        }
    }

    if (existing) {
        if (existing->is_alive()) {
            return existing;
        }
        logger_.debug("ConnectionPool", "Stale connection to " + key.second + " dropped");
        finish(key, existing, true);
    }
    return establish(key);
}

std::shared_ptr<RemoteConnection> ConnectionPool::establish(const Key& key) {
    // Establishment failures propagate without a retry.
    ConnectionParams params = allocator_.resolve(key.second);
    std::shared_ptr<RemoteConnection> fresh(factory_.connect(params));
    if (!fresh) {
        throw ConnectionError("Connection factory returned no connection for device " + key.second);
    }

    std::shared_ptr<RemoteConnection> raced;
    bool session_gone = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.establishments++;
        if (sessions_.find(key.first) == sessions_.end()) {
            session_gone = true;
        } else {
            auto it = connections_.find(key);
            if (it != connections_.end()) {
                // Another caller connected first; share theirs.
                raced = it->second.connection;
                it->second.in_flight++;
                it->second.last_used = Clock::now();
            } else {
                Entry entry;
                entry.connection = fresh;
                entry.last_used = Clock::now();
                entry.in_flight = 1;
                connections_.emplace(key, std::move(entry));
            }
        }
    }

    if (session_gone) {
        fresh->close();
        throw SessionExpiredError(key.first);
    }
    if (raced) {
        fresh->close();
        return raced;
    }
    logger_.info("ConnectionPool", "Connected to " + key.second + " (" + params.username + "@" + params.host + ":" +
                 std::to_string(params.port) + ") for session " + key.first);
    return fresh;
}

void ConnectionPool::finish(const Key& key, const std::shared_ptr<RemoteConnection>& connection, bool broken) {
    std::vector<std::shared_ptr<RemoteConnection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(key);
        if (it != connections_.end() && it->second.connection == connection) {
            if (it->second.in_flight > 0) it->second.in_flight--;
            it->second.last_used = Clock::now();
            if (broken) {
                retire_locked(std::move(it->second), to_close);
                connections_.erase(it);
            }
        } else {
            // Already out of the pool; the last user closes it.
            auto retired = std::find_if(retired_.begin(), retired_.end(),
                                        [&](const Entry& e) { return e.connection == connection; });
            if (retired != retired_.end()) {
                if (retired->in_flight > 0) retired->in_flight--;
                if (retired->in_flight == 0) {
                    to_close.push_back(retired->connection);
                    retired_.erase(retired);
                }
            }
        }
    }
    close_all(to_close);
}

void ConnectionPool::retire_locked(Entry entry, std::vector<std::shared_ptr<RemoteConnection>>& to_close) {
    if (entry.in_flight == 0) {
        to_close.push_back(std::move(entry.connection));
    } else {
        retired_.push_back(std::move(entry));
    }
}

void ConnectionPool::close_all(std::vector<std::shared_ptr<RemoteConnection>>& connections) {
    for (auto& connection : connections) {
        connection->close();
    }
}

void ConnectionPool::reap_idle(Clock::time_point now) {
    std::vector<std::shared_ptr<RemoteConnection>> to_close;
    std::size_t expired = 0;
    std::size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second > options_.session_idle) {
                const std::string& session_id = it->first;
                for (auto conn_it = connections_.begin(); conn_it != connections_.end();) {
                    if (conn_it->first.first == session_id) {
                        retire_locked(std::move(conn_it->second), to_close);
                        conn_it = connections_.erase(conn_it);
                        evicted++;
                    } else {
                        ++conn_it;
                    }
                }
                it = sessions_.erase(it);
                expired++;
            } else {
                ++it;
            }
        }

        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second.in_flight == 0 && now - it->second.last_used > options_.connection_idle) {
                to_close.push_back(it->second.connection);
                it = connections_.erase(it);
                evicted++;
            } else {
                ++it;
            }
        }

        counters_.expired_sessions += expired;
        counters_.evicted_connections += evicted;
    }

    close_all(to_close);
    if (expired > 0 || evicted > 0) {
        logger_.info("ConnectionPool", "Reaper expired " + std::to_string(expired) + " sessions and released " +
                     std::to_string(evicted) + " idle connections");
    }
}

void ConnectionPool::start_reaper() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    reaper_thread_ = std::thread(&ConnectionPool::reaper_loop, this);
    logger_.debug("ConnectionPool", "Reaper started, interval " + std::to_string(options_.reaper_interval.count()) + "s");
}

void ConnectionPool::stop_reaper() {
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false)) {
        {
            std::lock_guard<std::mutex> lock(reaper_mutex_);
        }
        reaper_cv_.notify_all();
        if (reaper_thread_.joinable()) {
            reaper_thread_.join();
        }
    }
}

void ConnectionPool::reaper_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (running_.load()) {
        reaper_cv_.wait_for(lock, options_.reaper_interval, [this] { return !running_.load(); });
        if (!running_.load()) {
            break;
        }
        lock.unlock();
        try {
            reap_idle(Clock::now());
        } catch (const std::exception& e) {
            logger_.error("ConnectionPool", std::string("Reaper pass failed: ") + e.what());
        }
        lock.lock();
    }
}

PoolStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats snapshot = counters_;
    snapshot.active_sessions = sessions_.size();
    snapshot.open_connections = connections_.size();
    return snapshot;
}

void ConnectionPool::shutdown() {
    std::vector<std::shared_ptr<RemoteConnection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pair : connections_) {
            to_close.push_back(pair.second.connection);
        }
        for (auto& entry : retired_) {
            to_close.push_back(entry.connection);
        }
        connections_.clear();
        retired_.clear();
        sessions_.clear();
    }
    close_all(to_close);
    if (!to_close.empty()) {
        logger_.info("ConnectionPool", "Shutdown closed " + std::to_string(to_close.size()) + " connections");
    }
}

} // namespace netpilot
