#ifndef NETPILOT_SSH_CONNECTION_HPP
#define NETPILOT_SSH_CONNECTION_HPP

#include "netpilot/connection_pool.hpp"
#include "netpilot/logger.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace netpilot {

struct SshOptions {
    std::string ssh_binary = "ssh";
    std::string control_dir = "/tmp";
    std::chrono::seconds connect_timeout{10};
};

// OpenSSH ControlMaster session. One master process per connection; commands
// are multiplexed over its control socket. Exit status 255 and timeouts are
// transport failures.
class SshConnection : public RemoteConnection {
public:
    SshConnection(ConnectionParams params, SshOptions options, PilotLogger& logger);
    ~SshConnection() override;

    SshConnection(const SshConnection&) = delete;
    SshConnection& operator=(const SshConnection&) = delete;

    // Starts the master. Throws ConnectionError.
    void open();

    CommandOutput execute(const std::string& command, const std::string& input,
                          std::chrono::seconds timeout) override;
    bool is_alive() override;
    void close() override;

    const std::string& control_path() const { return control_path_; }

private:
    std::vector<std::string> base_args() const;
    std::string destination() const;

    ConnectionParams params_;
    SshOptions options_;
    PilotLogger& logger_;
    std::string control_path_;
    std::mutex state_mutex_;
    bool open_ = false;
};

class SshConnectionFactory : public ConnectionFactory {
public:
    SshConnectionFactory(SshOptions options, PilotLogger& logger) : options_(std::move(options)), logger_(logger) {}

    std::unique_ptr<RemoteConnection> connect(const ConnectionParams& params) override;

private:
    SshOptions options_;
    PilotLogger& logger_;
};

} // namespace netpilot

#endif // NETPILOT_SSH_CONNECTION_HPP
