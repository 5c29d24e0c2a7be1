#include "netpilot/ssh_connection.hpp"
#include "netpilot/errors.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace netpilot {

namespace {

constexpr int kTransportExitStatus = 255;

struct ProcessResult {
    int exit_status = -1;
    bool timed_out = false;
    std::string output;
    std::string error_output;
};

void drain(int fd, std::string& sink) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
}

void close_pair(int fds[2]) {
    ::close(fds[0]);
    ::close(fds[1]);
}

void set_nonblocking(int fd) {
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
}

// Runs argv with `input` on stdin and both output streams captured. The wait
// ends when the child exits, not at EOF: a backgrounded ssh master keeps the
// pipes open. Throws ConnectionError when the program cannot be started.
ProcessResult run_process(const std::vector<std::string>& args, const std::string& input,
                          std::chrono::milliseconds timeout) {
    // A child that exits before reading its input must not kill us.
    static std::once_flag ignore_sigpipe;
    std::call_once(ignore_sigpipe, [] { ::signal(SIGPIPE, SIG_IGN); });

    int in_pipe[2];
    int out_pipe[2];
    int err_pipe[2];
    int exec_pipe[2]; // carries errno if execvp fails; closed by a successful exec
    int* pipes[] = {in_pipe, out_pipe, err_pipe, exec_pipe};
    // Close-on-exec so children forked by other threads never hold our ends.
    for (size_t i = 0; i < 4; ++i) {
        if (::pipe2(pipes[i], O_CLOEXEC) != 0) {
            int saved = errno;
            for (size_t j = 0; j < i; ++j) close_pair(pipes[j]);
            throw ConnectionError(std::string("pipe failed: ") + std::strerror(saved));
        }
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int* fds : pipes) close_pair(fds);
        throw ConnectionError(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        ::close(exec_pipe[0]);
        ::execvp(argv[0], argv.data());
        int saved = errno;
        ssize_t ignored = ::write(exec_pipe[1], &saved, sizeof(saved));
        (void)ignored;
        const char* reason = std::strerror(saved);
        ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);
    set_nonblocking(in_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    int in_fd = in_pipe[1];
    size_t written = 0;
    if (input.empty()) {
        ::close(in_fd);
        in_fd = -1;
    }

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool exited = false;
    bool wait_failed = false;

    while (!exited) {
        pollfd fds[3] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}, {in_fd, POLLOUT, 0}};
        ::poll(fds, in_fd >= 0 ? 3 : 2, 50);
        drain(out_pipe[0], result.output);
        drain(err_pipe[0], result.error_output);

        if (in_fd >= 0) {
            ssize_t n = ::write(in_fd, input.data() + written, input.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            }
            if (written == input.size() || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
                ::close(in_fd);
                in_fd = -1;
            }
        }

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
        } else if (w < 0 && errno != EINTR) {
            wait_failed = true;
            break;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            result.timed_out = true;
            exited = true;
        }
    }

    if (in_fd >= 0) {
        ::close(in_fd);
    }
    drain(out_pipe[0], result.output);
    drain(err_pipe[0], result.error_output);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    int exec_errno = 0;
    ssize_t got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    ::close(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        throw ConnectionError("Cannot run " + args.front() + ": " + std::strerror(exec_errno));
    }

    if (!result.timed_out && !wait_failed && WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    }
    if (written < input.size() && !result.timed_out && result.exit_status == 0) {
        // Exited cleanly without taking all its input.
        result.error_output += "stdin closed after " + std::to_string(written) + " of " +
                               std::to_string(input.size()) + " bytes";
    }
    return result;
}

std::string unique_control_path(const std::string& dir, const ConnectionParams& params) {
    static std::atomic<uint64_t> counter{0};
    return dir + "/netpilot-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + "-" +
           params.host + "-" + std::to_string(params.port) + ".sock";
}

} // namespace

SshConnection::SshConnection(ConnectionParams params, SshOptions options, PilotLogger& logger)
    : params_(std::move(params)), options_(std::move(options)), logger_(logger),
      control_path_(unique_control_path(options_.control_dir, params_)) {}

SshConnection::~SshConnection() {
    close();
}

std::string SshConnection::destination() const {
    return params_.username.empty() ? params_.host : params_.username + "@" + params_.host;
}

std::vector<std::string> SshConnection::base_args() const {
    return {options_.ssh_binary, "-S", control_path_, "-p", std::to_string(params_.port),
            "-o", "BatchMode=yes"};
}

void SshConnection::open() {
    std::vector<std::string> args = base_args();
    args.insert(args.end(), {
        "-M", "-f", "-N",
        "-o", "ControlPersist=yes",
        "-o", "StrictHostKeyChecking=accept-new",
        "-o", "ServerAliveInterval=15",
        "-o", "ConnectTimeout=" + std::to_string(options_.connect_timeout.count()),
    });
    if (!params_.credential.empty()) {
        args.push_back("-i");
        args.push_back(params_.credential);
    }
    args.push_back(destination());

    ProcessResult result = run_process(args, std::string(), options_.connect_timeout + std::chrono::seconds(5));
    if (result.timed_out) {
        throw ConnectionError("Timed out connecting to " + params_.host + ":" + std::to_string(params_.port));
    }
    if (result.exit_status != 0) {
        throw ConnectionError("Cannot connect to " + params_.host + ":" + std::to_string(params_.port) + ": " +
                              PilotLogger::excerpt(result.error_output));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    open_ = true;
    logger_.debug("SshConnection", "Master up on " + control_path_);
}

CommandOutput SshConnection::execute(const std::string& command, const std::string& input,
                                     std::chrono::seconds timeout) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_) {
            throw ConnectionError("Connection to " + params_.host + " is closed");
        }
    }

    std::vector<std::string> args = base_args();
    args.push_back(destination());
    args.push_back("--");
    args.push_back(command);

    ProcessResult result = run_process(args, input, timeout);
    if (result.timed_out) {
        throw ConnectionError("Command timed out after " + std::to_string(timeout.count()) + "s on " + params_.host);
    }
    if (result.exit_status == kTransportExitStatus || result.exit_status < 0) {
        throw ConnectionError("Transport failure on " + params_.host + ": " + PilotLogger::excerpt(result.error_output));
    }
    return {result.output, result.error_output, result.exit_status};
}

bool SshConnection::is_alive() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_) return false;
    }
    std::vector<std::string> args = base_args();
    args.insert(args.end(), {"-O", "check", destination()});
    try {
        ProcessResult result = run_process(args, std::string(), std::chrono::seconds(5));
        return !result.timed_out && result.exit_status == 0;
    } catch (const ConnectionError& e) {
        logger_.warning("SshConnection", std::string("Health check could not run: ") + e.what());
        return false;
    }
}

void SshConnection::close() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_) return;
        open_ = false;
    }
    std::vector<std::string> args = base_args();
    args.insert(args.end(), {"-O", "exit", destination()});
    try {
        ProcessResult result = run_process(args, std::string(), std::chrono::seconds(5));
        if (result.exit_status != 0) {
            logger_.debug("SshConnection", "Master on " + control_path_ + " already gone: " +
                          PilotLogger::excerpt(result.error_output, 80));
        }
    } catch (const ConnectionError& e) {
        logger_.warning("SshConnection", std::string("Could not stop master: ") + e.what());
    }
    ::unlink(control_path_.c_str());
}

std::unique_ptr<RemoteConnection> SshConnectionFactory::connect(const ConnectionParams& params) {
    auto connection = std::make_unique<SshConnection>(params, options_, logger_);
    connection->open();
    return connection;
}

} // namespace netpilot
