#include "gtest/gtest.h"
#include "netpilot/errors.hpp"
#include "netpilot/remote_command.hpp"
#include "netpilot/ssh_connection.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using netpilot::ConnectionError;
using netpilot::SshConnection;

namespace {

// Stands in for OpenSSH: "-M" starts a master, "-O check|exit" controls it,
// anything else runs the last argument with sh while the master is up.
const char* const kStubSsh = R"(#!/bin/sh
state="$(dirname "$0")/master"
for last; do :; done
case " $* " in
  *" -M "*) : > "$state"; exit 0 ;;
  *" -O check "*) [ -f "$state" ]; exit $? ;;
  *" -O exit "*) rm -f "$state"; exit 0 ;;
esac
if [ ! -f "$state" ]; then
  echo "Control socket connect: No such file or directory" >&2
  exit 255
fi
exec sh -c "$last"
)";

const char* const kRefusingSsh = R"(#!/bin/sh
echo "ssh: connect to host router.test port 2222: Connection refused" >&2
exit 255
)";

const std::chrono::seconds kTimeout(5);

} // namespace

class SshConnectionTest : public ::testing::Test {
protected:
    netpilot::PilotLogger logger{netpilot::LogLevel::CRITICAL};
    std::string dir;
    netpilot::SshOptions options;
    netpilot::ConnectionParams params;

    void SetUp() override {
        char pattern[] = "/tmp/netpilot-ssh-test-XXXXXX";
        ASSERT_NE(::mkdtemp(pattern), nullptr);
        dir = pattern;
        options.ssh_binary = write_script("ssh", kStubSsh);
        options.control_dir = dir;
        options.connect_timeout = std::chrono::seconds(2);
        params.host = "router.test";
        params.port = 2222;
        params.username = "root";
    }

    void TearDown() override {
        for (const char* name : {"ssh", "ssh-refusing", "master", "state.json", "state.json.tmp"}) {
            ::unlink((dir + "/" + name).c_str());
        }
        ::rmdir(dir.c_str());
    }

    std::string write_script(const std::string& name, const std::string& body) {
        const std::string path = dir + "/" + name;
        {
            std::ofstream out(path);
            out << body;
        }
        ::chmod(path.c_str(), 0755);
        return path;
    }

    std::string read_file(const std::string& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::unique_ptr<SshConnection> connect() {
        auto connection = std::make_unique<SshConnection>(params, options, logger);
        connection->open();
        return connection;
    }
};

TEST_F(SshConnectionTest, CapturesBothStreamsAndExitStatus) {
    auto connection = connect();
    EXPECT_TRUE(connection->is_alive());

    netpilot::CommandOutput out = connection->execute("echo hello; echo oops >&2", "", kTimeout);
    EXPECT_EQ(out.output, "hello\n");
    EXPECT_EQ(out.error_output, "oops\n");
    EXPECT_EQ(out.exit_status, 0);

    // A command that ran and failed is not a transport failure.
    out = connection->execute("exit 3", "", kTimeout);
    EXPECT_EQ(out.exit_status, 3);
}

TEST_F(SshConnectionTest, ExitStatus255IsATransportFailure) {
    auto connection = connect();
    EXPECT_THROW(connection->execute("exit 255", "", kTimeout), ConnectionError);

    // The master dying under us looks the same.
    ::unlink((dir + "/master").c_str());
    EXPECT_FALSE(connection->is_alive());
    EXPECT_THROW(connection->execute("echo hi", "", kTimeout), ConnectionError);
}

TEST_F(SshConnectionTest, TimeoutIsATransportFailure) {
    auto connection = connect();
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(connection->execute("sleep 5", "", std::chrono::seconds(1)), ConnectionError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST_F(SshConnectionTest, LargeInputIsStreamedOverStdin) {
    auto connection = connect();
    const std::string payload(300000, 'x');
    netpilot::CommandOutput out = connection->execute("wc -c", payload, kTimeout);
    EXPECT_EQ(std::stoul(out.output), payload.size());
    EXPECT_EQ(out.exit_status, 0);
}

TEST_F(SshConnectionTest, StateWriteOfALargeDocumentLandsWhole) {
    auto connection = connect();
    std::string document = "{\"groups\": [";
    while (document.size() < 200 * 1024) {
        document += "{\"name\": \"Bob's laptop\", \"mac\": \"aa:bb:cc:dd:ee:ff\"},";
    }
    document += "{}]}";

    const netpilot::ops::WriteFile write{dir + "/state.json", document};
    netpilot::CommandOutput out = connection->execute(netpilot::render(write), netpilot::stdin_payload(write),
                                                      kTimeout);
    EXPECT_EQ(out.exit_status, 0);
    EXPECT_NE(out.output.find(netpilot::ops::WriteFile::kConfirmation), std::string::npos);
    EXPECT_EQ(read_file(dir + "/state.json"), document);
}

TEST_F(SshConnectionTest, MissingBinaryFailsToConnect) {
    options.ssh_binary = dir + "/no-such-ssh";
    try {
        connect();
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("No such file or directory"), std::string::npos);
    }
}

TEST_F(SshConnectionTest, RefusedMasterFailsToConnect) {
    options.ssh_binary = write_script("ssh-refusing", kRefusingSsh);
    try {
        connect();
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("Connection refused"), std::string::npos);
    }
}

TEST_F(SshConnectionTest, CloseStopsMasterAndRejectsCommands) {
    auto connection = connect();
    connection->close();
    EXPECT_FALSE(connection->is_alive());
    EXPECT_THROW(connection->execute("echo hi", "", kTimeout), ConnectionError);
    EXPECT_NO_THROW(connection->close());
    EXPECT_EQ(::access((dir + "/master").c_str(), F_OK), -1);
}

TEST_F(SshConnectionTest, FactoryReturnsAnOpenConnection) {
    netpilot::SshConnectionFactory factory(options, logger);
    std::unique_ptr<netpilot::RemoteConnection> connection = factory.connect(params);
    ASSERT_NE(connection, nullptr);
    EXPECT_TRUE(connection->is_alive());
    EXPECT_EQ(connection->execute("echo up", "", kTimeout).output, "up\n");
}
