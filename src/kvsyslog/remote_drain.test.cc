/* <kvsyslog/remote_drain.test.cc>

   ----------------------------------------------------------------------------
   Copyright 2019 Dave Peterson <dave@dspeterson.com>

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

     http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
   ----------------------------------------------------------------------------

   Unit tests for <kvsyslog/remote_drain.h>, using loopback sockets.
 */

#include <kvsyslog/remote_drain.h>

#include <cstring>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <syslog.h>
#include <unistd.h>

#include <base/error_util.h>
#include <base/fd.h>
#include <base/tmp_file.h>
#include <kvsyslog/drain_builder.h>
#include <kvsyslog/error.h>
#include <kvsyslog/key_values.h>
#include <kvsyslog/record.h>
#include <kvsyslog/transport/endpoint.h>
#include <kvsyslog/transport/rfc3164.h>
#include <kvsyslog/transport/tcp_sender.h>
#include <kvsyslog/transport/unix_sender.h>
#include <test_util/test_logging.h>

#include <gtest/gtest.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Transport;

namespace {

  const int kTimeoutMs = 5000;

  const char kSuffix[] = "test-hostname test-app[123]: ";

  bool EndsWith(const std::string &s, const std::string &suffix) {
    return (s.size() >= suffix.size()) &&
        (s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
  }

  /* Returns the text following "HOSTNAME PROCESS[PID]: ", or the empty
     string if 'line' does not contain kSuffix. */
  std::string GetMsgPart(const std::string &line) {
    const size_t pos = line.find(kSuffix);
    return (pos == std::string::npos) ?
        std::string() : line.substr(pos + std::strlen(kSuffix));
  }

  /* Bound to an ephemeral port on 127.0.0.1. */
  TFd MakeLoopbackSocket(int sock_type, in_port_t &port) {
    TFd sock(IfLt0(socket(AF_INET, sock_type, 0)));
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    IfLt0(bind(sock, reinterpret_cast<const struct sockaddr *>(&addr),
        sizeof(addr)));
    socklen_t len = sizeof(addr);
    IfLt0(getsockname(sock, reinterpret_cast<struct sockaddr *>(&addr),
        &len));
    port = ntohs(addr.sin_port);
    return sock;
  }

  TFd MakeUnixSocket(int sock_type, const std::string &path) {
    TFd sock(IfLt0(socket(AF_UNIX, sock_type, 0)));
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    IfLt0(bind(sock, reinterpret_cast<const struct sockaddr *>(&addr),
        sizeof(addr)));
    return sock;
  }

  /* Returns one datagram, or the empty string on timeout. */
  std::string ReceiveDatagram(const TFd &sock) {
    if (!sock.IsReadable(kTimeoutMs)) {
      return std::string();
    }

    char buf[4096];
    const ssize_t len = IfLt0(recv(sock, buf, sizeof(buf), 0));
    return std::string(buf, static_cast<size_t>(len));
  }

  /* Reads RFC 6587 octet counted frames from stream socket 'sock' until
     'frame_count' are complete or a read times out. */
  std::vector<std::string> ReceiveFrames(const TFd &sock,
      size_t frame_count) {
    std::vector<std::string> frames;
    std::string data;

    while (frames.size() < frame_count) {
      const size_t space = data.find(' ');

      if (space != std::string::npos) {
        const size_t len = std::stoul(data.substr(0, space));

        if ((data.size() - space - 1) >= len) {
          frames.push_back(data.substr(space + 1, len));
          data.erase(0, space + 1 + len);
          continue;
        }
      }

      if (!sock.IsReadable(kTimeoutMs)) {
        break;
      }

      char buf[4096];
      const ssize_t len = IfLt0(recv(sock, buf, sizeof(buf), 0));

      if (len == 0) {
        break;
      }

      data.append(buf, static_cast<size_t>(len));
    }

    return frames;
  }

  TDrainBuilder MakeBuilder() {
    TDrainBuilder builder;
    builder.Hostname("test-hostname").Process("test-app").Pid(123);
    return builder;
  }

  class TRemoteDrainTest : public ::testing::Test {
    protected:
    TRemoteDrainTest() = default;

    ~TRemoteDrainTest() override = default;

    void SetUp() override {
    }

    void TearDown() override {
    }
  };  // TRemoteDrainTest

  TEST_F(TRemoteDrainTest, Udp) {
    in_port_t port = 0;
    TFd server = MakeLoopbackSocket(SOCK_DGRAM, port);
    auto drain = MakeBuilder()
        .Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", port))
        .Build();
    TKeyValues kv{{"key", "value"}, {"key2", "value2"}};
    drain->Log(TRecord(TSeverity::Info, "Hello, world!", kv));
    const std::string packet = ReceiveDatagram(server);
    ASSERT_EQ(packet.compare(0, 4, "<14>"), 0) << packet;
    ASSERT_TRUE(EndsWith(packet,
        "test-hostname test-app[123]: Hello, world! "
        "[key=\"value\" key2=\"value2\"]")) << packet;
  }

  TEST_F(TRemoteDrainTest, UdpAnyLocalAddress) {
    in_port_t port = 0;
    TFd server = MakeLoopbackSocket(SOCK_DGRAM, port);
    auto drain = MakeBuilder()
        .Udp(TEndpoint(), TEndpoint("127.0.0.1", port))
        .Build();
    drain->Log(TRecord(TSeverity::Info, "from any"));
    ASSERT_EQ(GetMsgPart(ReceiveDatagram(server)), "from any");
  }

  TEST_F(TRemoteDrainTest, ResolveEmptyHost) {
    const TSockAddr bind_addr = Resolve(TEndpoint("", 514), SOCK_DGRAM,
        AF_INET, true /* passive */);
    ASSERT_EQ(bind_addr.GetFamily(), AF_INET);
    const auto *bind_in =
        reinterpret_cast<const struct sockaddr_in *>(bind_addr.Get());
    ASSERT_EQ(ntohl(bind_in->sin_addr.s_addr), INADDR_ANY);
    ASSERT_EQ(ntohs(bind_in->sin_port), 514);

    const TSockAddr connect_addr = Resolve(TEndpoint("", 514), SOCK_DGRAM,
        AF_INET);
    const auto *connect_in =
        reinterpret_cast<const struct sockaddr_in *>(connect_addr.Get());
    ASSERT_EQ(ntohl(connect_in->sin_addr.s_addr), INADDR_LOOPBACK);
  }

  TEST_F(TRemoteDrainTest, UdpBasicFormat) {
    in_port_t port = 0;
    TFd server = MakeLoopbackSocket(SOCK_DGRAM, port);
    auto drain = MakeBuilder()
        .Facility(TFacility::Local0)
        .Format(std::make_shared<TBasicMsgFormat>())
        .Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", port))
        .Build();
    TKeyValues kv{{"key", "value"}};
    drain->Log(TRecord(TSeverity::Error, "Hello, world!", kv));
    const std::string packet = ReceiveDatagram(server);
    ASSERT_EQ(packet.compare(0, 5, "<131>"), 0) << packet;
    ASSERT_EQ(GetMsgPart(packet), "Hello, world!");
  }

  TEST_F(TRemoteDrainTest, FormatErrorKeepsFacility) {
    in_port_t port = 0;
    TFd server = MakeLoopbackSocket(SOCK_DGRAM, port);
    auto drain = MakeBuilder()
        .Facility(TFacility::Local0)
        .Format([](std::string &out, const TRecord &record,
            const TKeyValues &) {
          out += record.GetMsg();
          throw std::runtime_error("formatting failed");
        })
        .Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", port))
        .Build();
    drain->Log(TRecord(TSeverity::Info, "partial"));
    const std::string first = ReceiveDatagram(server);
    const std::string second = ReceiveDatagram(server);
    ASSERT_EQ(first.compare(0, 5, "<134>"), 0) << first;
    ASSERT_EQ(GetMsgPart(first), "partial");
    ASSERT_EQ(second.compare(0, 5, "<131>"), 0) << second;
    ASSERT_EQ(GetMsgPart(second),
        "Error fully formatting the previous log message: "
        "formatting failed");
  }

  TEST_F(TRemoteDrainTest, ThresholdSendsNothing) {
    in_port_t port = 0;
    TFd server = MakeLoopbackSocket(SOCK_DGRAM, port);
    auto drain = MakeBuilder()
        .Threshold(TSeverity::Error)
        .Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", port))
        .Build();
    drain->Log(TRecord(TSeverity::Warning, "dropped"));
    drain->Log(TRecord(TSeverity::Error, "kept"));
    const std::string packet = ReceiveDatagram(server);
    ASSERT_EQ(GetMsgPart(packet), "kept");
    ASSERT_FALSE(server.IsReadable(0));
  }

  TEST_F(TRemoteDrainTest, Tcp) {
    in_port_t port = 0;
    TFd listener = MakeLoopbackSocket(SOCK_STREAM, port);
    IfLt0(listen(listener, 1));
    auto drain = MakeBuilder()
        .Tcp(TEndpoint("127.0.0.1", port))
        .Build();
    TFd conn(IfLt0(accept(listener, nullptr, nullptr)));
    drain->Log(TRecord(TSeverity::Warning, "first"));
    drain->Log(TRecord(TSeverity::Debug, "second"));
    const std::vector<std::string> frames = ReceiveFrames(conn, 2);
    ASSERT_EQ(frames.size(), 2U);
    ASSERT_EQ(frames[0].compare(0, 4, "<12>"), 0) << frames[0];
    ASSERT_EQ(GetMsgPart(frames[0]), "first");
    ASSERT_EQ(frames[1].compare(0, 4, "<15>"), 0) << frames[1];
    ASSERT_EQ(GetMsgPart(frames[1]), "second");
  }

  TEST_F(TRemoteDrainTest, TcpMultiLineValue) {
    in_port_t port = 0;
    TFd listener = MakeLoopbackSocket(SOCK_STREAM, port);
    IfLt0(listen(listener, 1));
    auto drain = MakeBuilder()
        .Tcp(TEndpoint("127.0.0.1", port))
        .Build();
    TFd conn(IfLt0(accept(listener, nullptr, nullptr)));
    TKeyValues kv{{"note", "line1\nline2"}};
    drain->Log(TRecord(TSeverity::Info, "one\nevent", kv));
    drain->Log(TRecord(TSeverity::Info, "next"));
    const std::vector<std::string> frames = ReceiveFrames(conn, 2);
    ASSERT_EQ(frames.size(), 2U);
    ASSERT_EQ(frames[0].compare(0, 4, "<14>"), 0) << frames[0];
    ASSERT_EQ(GetMsgPart(frames[0]),
        "one\nevent [note=\"line1\nline2\"]");
    ASSERT_EQ(GetMsgPart(frames[1]), "next");
    ASSERT_FALSE(conn.IsReadable(100));
  }

  TEST_F(TRemoteDrainTest, SocketFailure) {
    in_port_t port = 0;
    TFd listener = MakeLoopbackSocket(SOCK_STREAM, port);
    IfLt0(listen(listener, 1));
    TTcpSender sender(TEndpoint("127.0.0.1", port));

    /* Lower the descriptor limit to the lowest free descriptor, so the next
       socket() call fails with EMFILE. */
    const int lowest = IfLt0(dup(STDERR_FILENO));
    IfLt0(close(lowest));
    struct rlimit old_limit;
    IfLt0(getrlimit(RLIMIT_NOFILE, &old_limit));
    struct rlimit new_limit = old_limit;
    new_limit.rlim_cur = static_cast<rlim_t>(lowest);
    IfLt0(setrlimit(RLIMIT_NOFILE, &new_limit));
    int errno_value = 0;

    try {
      sender.PrepareToSend();
    } catch (const TTransportError &x) {
      errno_value = x.GetErrnoValue();
    }

    IfLt0(setrlimit(RLIMIT_NOFILE, &old_limit));
    ASSERT_EQ(errno_value, EMFILE);
  }

  TEST_F(TRemoteDrainTest, TcpConnectFailure) {
    /* Grab a port, then close the socket so nothing listens there. */
    in_port_t port = 0;
    MakeLoopbackSocket(SOCK_STREAM, port);
    bool caught = false;

    try {
      MakeBuilder().Tcp(TEndpoint("127.0.0.1", port)).Build();
    } catch (const TTransportError &x) {
      caught = true;
      ASSERT_EQ(x.GetErrnoValue(), ECONNREFUSED);
    }

    ASSERT_TRUE(caught);
  }

  TEST_F(TRemoteDrainTest, UnixDatagram) {
    const std::string path = MakeTmpFilename("/tmp/kvsyslog_test.XXXXXX");
    TFd server = MakeUnixSocket(SOCK_DGRAM, path);
    auto drain = MakeBuilder().UnixPath(path).Build();
    const auto &sender =
        dynamic_cast<const TUnixSender &>(
            dynamic_cast<const TRemoteDrain &>(*drain).GetSender());
    ASSERT_FALSE(sender.IsStream());
    TKeyValues kv{{"k", "a \"quoted\" value"}};
    drain->Log(TRecord(TSeverity::Error, "unix", kv));
    const std::string packet = ReceiveDatagram(server);
    unlink(path.c_str());
    ASSERT_EQ(packet.compare(0, 4, "<11>"), 0) << packet;
    ASSERT_EQ(GetMsgPart(packet), "unix [k=\"a \\\"quoted\\\" value\"]");
  }

  TEST_F(TRemoteDrainTest, UnixStreamFallback) {
    const std::string path = MakeTmpFilename("/tmp/kvsyslog_test.XXXXXX");
    TFd listener = MakeUnixSocket(SOCK_STREAM, path);
    IfLt0(listen(listener, 1));
    auto drain = MakeBuilder().UnixPath(path).Build();
    TFd conn(IfLt0(accept(listener, nullptr, nullptr)));
    unlink(path.c_str());
    const auto &sender =
        dynamic_cast<const TUnixSender &>(
            dynamic_cast<const TRemoteDrain &>(*drain).GetSender());
    ASSERT_TRUE(sender.IsStream());
    drain->Log(TRecord(TSeverity::Critical, "stream"));
    TKeyValues kv{{"k", "two\nlines"}};
    drain->Log(TRecord(TSeverity::Info, "again", kv));
    const std::vector<std::string> frames = ReceiveFrames(conn, 2);
    ASSERT_EQ(frames.size(), 2U);
    ASSERT_EQ(frames[0].compare(0, 4, "<10>"), 0) << frames[0];
    ASSERT_EQ(GetMsgPart(frames[0]), "stream");
    ASSERT_EQ(GetMsgPart(frames[1]), "again [k=\"two\nlines\"]");
  }

  TEST_F(TRemoteDrainTest, UnixPathErrors) {
    ASSERT_THROW(MakeBuilder().UnixPath("").Build(), TConfigError);
    ASSERT_THROW(MakeBuilder().UnixPath(std::string(200, 'x')).Build(),
        TConfigError);
    ASSERT_THROW(
        MakeBuilder().UnixPath("/nonexistent/kvsyslog/socket").Build(),
        TTransportError);
  }

  TEST_F(TRemoteDrainTest, Rfc3164Header) {
    const time_t now = std::time(nullptr);
    struct tm local;
    ASSERT_NE(localtime_r(&now, &local), nullptr);
    char stamp[32];
    ASSERT_NE(std::strftime(stamp, sizeof(stamp), "%b %d %T", &local), 0U);

    std::string header;
    AppendRfc3164Header(header, LOG_USER | LOG_NOTICE, now, "host", "app",
        7);
    ASSERT_EQ(header, std::string("<13>") + stamp + " host app[7]: ");

    header = "prefix";
    AppendRfc3164Header(header, LOG_LOCAL7 | LOG_DEBUG, now, "", "app", 7);
    ASSERT_EQ(header, std::string("prefix<191>") + stamp + " app[7]: ");
  }

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  TTmpFile test_logfile = ::TestUtil::InitTestLogging(argv[0]);
  return RUN_ALL_TESTS();
}
