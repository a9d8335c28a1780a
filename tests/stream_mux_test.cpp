#include "stream_mux.hpp"
#include "net.hpp"

#include "gtest/gtest.h"

#include "support/test_support.hpp"
#include <string>
#include <sys/socket.h>
#include <vector>

namespace {

class StreamMuxTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.io_timeout_ms = 1000;
    config.drain_timeout_ms = 100;
  }

  // Wrap the client end of `peer` the way Handshake leaves it.
  std::unique_ptr<Connection> connect(ScriptedPeer& peer) {
    std::unique_ptr<Connection> conn(new Connection(peer.client_fd));
    EXPECT_TRUE(net::set_recv_timeout(conn->fd, config.io_timeout_ms));
    return conn;
  }

  static bool send(int fd, uint32_t command, uint32_t arg0, uint32_t arg1, const std::string& payload = "") {
    return net::send_message(fd, build_message(command, arg0, arg1, payload));
  }

  static void expect_frame(int fd, uint32_t command, uint32_t arg0, uint32_t arg1) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    EXPECT_STREQ(command_name(command), command_name(m.header.command));
    EXPECT_EQ(arg0, m.header.arg0);
    EXPECT_EQ(arg1, m.header.arg1);
  }

  ClientConfig config;
};

}  // namespace

TEST_F(StreamMuxTest, OpensShellStream) {
  std::string open_payload;
  ScriptedPeer peer([&open_payload](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    ASSERT_EQ(A_OPEN, m.header.command);
    EXPECT_EQ(1u, m.header.arg0);
    EXPECT_EQ(0u, m.header.arg1);
    open_payload.assign(m.payload.begin(), m.payload.end());

    ASSERT_TRUE(send(fd, A_OKAY, 42, 1));
    ASSERT_TRUE(send(fd, A_CLSE, 42, 1));
    expect_frame(fd, A_CLSE, 1, 42);
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_TRUE(mux.run_command(1, "input keyevent 23"));
  peer.join();
  EXPECT_EQ(std::string("shell:input keyevent 23\0", 24), open_payload);
}

TEST_F(StreamMuxTest, DrainsStrayFramesBeforeMatchingOkay) {
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    ASSERT_EQ(2u, m.header.arg0);

    // Leftovers of stream 1 (remote 5) race with the new OPEN.
    ASSERT_TRUE(send(fd, A_WRTE, 5, 1, "late output"));
    ASSERT_TRUE(send(fd, A_CLSE, 5, 1));
    ASSERT_TRUE(send(fd, A_OKAY, 9, 2));
    ASSERT_TRUE(send(fd, A_CLSE, 9, 2));

    expect_frame(fd, A_OKAY, 1, 5);
    expect_frame(fd, A_CLSE, 1, 5);
    expect_frame(fd, A_CLSE, 2, 9);
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_TRUE(mux.run_command(2, "input keyevent 19"));
  peer.join();
  EXPECT_TRUE(mux.last_output().empty());
}

TEST_F(StreamMuxTest, StrayFramesDuringOutputAreNotOutput) {
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));

    ASSERT_TRUE(send(fd, A_OKAY, 9, 2));
    ASSERT_TRUE(send(fd, A_WRTE, 9, 2, "mine"));
    ASSERT_TRUE(send(fd, A_WRTE, 5, 1, "not mine"));
    ASSERT_TRUE(send(fd, A_CLSE, 9, 2));

    expect_frame(fd, A_OKAY, 2, 9);
    expect_frame(fd, A_OKAY, 1, 5);
    expect_frame(fd, A_CLSE, 2, 9);
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_TRUE(mux.run_command(2, "echo mine"));
  peer.join();
  EXPECT_EQ("mine", mux.last_output());
}

TEST_F(StreamMuxTest, QuietStreamIsClosedLocally) {
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    ASSERT_TRUE(send(fd, A_OKAY, 7, 3));
    // No output and no CLSE: the client must close after the quiet period.
    expect_frame(fd, A_CLSE, 3, 7);
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_TRUE(mux.run_command(3, "sleep 100"));
  peer.join();
}

TEST_F(StreamMuxTest, RefusedStreamFails) {
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    ASSERT_TRUE(send(fd, A_CLSE, 0, 4));
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_FALSE(mux.run_command(4, "no-such-service"));
  peer.join();
}

TEST_F(StreamMuxTest, UnexpectedCommandFails) {
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    ASSERT_TRUE(send(fd, A_AUTH, 1, 0));
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_FALSE(mux.run_command(1, "input keyevent 3"));
  peer.join();
}

TEST_F(StreamMuxTest, GivesUpAfterBoundedAttempts) {
  config.max_open_attempts = 3;
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    for (int i = 0; i < 3; ++i) {
      ASSERT_TRUE(send(fd, A_OKAY, 50 + i, 99));
    }
    // A matching OKAY that arrives too late.
    ASSERT_TRUE(send(fd, A_OKAY, 60, 1));
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_FALSE(mux.run_command(1, "input keyevent 3"));
  peer.join();
}

TEST_F(StreamMuxTest, ClosedConnectionFails) {
  ScriptedPeer peer([](int fd) {
    Message m;
    ASSERT_EQ(IoStatus::OK, read_message(fd, m));
    shutdown(fd, SHUT_RDWR);
  });

  auto conn = connect(peer);
  StreamMux mux(*conn, config);
  EXPECT_FALSE(mux.run_command(1, "input keyevent 3"));
  peer.join();
}
