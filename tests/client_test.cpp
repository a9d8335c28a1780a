#include "client.hpp"

#include "gtest/gtest.h"

#include "support/fake_daemon.hpp"
#include "support/test_support.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

class ClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    key_dir = make_temp_dir();
    config.io_timeout_ms = 1000;
    config.drain_timeout_ms = 100;
    config.trust_timeout_ms = 1000;
    config.preconnect = false;
  }
  void TearDown() override { remove_dir(key_dir); }

  ClientConfig config_for(const FakeDaemon& daemon) {
    ClientConfig c = config;
    c.port = daemon.port();
    return c;
  }

  std::string key_dir;
  ClientConfig config;
};

std::string payload_of(const Message& m) {
  return std::string(m.payload.begin(), m.payload.end());
}

}  // namespace

TEST_F(ClientTest, KeyEventEndToEnd) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (d.accept_cnxn(fd))
      d.serve_until_closed(fd);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_TRUE(client.send_shell_command("input keyevent 23"));
  }

  EXPECT_EQ(1, daemon.connections());
  ASSERT_EQ(1, daemon.count(A_OPEN));
  for (const Message& m : daemon.received()) {
    if (m.header.command == A_OPEN) {
      EXPECT_EQ(std::string("shell:input keyevent 23\0", 24), payload_of(m));
    }
  }
}

TEST_F(ClientTest, SendKeyEventFormatsCommand) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (d.accept_cnxn(fd))
      d.serve_until_closed(fd);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_TRUE(client.send_key_event(4));
  }

  std::vector<Message> got = daemon.received();
  bool found = false;
  for (const Message& m : got) {
    if (m.header.command == A_OPEN) {
      EXPECT_EQ(std::string("shell:input keyevent 4\0", 23), payload_of(m));
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(ClientTest, ReusesPersistentConnection) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (d.accept_cnxn(fd))
      d.serve_until_closed(fd);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_TRUE(client.send_key_event(19));
    EXPECT_TRUE(client.send_key_event(20));
    EXPECT_TRUE(client.send_key_event(23));
  }

  EXPECT_EQ(1, daemon.connections());
  EXPECT_EQ(1, daemon.count(A_CNXN));
  EXPECT_EQ(3, daemon.count(A_OPEN));

  // Local ids are fresh per stream.
  std::vector<uint32_t> ids;
  for (const Message& m : daemon.received()) {
    if (m.header.command == A_OPEN)
      ids.push_back(m.header.arg0);
  }
  EXPECT_EQ((std::vector<uint32_t>{1, 2, 3}), ids);
}

TEST_F(ClientTest, NotInitializedFailsWithoutConnecting) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (d.accept_cnxn(fd))
      d.serve_until_closed(fd);
  });

  Client client(config_for(daemon));
  EXPECT_FALSE(client.send_shell_command("input keyevent 23"));
  EXPECT_FALSE(client.send_key_event(23));
  EXPECT_EQ(0, daemon.connections());
}

TEST_F(ClientTest, DeadConnectionIsRetriedOnce) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int index) {
    if (!d.accept_cnxn(fd))
      return;
    if (index == 0) {
      // Serve one command, then drop the link on the next OPEN.
      Message m;
      if (d.serve_open(fd, 10))
        d.read(fd, m);
      return;
    }
    d.serve_until_closed(fd);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_TRUE(client.send_key_event(19));
    EXPECT_TRUE(client.send_key_event(20));
  }

  EXPECT_EQ(2, daemon.connections());
  EXPECT_EQ(3, daemon.count(A_OPEN));
}

TEST_F(ClientTest, SecondConsecutiveFailureGivesUp) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int index) {
    if (!d.accept_cnxn(fd))
      return;
    Message m;
    if (index == 0 && !d.serve_open(fd, 10))
      return;
    // Swallow the OPEN and hang up.
    d.read(fd, m);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_TRUE(client.send_key_event(19));
    EXPECT_FALSE(client.send_key_event(20));
    // Give a stray third attempt time to show up.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  EXPECT_EQ(2, daemon.connections());
  EXPECT_EQ(3, daemon.count(A_OPEN));
}

TEST_F(ClientTest, FailureWithoutConnectionConnectsOnce) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (!d.accept_cnxn(fd))
      return;
    Message m;
    d.read(fd, m);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_FALSE(client.send_key_event(3));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  EXPECT_EQ(1, daemon.connections());
  EXPECT_EQ(1, daemon.count(A_OPEN));
}

TEST_F(ClientTest, UnreachableDaemonReturnsFalse) {
  uint16_t port;
  {
    FakeDaemon gone([](FakeDaemon&, int, int) {});
    port = gone.port();
  }
  config.port = port;
  config.connect_timeout_ms = 500;

  Client client(config);
  ASSERT_TRUE(client.init(key_dir));
  EXPECT_FALSE(client.send_key_event(23));
}

TEST_F(ClientTest, PreconnectEstablishesConnectionInBackground) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (d.accept_cnxn(fd))
      d.serve_until_closed(fd);
  });

  {
    ClientConfig c = config_for(daemon);
    c.preconnect = true;
    Client client(c);
    ASSERT_TRUE(client.init(key_dir));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (daemon.count(A_CNXN) == 0 && std::chrono::steady_clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_EQ(1, daemon.count(A_CNXN));

    EXPECT_TRUE(client.send_key_event(23));
  }

  EXPECT_EQ(1, daemon.connections());
  EXPECT_EQ(1, daemon.count(A_OPEN));
}

TEST_F(ClientTest, PreconnectFailureIsNotFatal) {
  uint16_t port;
  {
    FakeDaemon gone([](FakeDaemon&, int, int) {});
    port = gone.port();
  }
  config.port = port;
  config.preconnect = true;

  Client client(config);
  EXPECT_TRUE(client.init(key_dir));
  EXPECT_FALSE(client.send_key_event(23));
}

TEST_F(ClientTest, AuthenticatesWithPersistedKey) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    Message m;
    if (!d.read(fd, m))
      return;
    std::string token(20, '\x5a');
    if (!d.send(fd, A_AUTH, static_cast<uint32_t>(AuthType::TOKEN), 0, token) || !d.read(fd, m))
      return;
    if (!d.send(fd, A_CNXN, ADB_VERSION, ADB_MAX_PAYLOAD, std::string("device::\0", 9)))
      return;
    d.serve_until_closed(fd);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    EXPECT_TRUE(client.send_key_event(23));
  }

  KeyPair keys = KeyStore(key_dir, config.key_label).load_or_generate();
  bool verified = false;
  for (const Message& m : daemon.received()) {
    if (m.header.command == A_AUTH && m.header.arg0 == static_cast<uint32_t>(AuthType::SIGNATURE)) {
      verified = verify_token_signature(keys.private_key.get(), std::vector<uint8_t>(20, 0x5a), m.payload);
    }
  }
  EXPECT_TRUE(verified);
}

TEST_F(ClientTest, ConcurrentCallersShareOneConnection) {
  FakeDaemon daemon([](FakeDaemon& d, int fd, int) {
    if (d.accept_cnxn(fd))
      d.serve_until_closed(fd);
  });

  {
    Client client(config_for(daemon));
    ASSERT_TRUE(client.init(key_dir));
    std::vector<std::thread> callers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 4; ++i) {
      callers.emplace_back([&client, &ok, i] {
        if (client.send_key_event(20 + i))
          ok++;
      });
    }
    for (auto& t : callers)
      t.join();
    EXPECT_EQ(4, ok.load());
  }

  EXPECT_EQ(1, daemon.connections());
  EXPECT_EQ(4, daemon.count(A_OPEN));
}
