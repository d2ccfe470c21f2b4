#include "core/Logger.hpp"
#include "io/FileLogger.hpp"
#include "io/TcpChannel.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

  // loopback listener on an ephemeral port
  struct Listener {
    int fd{ -1 };
    std::uint16_t port{ 0 };

    Listener() {
      fd = ::socket(AF_INET, SOCK_STREAM, 0);
      sockaddr_in addr{};
      addr.sin_family = AF_INET;
      addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
      addr.sin_port = 0;
      ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr);
      ::listen(fd, 1);
      socklen_t len = sizeof addr;
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
      port = ntohs(addr.sin_port);
    }
    ~Listener() {
      if (fd >= 0)
        ::close(fd);
    }
    int accept() { return ::accept(fd, nullptr, nullptr); }
  };

  std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
  }

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
  }

} // namespace

TEST(tcp_channel, opens_writes_reads_closes) {
  Listener server;
  ASSERT_GE(server.fd, 0);

  hvload::io::TcpChannel chan;
  ASSERT_TRUE(chan.open("127.0.0.1", server.port, std::chrono::milliseconds{ 500 }));
  int peer = server.accept();
  ASSERT_GE(peer, 0);

  // instrument side answers with CRLF, two lines in one segment
  const char* msg = "399.870 V\r\n12.5 A\r\n";
  ASSERT_EQ(static_cast<ssize_t>(strlen(msg)), ::write(peer, msg, strlen(msg)));

  auto first = chan.readLine(std::chrono::milliseconds{ 200 });
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, "399.870 V");
  auto second = chan.readLine(std::chrono::milliseconds{ 200 });
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, "12.5 A");

  ASSERT_TRUE(chan.writeLine("MEASure:VOLTage?"));
  char buf[32] = { 0 };
  ASSERT_GT(::read(peer, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "MEASure:VOLTage?\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
  ::close(peer);
}

TEST(tcp_channel, read_times_out_without_reply) {
  Listener server;
  hvload::io::TcpChannel chan;
  ASSERT_TRUE(chan.open("127.0.0.1", server.port, std::chrono::milliseconds{ 500 }));
  int peer = server.accept();

  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 50 }));
  ::close(peer);
}

TEST(tcp_channel, discard_drops_stale_reply) {
  Listener server;
  hvload::io::TcpChannel chan;
  ASSERT_TRUE(chan.open("127.0.0.1", server.port, std::chrono::milliseconds{ 500 }));
  int peer = server.accept();

  const char* stale = "1.0\n";
  ::write(peer, stale, strlen(stale));
  ::usleep(20000);
  chan.discardInput();
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 30 }));
  ::close(peer);
}

TEST(tcp_channel, unterminated_stream_is_cut_off) {
  Listener server;
  hvload::io::TcpChannel chan;
  ASSERT_TRUE(chan.open("127.0.0.1", server.port, std::chrono::milliseconds{ 500 }));
  int peer = server.accept();

  const std::string flood(hvload::io::TcpChannel::kMaxLineBytes + 512, 'x');
  ASSERT_EQ(static_cast<ssize_t>(flood.size()), ::write(peer, flood.data(), flood.size()));

  auto line = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(line);
  EXPECT_GT(line->size(), hvload::io::TcpChannel::kMaxLineBytes);
  EXPECT_LE(line->size(), flood.size());

  // the buffer was released, so a proper reply still gets through
  chan.discardInput();
  const char* ok = "1.0\n";
  ::write(peer, ok, strlen(ok));
  auto next = chan.readLine(std::chrono::milliseconds{ 200 });
  ASSERT_TRUE(next);
  EXPECT_EQ(*next, "1.0");
  ::close(peer);
}

TEST(tcp_channel, refused_connection_fails_open) {
  std::uint16_t port;
  {
    Listener gone;
    port = gone.port;
  } // closed: nothing listens there now

  hvload::io::TcpChannel chan;
  EXPECT_FALSE(chan.open("127.0.0.1", port, std::chrono::milliseconds{ 200 }));
  EXPECT_FALSE(chan.isOpen());
}

TEST(file_logger, writes_and_flushes) {
  const std::string path = tempPath("hvload_filelogger_test.txt");
  std::remove(path.c_str());

  hvload::io::FileLogger log;
  ASSERT_TRUE(log.open(path));
  EXPECT_TRUE(log.write("a,b\n"));
  EXPECT_TRUE(log.flush());
  EXPECT_EQ(slurp(path), "a,b\n");
  log.close();
  EXPECT_FALSE(log.isOpen());
  std::remove(path.c_str());
}

TEST(csv_logger, writes_header_samples_and_events) {
  using namespace hvload::core;
  const std::string path = tempPath("hvload_logger_test.csv");
  std::remove(path.c_str());

  Logger logger(16);
  ASSERT_TRUE(logger.startNewRun(path));

  Sample s;
  s.timestamp = WallClock::now();
  s.elapsedS = 1.0;
  s.voltage = 395.0;
  s.current = 10.0;
  s.power = 3950.0;
  s.cumulativeEnergyJ = 3950.0;
  logger.publish(s);
  logger.logMessage("state", "Idle -> Running");
  logger.flush();
  logger.finishRun();

  const std::string text = slurp(path);
  EXPECT_EQ(text.rfind(Logger::kHeader, 0), 0u);
  EXPECT_NE(text.find(",sample,1,395"), std::string::npos);
  EXPECT_NE(text.find("\"Idle -> Running\""), std::string::npos);
  EXPECT_EQ(logger.dropped(), 0u);
  std::remove(path.c_str());
}
