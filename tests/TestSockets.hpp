#ifndef TEST_SOCKETS_HPP
#define TEST_SOCKETS_HPP

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <string>
#include <utility>

/* Loopback helpers shared by the socket-level tests. Every socket handed out
 * has a 5 second receive timeout so a broken test fails instead of hanging. */
namespace testsock {

inline void setTimeout(int fd, int seconds = 5) {
  struct timeval tv {};
  tv.tv_sec = seconds;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

/* A connected pair: first is the test's end, second is handed to the code under test. */
inline std::pair<int, int> streamPair() {
  int fds[2] = {-1, -1};
  if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    return {-1, -1};
  }
  setTimeout(fds[0]);
  return {fds[0], fds[1]};
}

inline bool sendAll(int fd, const std::string &data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

/* Read exactly n bytes (less if the peer closes or the timeout hits). */
inline std::string readExactly(int fd, size_t n) {
  std::string out;
  char buf[4096];
  while (out.size() < n) {
    size_t want = n - out.size() < sizeof(buf) ? n - out.size() : sizeof(buf);
    ssize_t got = recv(fd, buf, want, 0);
    if (got <= 0) {
      break;
    }
    out.append(buf, static_cast<size_t>(got));
  }
  return out;
}

/* Read until end-of-stream. */
inline std::string readToEnd(int fd) {
  std::string out;
  char buf[4096];
  while (true) {
    ssize_t got = recv(fd, buf, sizeof(buf), 0);
    if (got <= 0) {
      break;
    }
    out.append(buf, static_cast<size_t>(got));
  }
  return out;
}

/* True if the peer has closed: recv returns 0 within the timeout. */
inline bool peerClosed(int fd) {
  char c;
  return recv(fd, &c, 1, 0) == 0;
}

/* True if nothing at all is waiting to be read right now. */
inline bool nothingPending(int fd) {
  struct pollfd pfd {};
  pfd.fd = fd;
  pfd.events = POLLIN;
  if (poll(&pfd, 1, 0) == 0) {
    return true;
  }
  char c;
  return recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT) == 0;  // readable only because of EOF
}

inline int connectTo(int port) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(fd);
    return -1;
  }
  setTimeout(fd);
  return fd;
}

/* A listening socket on 127.0.0.1 with an ephemeral port, standing in for an origin. */
class LoopbackListener {
public:
  LoopbackListener() {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    listen(fd_, 16);
    socklen_t len = sizeof(addr);
    getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    setTimeout(fd_);
  }

  ~LoopbackListener() { closeListener(); }

  LoopbackListener(const LoopbackListener &) = delete;
  LoopbackListener &operator=(const LoopbackListener &) = delete;

  int port() const { return port_; }

  /* Accept one connection; -1 after the timeout. */
  int acceptOne() {
    int fd = accept(fd_, nullptr, nullptr);
    if (fd >= 0) {
      setTimeout(fd);
    }
    return fd;
  }

  void closeListener() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
  int port_ = 0;
};

/* A loopback port nothing listens on, so connecting to it is refused. */
inline int refusedPort() {
  LoopbackListener listener;
  return listener.port();
}

/* Close a TCP socket with a zero linger so the peer sees a reset instead of end-of-stream. */
inline void resetClose(int fd) {
  struct linger lg {};
  lg.l_onoff = 1;
  lg.l_linger = 0;
  setsockopt(fd, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
  close(fd);
}

} // namespace testsock

#endif // TEST_SOCKETS_HPP
