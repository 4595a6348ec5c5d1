#include "mbox/console.hpp"

#include "mbox/log.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>

namespace mbox {

Console::Console(Server& server, int fd) : server_(server), fd_(fd), thread_([this]() { loop(); }) {}

Console::~Console() {
  done_.store(true, std::memory_order_release);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Console::loop() {
  char buf[256];
  while (!done_.load(std::memory_order_acquire)) {
    struct pollfd pfd = {fd_, POLLIN, 0};
    int ret = ::poll(&pfd, 1, kPollMs);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      MBOX_LOG_WARN("Console poll failed: " + std::string(strerror(errno)));
      break;
    }
    if (ret == 0) {
      continue;
    }

    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    pending_.append(buf, static_cast<size_t>(n));
    if (consume_lines()) {
      MBOX_LOG_INFO("Quit requested from console");
      server_.stop();
      break;
    }
  }
  finished_.store(true, std::memory_order_release);
}

bool Console::consume_lines() {
  size_t pos;
  while ((pos = pending_.find('\n')) != std::string::npos) {
    std::string line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line == "q" || line == "Q") {
      return true;
    }
  }
  return false;
}

}  // namespace mbox
