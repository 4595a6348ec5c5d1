#ifndef MBOX_CONSOLE_HPP_
#define MBOX_CONSOLE_HPP_

#include "server.hpp"

#include <unistd.h>

#include <atomic>
#include <string>
#include <thread>

namespace mbox {

// ============================================================================
// Console - operator input on a background thread
// ============================================================================
//
// Reads lines from `fd` and calls Server::stop() on "q" or "Q". End of input
// ends the thread without stopping the server. The fd is polled with a
// timeout so the destructor can join the thread; destroy the Console before
// the Server it refers to.

class Console {
 public:
  explicit Console(Server& server, int fd = STDIN_FILENO);
  ~Console();

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  // True once the thread has returned (quit command, end of input or error).
  bool finished() const { return finished_.load(std::memory_order_acquire); }

 private:
  static constexpr int kPollMs = 200;

  void loop();
  // Handle complete lines in `pending_`. Returns true on a quit command.
  bool consume_lines();

  Server& server_;
  int fd_;
  std::string pending_;
  std::atomic<bool> done_{false};
  std::atomic<bool> finished_{false};
  std::thread thread_;
};

}  // namespace mbox

#endif  // MBOX_CONSOLE_HPP_
