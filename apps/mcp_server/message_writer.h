#pragma once

#include <mutex>
#include <ostream>
#include <string>

namespace ckmcp::mcp {

// MessageWriter serializes frames onto the protocol channel. Replies from the main loop and
// requests sent by background tasks share one writer, so no two frames interleave.
class MessageWriter {
 public:
  explicit MessageWriter(std::ostream& out) : out_(out) {}

  MessageWriter(const MessageWriter&) = delete;
  MessageWriter& operator=(const MessageWriter&) = delete;
  MessageWriter(MessageWriter&&) = delete;
  MessageWriter& operator=(MessageWriter&&) = delete;

  // Writes frame plus a newline and flushes. Returns false once the stream has failed.
  bool write(const std::string& frame);

 private:
  std::mutex mutex_;
  std::ostream& out_;
};

}  // namespace ckmcp::mcp
