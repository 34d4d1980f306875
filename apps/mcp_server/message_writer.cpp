#include "message_writer.h"

namespace ckmcp::mcp {

bool MessageWriter::write(const std::string& frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << frame << "\n" << std::flush;
  return static_cast<bool>(out_);
}

}  // namespace ckmcp::mcp
