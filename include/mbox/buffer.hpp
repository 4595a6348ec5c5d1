#ifndef MBOX_BUFFER_HPP_
#define MBOX_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <algorithm>
#include <vector>

namespace mbox {

// ============================================================================
// ByteBuffer - contiguous FIFO of bytes with a hard size cap
// ============================================================================
//
// Bytes are appended at the back and consumed from the front. Storage grows
// on demand up to `limit` readable bytes, which bounds per-connection memory
// to one frame. Consumed space is reclaimed lazily when it outweighs the
// readable part.

class ByteBuffer {
 public:
  explicit ByteBuffer(size_t limit) : limit_(limit) {}

  // Append `len` bytes. Fails without side effects when the cap would be hit.
  bool push(const uint8_t* data, size_t len) {
    if (available() < len)
      return false;
    if (len == 0)
      return true;
    compact();
    storage_.insert(storage_.end(), data, data + len);
    return true;
  }

  bool push(const std::vector<uint8_t>& data) { return push(data.data(), data.size()); }

  // Reserve `len` writable bytes at the back (clamped to the cap) and return
  // a pointer to them. Follow with commit_write() for the bytes actually
  // filled.
  uint8_t* prepare(size_t* len) {
    *len = std::min(*len, available());
    compact();
    pending_ = *len;
    size_t old_size = storage_.size();
    storage_.resize(old_size + pending_);
    return storage_.data() + old_size;
  }

  void commit_write(size_t len) {
    if (len > pending_)
      len = pending_;
    storage_.resize(storage_.size() - (pending_ - len));
    pending_ = 0;
  }

  // Copy up to `max_len` readable bytes without consuming them.
  size_t peek(uint8_t* data, size_t max_len) const {
    size_t len = std::min(max_len, size());
    if (len > 0)
      std::memcpy(data, storage_.data() + read_idx_, len);
    return len;
  }

  // Pointer to the readable bytes; valid until the next mutation.
  const uint8_t* read_ptr() const { return storage_.data() + read_idx_; }

  // Drop `len` bytes from the front.
  void advance(size_t len) {
    if (len > size())
      len = size();
    read_idx_ += len;
    if (read_idx_ == storage_.size()) {
      storage_.clear();
      read_idx_ = 0;
    }
  }

  size_t size() const { return storage_.size() - read_idx_; }
  size_t available() const { return limit_ - size(); }
  size_t limit() const { return limit_; }
  bool empty() const { return size() == 0; }

  void clear() {
    storage_.clear();
    read_idx_ = 0;
    pending_ = 0;
  }

 private:
  void compact() {
    if (read_idx_ > 0 && read_idx_ >= size()) {
      storage_.erase(storage_.begin(), storage_.begin() + static_cast<std::ptrdiff_t>(read_idx_));
      read_idx_ = 0;
    }
  }

  std::vector<uint8_t> storage_;
  size_t read_idx_ = 0;
  size_t pending_ = 0;
  size_t limit_;
};

}  // namespace mbox

#endif  // MBOX_BUFFER_HPP_
