#include "sandbox/output_buffer.hpp"

namespace sandbox {

namespace {
bool IsContinuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}
bool IsLead(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0xC0; }
}  // namespace

size_t Utf8SafePrefix(const char* data, size_t size, size_t limit) {
  if (size <= limit) return size;
  size_t cut = limit;
  while (cut > 0 && IsContinuation(data[cut])) cut--;
  return cut;
}

void BoundedBuffer::Append(const char* data, size_t size) {
  if (truncated_ || size == 0) {
    truncated_ |= size != 0;
    return;
  }
  size_t room = limit_ - data_.size();
  if (size <= room) {
    data_.append(data, size);
    return;
  }
  truncated_ = true;
  size_t keep = Utf8SafePrefix(data, size, room);
  data_.append(data, keep);
  if (keep == 0 && IsContinuation(data[0])) {
    // The cut sequence started in an earlier chunk.
    while (!data_.empty() && IsContinuation(data_.back())) data_.pop_back();
    if (!data_.empty() && IsLead(data_.back())) data_.pop_back();
  }
}

void TailBuffer::Append(const char* data, size_t size) {
  data_.append(data, size);
  if (data_.size() > limit_) data_.erase(0, data_.size() - limit_);
}

}  // namespace sandbox
