#ifndef SANDBOX_OUTPUT_BUFFER_HPP
#define SANDBOX_OUTPUT_BUFFER_HPP

#include <cstddef>
#include <string>

namespace sandbox {

// Returns how many leading bytes of data can be kept without exceeding limit
// and without cutting a UTF-8 sequence in half.
size_t Utf8SafePrefix(const char* data, size_t size, size_t limit);

// Accumulates text up to a fixed number of bytes. Text beyond the limit is
// dropped and the buffer is marked as truncated.
class BoundedBuffer {
 public:
  explicit BoundedBuffer(size_t limit) : limit_(limit) {}

  void Append(const char* data, size_t size);
  void Append(const std::string& data) { Append(data.data(), data.size()); }

  const std::string& Data() const { return data_; }
  bool Truncated() const { return truncated_; }
  size_t Limit() const { return limit_; }

 private:
  std::string data_;
  size_t limit_;
  bool truncated_ = false;
};

// Keeps the last bytes of a stream.
class TailBuffer {
 public:
  explicit TailBuffer(size_t limit) : limit_(limit) {}

  void Append(const char* data, size_t size);
  const std::string& Data() const { return data_; }

 private:
  std::string data_;
  size_t limit_;
};

}  // namespace sandbox

#endif
