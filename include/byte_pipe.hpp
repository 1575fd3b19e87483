#ifndef SYNCORE_BYTE_PIPE_HPP
#define SYNCORE_BYTE_PIPE_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "cancellation.hpp"
#include "shared_state/channel.hpp"

namespace syncore {

// Thread-to-thread byte stream over a bounded channel. The writer blocks when
// the pipe holds capacity bytes; the reader blocks when it holds none and
// sees end of stream once the writer closed and everything was read.

using pipe_channel = bounded_channel<std::byte>;

struct pipe_read_result {
  std::size_t count;
  // success with count > 0, closed at end of stream, cancelled
  channel_op_status status;

  bool end_of_stream() const { return status == channel_op_status::closed; }
};

class pipe_writer {
public:
  explicit pipe_writer(std::shared_ptr<pipe_channel> channel)
      : channel_(std::move(channel)) {}

  // Closes the stream
  ~pipe_writer() { close(); }

  pipe_writer(const pipe_writer &) = delete;
  pipe_writer &operator=(const pipe_writer &) = delete;
  pipe_writer(pipe_writer &&) noexcept = default;
  pipe_writer &operator=(pipe_writer &&other) noexcept;

  // Blocks until every byte is in the pipe. On closed or cancelled the bytes
  // written before the failure stay in the pipe.
  channel_op_status write(std::span<const std::byte> data,
                          const cancellation_token &token = {});

  channel_op_status write(std::string_view text,
                          const cancellation_token &token = {}) {
    return write(std::as_bytes(std::span<const char>(text.data(), text.size())),
                 token);
  }

  void close() {
    if (channel_)
      channel_->close();
  }

  std::size_t bytes_written() const noexcept { return written_; }

private:
  std::shared_ptr<pipe_channel> channel_;
  std::size_t written_{0};
};

class pipe_reader {
public:
  explicit pipe_reader(std::shared_ptr<pipe_channel> channel)
      : channel_(std::move(channel)) {}

  // Blocks for the first byte, then drains whatever else is buffered up to
  // buffer.size()
  pipe_read_result read(std::span<std::byte> buffer,
                        const cancellation_token &token = {});

  // Reads until end of stream or cancellation
  std::string read_all(const cancellation_token &token = {});

  std::size_t bytes_read() const noexcept { return read_; }

private:
  std::shared_ptr<pipe_channel> channel_;
  std::size_t read_{0};
};

// Connected writer/reader pair
std::pair<pipe_writer, pipe_reader> make_byte_pipe(std::size_t capacity = 1024);

} // namespace syncore

#endif // SYNCORE_BYTE_PIPE_HPP
