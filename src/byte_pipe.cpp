#include "byte_pipe.hpp"

namespace syncore {

pipe_writer &pipe_writer::operator=(pipe_writer &&other) noexcept {
  if (this != &other) {
    close();
    channel_ = std::move(other.channel_);
    written_ = other.written_;
  }
  return *this;
}

channel_op_status pipe_writer::write(std::span<const std::byte> data,
                                     const cancellation_token &token) {
  if (!channel_)
    return channel_op_status::closed;

  for (std::byte b : data) {
    channel_op_status status = channel_->put(b, token);
    if (status != channel_op_status::success)
      return status;
    ++written_;
  }
  return channel_op_status::success;
}

pipe_read_result pipe_reader::read(std::span<std::byte> buffer,
                                   const cancellation_token &token) {
  if (!channel_)
    return {0, channel_op_status::closed};
  if (buffer.empty())
    return {0, channel_op_status::success};

  auto first = channel_->take(token);
  if (!first)
    return {0, first.status};

  std::size_t count = 0;
  buffer[count++] = *first;
  while (count < buffer.size()) {
    auto next = channel_->try_take();
    if (!next)
      break;
    buffer[count++] = *next;
  }
  read_ += count;
  return {count, channel_op_status::success};
}

std::string pipe_reader::read_all(const cancellation_token &token) {
  std::string out;
  std::byte chunk[256];
  for (;;) {
    auto result = read(chunk, token);
    if (result.status != channel_op_status::success)
      break;
    for (std::size_t i = 0; i < result.count; ++i)
      out.push_back(static_cast<char>(chunk[i]));
  }
  return out;
}

std::pair<pipe_writer, pipe_reader> make_byte_pipe(std::size_t capacity) {
  auto channel = make_bounded_channel<std::byte>(capacity);
  return {pipe_writer(channel), pipe_reader(channel)};
}

} // namespace syncore
