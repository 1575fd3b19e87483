#include "supervised_thread.hpp"

#include <exception>

namespace syncore {

supervised_thread::~supervised_thread() {
  request_cancel();
  if (thread_.joinable())
    thread_.join();
  // An exception nobody joined for stays in result_ and dies with it
}

void supervised_thread::join() {
  if (thread_.joinable())
    thread_.join();
  result_.get();
}

void supervised_thread::run(std::function<void(cancellation_token)> body) {
  cancellation_token token = signal_.token();
  try {
    body(token);
  } catch (...) {
    result_.set_exception(std::current_exception());
  }
  token.acknowledge_terminated();
}

} // namespace syncore
