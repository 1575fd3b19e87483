#ifndef SYNCORE_SUPERVISED_THREAD_HPP
#define SYNCORE_SUPERVISED_THREAD_HPP

#include <concepts>
#include <functional>
#include <thread>
#include <utility>

#include "cancellation.hpp"
#include "shared_state/crtp_base.hpp"

namespace syncore {

/*
  A background worker that is never detached. The supervisor owns the
  cancellation_signal; the body receives a token and is expected to poll it
  and pass it to every blocking call. Destroying the supervised_thread
  requests cancellation and joins, so the worker cannot outlive the state it
  was given. Once the body returns the signal is acknowledged as terminated.
*/
class supervised_thread {
public:
  template <typename Body>
    requires std::invocable<Body, cancellation_token>
  explicit supervised_thread(Body &&body)
      : thread_(&supervised_thread::run, this,
                std::function<void(cancellation_token)>(
                    std::forward<Body>(body))) {}

  ~supervised_thread();

  supervised_thread(const supervised_thread &) = delete;
  supervised_thread &operator=(const supervised_thread &) = delete;
  supervised_thread(supervised_thread &&) = delete;
  supervised_thread &operator=(supervised_thread &&) = delete;

  void request_cancel() { signal_.request_cancel(); }

  // Waits for the body to return. Rethrows an exception that escaped it.
  void join();

  // Cancel, then join
  void stop() {
    request_cancel();
    join();
  }

  bool joinable() const noexcept { return thread_.joinable(); }

  cancellation_status status() const { return signal_.status(); }

  cancellation_token token() const { return signal_.token(); }

private:
  void run(std::function<void(cancellation_token)> body);

  cancellation_signal signal_;
  result_holder result_;
  std::thread thread_;
};

} // namespace syncore

#endif // SYNCORE_SUPERVISED_THREAD_HPP
