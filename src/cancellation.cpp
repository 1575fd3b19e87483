#include "cancellation.hpp"

namespace syncore {

void cancellation_state::request_cancel() {
  auto expected = cancellation_status::running;
  if (!status_.compare_exchange_strong(expected,
                                       cancellation_status::cancel_requested,
                                       std::memory_order_acq_rel))
    return; // already requested or terminated

  fire_callbacks();
}

void cancellation_state::acknowledge_terminated() {
  auto previous =
      status_.exchange(cancellation_status::terminated, std::memory_order_acq_rel);

  // Waiters registered on a task that finishes without being cancelled still
  // have to observe the terminal state.
  if (previous == cancellation_status::running)
    fire_callbacks();
}

std::size_t cancellation_state::register_callback(std::function<void()> cb) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_cancelled()) {
      std::size_t id = next_id_++;
      callbacks_.push_back(std::move(cb));
      callback_ids_.push_back(id);
      return id;
    }
  }
  cb();
  return 0;
}

void cancellation_state::unregister_callback(std::size_t id) {
  if (id == 0)
    return;
  std::unique_lock<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < callback_ids_.size(); ++i) {
    if (callback_ids_[i] == id) {
      callbacks_.erase(callbacks_.begin() + static_cast<std::ptrdiff_t>(i));
      callback_ids_.erase(callback_ids_.begin() +
                          static_cast<std::ptrdiff_t>(i));
      return;
    }
  }
  callback_done_.wait(lock, [this, id] { return running_id_ != id; });
}

void cancellation_state::fire_callbacks() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!callbacks_.empty()) {
    auto cb = std::move(callbacks_.back());
    running_id_ = callback_ids_.back();
    callbacks_.pop_back();
    callback_ids_.pop_back();

    lock.unlock();
    cb();
    lock.lock();

    running_id_ = 0;
    callback_done_.notify_all();
  }
}

} // namespace syncore
