#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace packwerk {

// Ограниченная FIFO-очередь между потоками.
// capacity == 0: рандеву, push() возвращается только когда элемент забрали.
// close(): новых push нет, потребитель дочитывает остаток.
// abort(): остаток выбрасывается, ждущие push() получают false.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  bool push(T v) {
    std::unique_lock lk(mu_);
    const size_t slots = capacity_ == 0 ? 1 : capacity_;
    cv_.wait(lk, [&] { return closed_ || aborted_ || q_.size() < slots; });
    if (closed_ || aborted_) return false;

    q_.push_back(std::move(v));
    const uint64_t ticket = ++pushed_;
    cv_.notify_all();

    if (capacity_ == 0) {
      cv_.wait(lk, [&] { return aborted_ || popped_ >= ticket; });
      return popped_ >= ticket;
    }
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock lk(mu_);
    cv_.wait(lk, [&] { return aborted_ || closed_ || !q_.empty(); });
    if (aborted_ || q_.empty()) return std::nullopt;

    T v = std::move(q_.front());
    q_.pop_front();
    ++popped_;
    cv_.notify_all();
    return v;
  }

  void close() {
    std::lock_guard lk(mu_);
    closed_ = true;
    cv_.notify_all();
  }

  void abort() {
    std::lock_guard lk(mu_);
    aborted_ = true;
    q_.clear();
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard lk(mu_);
    return closed_ || aborted_;
  }

  size_t size() const {
    std::lock_guard lk(mu_);
    return q_.size();
  }

private:
  mutable std::mutex      mu_;
  std::condition_variable cv_;
  std::deque<T>           q_;
  const size_t            capacity_;
  uint64_t                pushed_ = 0;
  uint64_t                popped_ = 0;
  bool                    closed_ = false;
  bool                    aborted_ = false;
};

} // namespace packwerk
