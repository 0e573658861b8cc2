#ifndef __WB_CHANNEL__
#define __WB_CHANNEL__

#include "Headers.hpp"

namespace wb {
/** @brief Outcome of a non-blocking send. */
enum class SendStatus { SENT, FULL, CLOSED };

/** @brief Outcome of a timed receive. */
enum class ReceiveStatus { RECEIVED, TIMEOUT, CLOSED };

/**
 * @brief Multi-producer/multi-consumer FIFO queue shared between threads.
 *
 * With a non-zero capacity the channel is bounded: `send` blocks while the
 * queue is full, which is how a fast producer is throttled down to the speed
 * of its consumer. A capacity of zero makes the channel unbounded.
 *
 * `close` is one-way. After it, every send fails but receivers still drain
 * the items that were already queued before seeing the closed state.
 */
template <typename T>
class Channel {
 public:
  explicit Channel(size_t _capacity) : capacity(_capacity), closed(false) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /**
   * @brief Enqueues `value` if there is room right now. The value is only
   * moved from when the send succeeds, so the caller can retry with it.
   */
  SendStatus trySend(T &value) {
    {
      lock_guard<mutex> guard(queueMutex);
      if (closed) {
        return SendStatus::CLOSED;
      }
      if (isFull()) {
        return SendStatus::FULL;
      }
      queue.push_back(std::move(value));
    }
    notEmpty.notify_one();
    return SendStatus::SENT;
  }

  /**
   * @brief Enqueues `value`, waiting for a free slot if the channel is full.
   * @return false if the channel was closed before the value was queued.
   */
  bool send(T value) {
    {
      unique_lock<mutex> guard(queueMutex);
      notFull.wait(guard, [this] { return closed || !isFull(); });
      if (closed) {
        return false;
      }
      queue.push_back(std::move(value));
    }
    notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Blocks until an item is available.
   * @return nullopt once the channel is closed and drained.
   */
  optional<T> receive() {
    unique_lock<mutex> guard(queueMutex);
    notEmpty.wait(guard, [this] { return closed || !queue.empty(); });
    return popLocked(&guard);
  }

  /** @brief Returns the next queued item without waiting. */
  optional<T> tryReceive() {
    unique_lock<mutex> guard(queueMutex);
    return popLocked(&guard);
  }

  /**
   * @brief Waits up to `timeout` for an item.
   * @param out Receives the item when RECEIVED is returned.
   */
  template <typename Rep, typename Period>
  ReceiveStatus receiveFor(const std::chrono::duration<Rep, Period> &timeout,
                           T *out) {
    unique_lock<mutex> guard(queueMutex);
    bool ready = notEmpty.wait_for(
        guard, timeout, [this] { return closed || !queue.empty(); });
    if (!ready) {
      return ReceiveStatus::TIMEOUT;
    }
    auto item = popLocked(&guard);
    if (!item) {
      return ReceiveStatus::CLOSED;
    }
    *out = std::move(*item);
    return ReceiveStatus::RECEIVED;
  }

  /** @brief Closes the channel and wakes every waiting sender and receiver. */
  void close() {
    {
      lock_guard<mutex> guard(queueMutex);
      closed = true;
    }
    notEmpty.notify_all();
    notFull.notify_all();
  }

  bool isClosed() {
    lock_guard<mutex> guard(queueMutex);
    return closed;
  }

  size_t size() {
    lock_guard<mutex> guard(queueMutex);
    return queue.size();
  }

 protected:
  /** @brief Maximum number of queued items, 0 for unbounded. */
  size_t capacity;
  bool closed;
  std::deque<T> queue;
  mutex queueMutex;
  condition_variable notEmpty;
  condition_variable notFull;

  bool isFull() const { return capacity > 0 && queue.size() >= capacity; }

  optional<T> popLocked(unique_lock<mutex> *guard) {
    if (queue.empty()) {
      return nullopt;
    }
    T item = std::move(queue.front());
    queue.pop_front();
    guard->unlock();
    notFull.notify_one();
    return item;
  }
};
}  // namespace wb

#endif  // __WB_CHANNEL__
