/*****************************************************************
 * File:      HandoffQueue.hpp
 * Category:  include/Application
 * Author:    Bugg Project
 *
 * Purpose:
 *    Bounded FIFO passing work from the recording side to the
 *    upload task. push() never blocks: when full, the oldest item
 *    is dropped and handed back to the caller so capture can never
 *    be held up by a slow network.
 *****************************************************************/

#ifndef BUGG_INCLUDE_APPLICATION_HANDOFF_QUEUE_HPP_
#define BUGG_INCLUDE_APPLICATION_HANDOFF_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace bugg::app{

/** Queue depth for finished segment references */
constexpr size_t FILE_QUEUE_CAPACITY = 64;

/** Queue depth for continuous-mode chunks */
constexpr size_t STREAM_QUEUE_CAPACITY = 50;

/** Thread-safe bounded queue with drop-oldest overflow
 * @tparam T Movable item type
 */
template<typename T>
class HandoffQueue{
public:
  explicit HandoffQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity){}

  HandoffQueue(const HandoffQueue&) = delete;
  HandoffQueue& operator=(const HandoffQueue&) = delete;

  /** Append an item
   * @return The item evicted to make room, if any
   */
  std::optional<T> push(T item){
    std::optional<T> evicted;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(items_.size() >= capacity_){
        evicted = std::move(items_.front());
        items_.pop_front();
        dropped_++;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return evicted;
  }

  /** Wait for an item
   * @param timeout_ms Maximum wait
   * @return The item, or empty on timeout or when closed and drained
   */
  std::optional<T> popWait(uint32_t timeout_ms){
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [this]{ return !items_.empty() || closed_; });
    if(items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  /** Take an item without waiting */
  std::optional<T> tryPop(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  /** Wake all waiters; pushes are still accepted so nothing in flight is lost */
  void close(){
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool isClosed() const{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  bool empty() const{ return size() == 0; }
  size_t capacity() const{ return capacity_; }

  size_t droppedCount() const{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  size_t dropped_ = 0;
  bool closed_ = false;
};

} // namespace bugg::app

#endif // BUGG_INCLUDE_APPLICATION_HANDOFF_QUEUE_HPP_
