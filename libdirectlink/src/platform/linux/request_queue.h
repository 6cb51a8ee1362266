/**
 * @file request_queue.h
 * @brief Requests handed from the caller's thread to the D-Bus worker
 */

#ifndef DIRECTLINK_REQUEST_QUEUE_H
#define DIRECTLINK_REQUEST_QUEUE_H

#include <deque>
#include <functional>
#include <mutex>
#include <utility>

namespace directlink {
namespace platform {

/**
 * @brief Requests waiting for the worker thread
 *
 * Once the queue is closed, queued and later requests are abandoned instead
 * of run, so a caller still gets an answer after the worker is gone.
 */
class RequestQueue {
public:
  struct Request {
    std::function<void()> run;
    std::function<void()> abandon; // May be empty
  };

  /// Queue a request, or abandon it right away when the queue is closed
  void push(std::function<void()> run,
            std::function<void()> abandon = nullptr) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!closed_) {
        requests_.push_back({std::move(run), std::move(abandon)});
        return;
      }
    }

    if (abandon) {
      abandon();
    }
  }

  /// Run queued requests on the calling thread until none are left
  void run_all() {
    for (;;) {
      Request request;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
          return;
        }
        request = std::move(requests_.front());
        requests_.pop_front();
      }
      request.run();
    }
  }

  /// Stop accepting requests and abandon the ones still queued
  void close() {
    std::deque<Request> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      pending.swap(requests_);
    }

    for (auto &request : pending) {
      if (request.abandon) {
        request.abandon();
      }
    }
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<Request> requests_;
  bool closed_ = false;
};

} // namespace platform
} // namespace directlink

#endif // DIRECTLINK_REQUEST_QUEUE_H
