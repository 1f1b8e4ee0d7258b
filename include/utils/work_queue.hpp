#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

namespace blobxfer {
namespace utils {

// Single worker thread running posted jobs in order.
// Jobs that throw are logged and do not stop the worker.
class WorkQueue {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit WorkQueue(std::string name);
  ~WorkQueue();

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;


  // ---- JOB SUBMISSION ----
  // Queues a job, returns false once the queue is shut down
  bool post(std::function<void()> job);


  // ---- TEARDOWN ----
  // Runs the remaining jobs, then joins the worker. Must not be called from a job.
  void shutdown();


  // ---- QUERY METHODS ----
  bool running_in_this_thread() const;
  const std::string& name() const { return name_; }

private:
  // ---- PARAMETERS ----
  std::string name_;
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::thread worker_;
  std::atomic<bool> is_running_;
  // Orders post() against shutdown()
  std::mutex mutex_;

  // Worker loop, restarts the io_context after a job throws
  void run();
};

} // namespace utils
} // namespace blobxfer
