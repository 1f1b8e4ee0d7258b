#include "utils/work_queue.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <utility>

namespace blobxfer {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

WorkQueue::WorkQueue(std::string name)
  : name_(std::move(name))
  , work_(boost::asio::make_work_guard(io_context_))
  , is_running_(true) {
  worker_ = std::thread(&WorkQueue::run, this);
  BOOST_LOG_TRIVIAL(debug) << "Work queue: Started worker '" << name_ << "'";
}

WorkQueue::~WorkQueue() {
  shutdown();
}


//==============================================
// JOB SUBMISSION
//==============================================

bool WorkQueue::post(std::function<void()> job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Work queue: Rejected job, '" << name_ << "' is shut down";
    return false;
  }
  boost::asio::post(io_context_, std::move(job));
  return true;
}


//==============================================
// TEARDOWN
//==============================================

void WorkQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_running_.exchange(false)) {
      return;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Work queue: Draining worker '" << name_ << "'";

  // Let run() return once the queued jobs are done
  work_.reset();
  if (worker_.joinable()) {
    worker_.join();
  }

  BOOST_LOG_TRIVIAL(debug) << "Work queue: Worker '" << name_ << "' stopped";
}


//==============================================
// QUERY METHODS
//==============================================

bool WorkQueue::running_in_this_thread() const {
  return std::this_thread::get_id() == worker_.get_id();
}

void WorkQueue::run() {
  for (;;) {
    try {
      io_context_.run();
      return;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Work queue: Job on '" << name_ << "' failed: " << e.what();
    }
  }
}

} // namespace utils
} // namespace blobxfer
