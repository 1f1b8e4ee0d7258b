#include "store/local_backend.hpp"
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace blobxfer {
namespace store {

using storage::Snapshot;
using storage::StorageError;
using storage::StorageErrorCode;
using storage::TaskProgress;
using storage::TaskStatus;

//==============================================
// SHARED BACKEND STATE
//==============================================

struct LocalBackend::Core {
  Core(const std::filesystem::path& root, LocalBackendOptions opts)
    : options(opts)
    , store(root, opts.chunk_size)
    , pool(opts.worker_threads == 0 ? 1 : opts.worker_threads) {}

  LocalBackendOptions options;
  Store store;
  boost::asio::thread_pool pool;

  std::mutex mutex;
  bool shut_down = false;
  std::optional<std::string> user_id;

  // Queues job on the pool, returns false once shut down
  template <typename Job>
  bool submit(Job&& job) {
    std::lock_guard<std::mutex> lock(mutex);
    if (shut_down) {
      return false;
    }
    boost::asio::post(pool, std::forward<Job>(job));
    return true;
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (shut_down) {
        return;
      }
      shut_down = true;
    }
    BOOST_LOG_TRIVIAL(info) << "Local backend: Shutting down, waiting for running tasks";
    pool.join();
  }
};

namespace {

std::string last_segment(const std::string& path) {
  std::string::size_type slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string normalize_path(const std::string& path) {
  std::string result;
  bool previous_slash = false;
  for (char c : path) {
    if (c == '/') {
      if (previous_slash) {
        continue;
      }
      previous_slash = true;
    } else {
      previous_slash = false;
    }
    result += c;
  }
  if (result.empty() || result.front() != '/') {
    result.insert(result.begin(), '/');
  }
  return result;
}


//==============================================
// TASK STATE
//==============================================

// State shared between a LocalTask handle and the job running it
class TaskCore {
public:
  explicit TaskCore(std::shared_ptr<const storage::Reference> reference)
    : reference_(std::move(reference)) {}

  std::string observe(TaskStatus status, storage::SnapshotHandler handler) {
    std::unique_lock<std::mutex> lock(mutex_);
    std::string handle = std::to_string(next_handle_++);
    if (terminal_status_) {
      // Late observers of the terminal status still hear about it once
      if (*terminal_status_ == status && handler) {
        Snapshot snapshot = terminal_snapshot_;
        lock.unlock();
        handler(snapshot);
      }
      return handle;
    }
    observers_.emplace(handle, std::make_pair(status, std::move(handler)));
    return handle;
  }

  void remove_observer(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(handle);
  }

  void emit(TaskStatus status, std::optional<StorageError> error = std::nullopt) {
    std::vector<storage::SnapshotHandler> handlers;
    Snapshot snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminal_status_) {
        return;
      }
      snapshot = make_snapshot(std::move(error));
      for (const auto& entry : observers_) {
        if (entry.second.first == status && entry.second.second) {
          handlers.push_back(entry.second.second);
        }
      }
      if (storage::is_terminal_status(status)) {
        terminal_status_ = status;
        terminal_snapshot_ = snapshot;
        observers_.clear();
      }
    }
    if (status != TaskStatus::PROGRESS) {
      BOOST_LOG_TRIVIAL(trace) << "Local backend: Task on " << reference_->path() << " reported "
                               << storage::task_status_to_string(status) << " to " << handlers.size()
                               << " observer(s)";
    }
    for (const auto& handler : handlers) {
      handler(snapshot);
    }
  }

  void set_progress(uint64_t completed, std::optional<uint64_t> total) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.completed_units = completed;
    progress_.total_units = total;
  }

  bool pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_ || terminal_status_) {
      return false;
    }
    paused_ = true;
    return true;
  }

  bool resume() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!paused_ || terminal_status_) {
        return false;
      }
      paused_ = false;
    }
    resumed_.notify_all();
    return true;
  }

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    resumed_.notify_all();
  }

  bool cancelled() const { return cancelled_; }

  // Blocks the job while paused, returns false when cancelled
  bool wait_while_paused() {
    std::unique_lock<std::mutex> lock(mutex_);
    resumed_.wait(lock, [this] { return !paused_ || cancelled_; });
    return !cancelled_;
  }

private:
  std::shared_ptr<const storage::Reference> reference_;
  std::mutex mutex_;
  std::condition_variable resumed_;
  std::atomic<bool> cancelled_{false};
  bool paused_ = false;
  TaskProgress progress_;
  uint64_t next_handle_ = 0;
  std::map<std::string, std::pair<TaskStatus, storage::SnapshotHandler>> observers_;
  std::optional<TaskStatus> terminal_status_;
  Snapshot terminal_snapshot_;

  Snapshot make_snapshot(std::optional<StorageError> error) const {
    Snapshot snapshot;
    snapshot.progress = progress_;
    snapshot.error = std::move(error);
    snapshot.reference = reference_;
    return snapshot;
  }
};

class LocalTask : public storage::Task {
public:
  explicit LocalTask(std::shared_ptr<TaskCore> core) : core_(std::move(core)) {}

  void pause() override {
    if (core_->pause()) {
      core_->emit(TaskStatus::PAUSE);
    }
  }

  void resume() override {
    if (core_->resume()) {
      core_->emit(TaskStatus::RESUME);
    }
  }

  void cancel() override { core_->cancel(); }

  std::string observe(TaskStatus status, storage::SnapshotHandler handler) override {
    return core_->observe(status, std::move(handler));
  }

  void remove_observer(const std::string& handle) override { core_->remove_observer(handle); }

private:
  std::shared_ptr<TaskCore> core_;
};


//==============================================
// TASK JOBS
//==============================================

// Chunk callback shared by uploads and downloads: honours pause and cancel,
// then reports the bytes moved so far
ChunkCallback progress_reporter(const std::shared_ptr<TaskCore>& task,
                                std::chrono::milliseconds step_delay,
                                uint64_t total) {
  return [task, step_delay, total](uint64_t bytes_so_far) {
    if (!task->wait_while_paused()) {
      return false;
    }
    if (step_delay.count() > 0) {
      std::this_thread::sleep_for(step_delay);
    }
    task->set_progress(bytes_so_far, total);
    task->emit(TaskStatus::PROGRESS);
    return !task->cancelled();
  };
}

void run_put(const std::shared_ptr<LocalBackend::Core>& core, const std::shared_ptr<TaskCore>& task,
             const std::string& path, const std::vector<uint8_t>& data) {
  const uint64_t total = data.size();
  task->set_progress(0, total);
  if (task->cancelled()) {
    task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::CANCELLED, "Upload cancelled"));
    return;
  }

  try {
    std::istringstream input(std::string(data.begin(), data.end()));
    bool stored = core->store.store(path, input, progress_reporter(task, core->options.step_delay, total));
    if (!stored) {
      BOOST_LOG_TRIVIAL(info) << "Local backend: Upload of " << path << " cancelled";
      task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::CANCELLED, "Upload cancelled"));
      return;
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Upload of " << path << " failed: " << e.what();
    task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::UNKNOWN, e.what()));
    return;
  }

  task->set_progress(total, total);
  task->emit(TaskStatus::SUCCESS);
}

void run_write_to_file(const std::shared_ptr<LocalBackend::Core>& core, const std::shared_ptr<TaskCore>& task,
                       const std::string& path, const std::filesystem::path& local_path) {
  if (task->cancelled()) {
    task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::CANCELLED, "Download cancelled"));
    return;
  }

  try {
    const uint64_t total = core->store.get_file_size(path);
    task->set_progress(0, total);

    bool complete = false;
    {
      std::ofstream output(local_path, std::ios::binary | std::ios::trunc);
      if (!output) {
        throw StoreError("Local backend: Cannot open " + local_path.string() + " for writing");
      }
      complete = core->store.get(path, output, progress_reporter(task, core->options.step_delay, total));
      output.flush();
      if (!output) {
        throw StoreError("Local backend: Failed writing " + local_path.string());
      }
    }

    if (!complete) {
      BOOST_LOG_TRIVIAL(info) << "Local backend: Download of " << path << " cancelled";
      std::error_code ec;
      std::filesystem::remove(local_path, ec);
      task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::CANCELLED, "Download cancelled"));
      return;
    }
    task->set_progress(total, total);
  } catch (const ObjectNotFoundError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Local backend: " << e.what();
    task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::OBJECT_NOT_FOUND, e.what()));
    return;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Local backend: Download of " << path << " failed: " << e.what();
    task->emit(TaskStatus::FAILURE, StorageError::from_code(StorageErrorCode::UNKNOWN, e.what()));
    return;
  }

  task->emit(TaskStatus::SUCCESS);
}


//==============================================
// REFERENCE
//==============================================

class LocalReference : public storage::Reference {
public:
  LocalReference(std::shared_ptr<LocalBackend::Core> core, std::string path)
    : core_(std::move(core)), path_(std::move(path)) {}

  std::string name() const override { return last_segment(path_); }
  std::string path() const override { return path_; }

  std::unique_ptr<storage::Reference> clone() const override {
    return std::make_unique<LocalReference>(core_, path_);
  }

  std::unique_ptr<storage::Task> put_data(std::vector<uint8_t> data) override {
    BOOST_LOG_TRIVIAL(debug) << "Local backend: put " << path_ << " (" << data.size() << " bytes)";
    auto task = make_task_core();
    auto core = core_;
    std::string path = path_;
    bool queued = core_->submit([core, task, path, data = std::move(data)]() {
      run_put(core, task, path, data);
    });
    if (!queued) {
      task->emit(TaskStatus::FAILURE, shut_down_error());
    }
    return std::make_unique<LocalTask>(task);
  }

  std::unique_ptr<storage::Task> write_to_file(const std::filesystem::path& local_path) override {
    BOOST_LOG_TRIVIAL(debug) << "Local backend: get " << path_ << " -> " << local_path.string();
    auto task = make_task_core();
    auto core = core_;
    std::string path = path_;
    bool queued = core_->submit([core, task, path, local_path]() {
      run_write_to_file(core, task, path, local_path);
    });
    if (!queued) {
      task->emit(TaskStatus::FAILURE, shut_down_error());
    }
    return std::make_unique<LocalTask>(task);
  }

  void remove(storage::DeletionHandler completion) override {
    auto core = core_;
    std::string path = path_;
    bool queued = core_->submit([core, path, completion]() {
      std::optional<StorageError> error;
      try {
        core->store.remove(path);
      } catch (const ObjectNotFoundError& e) {
        error = StorageError::from_code(StorageErrorCode::OBJECT_NOT_FOUND, e.what());
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Local backend: Delete of " << path << " failed: " << e.what();
        error = StorageError::from_code(StorageErrorCode::UNKNOWN, e.what());
      }
      if (completion) {
        completion(error);
      }
    });
    if (!queued && completion) {
      completion(shut_down_error());
    }
  }

  void download_url(storage::DownloadUrlHandler completion) override {
    auto core = core_;
    std::string path = path_;
    bool queued = core_->submit([core, path, completion]() {
      std::optional<std::string> url;
      std::optional<StorageError> error;
      try {
        if (core->store.has(path)) {
          url = "file://" + std::filesystem::absolute(core->store.resolve_key_path(path)).string();
        } else {
          error = StorageError::from_code(StorageErrorCode::OBJECT_NOT_FOUND, "Object not found: " + path);
        }
      } catch (const std::exception& e) {
        error = StorageError::from_code(StorageErrorCode::UNKNOWN, e.what());
      }
      if (completion) {
        completion(url, error);
      }
    });
    if (!queued && completion) {
      completion(std::nullopt, shut_down_error());
    }
  }

private:
  std::shared_ptr<LocalBackend::Core> core_;
  std::string path_;

  std::shared_ptr<TaskCore> make_task_core() const {
    return std::make_shared<TaskCore>(std::shared_ptr<const storage::Reference>(clone()));
  }

  static StorageError shut_down_error() {
    return StorageError::from_code(StorageErrorCode::CANCELLED, "Local backend is shut down");
  }
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalBackend::LocalBackend(const std::filesystem::path& root, LocalBackendOptions options)
  : core_(std::make_shared<Core>(root, options)) {
  BOOST_LOG_TRIVIAL(info) << "Local backend: Serving " << root.string() << " with "
                          << options.worker_threads << " worker thread(s)";
}

LocalBackend::~LocalBackend() {
  shutdown();
}


//==============================================
// REFERENCES
//==============================================

std::unique_ptr<storage::Reference> LocalBackend::reference(const std::string& path) const {
  return std::make_unique<LocalReference>(core_, normalize_path(path));
}

std::unique_ptr<storage::Reference> LocalBackend::user_reference(const std::string& relative_path) const {
  auto user = user_id();
  if (!user) {
    return nullptr;
  }
  return reference("/" + *user + "/" + relative_path);
}


//==============================================
// SESSION
//==============================================

void LocalBackend::sign_in(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(core_->mutex);
  core_->user_id = user_id;
  BOOST_LOG_TRIVIAL(info) << "Local backend: Signed in as " << user_id;
}

void LocalBackend::sign_out() {
  std::lock_guard<std::mutex> lock(core_->mutex);
  core_->user_id.reset();
  BOOST_LOG_TRIVIAL(info) << "Local backend: Signed out";
}

std::optional<std::string> LocalBackend::user_id() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->user_id;
}


//==============================================
// DIRECT ACCESS
//==============================================

bool LocalBackend::has_object(const std::string& path) const {
  return core_->store.has(normalize_path(path));
}

std::vector<uint8_t> LocalBackend::read_object(const std::string& path) const {
  std::ostringstream output;
  core_->store.get(normalize_path(path), output);
  const std::string bytes = output.str();
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

void LocalBackend::write_object(const std::string& path, const std::vector<uint8_t>& data) {
  std::istringstream input(std::string(data.begin(), data.end()));
  core_->store.store(normalize_path(path), input);
}

Store& LocalBackend::store() {
  return core_->store;
}

void LocalBackend::shutdown() {
  core_->shutdown();
}

} // namespace store
} // namespace blobxfer
