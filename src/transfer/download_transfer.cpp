#include "transfer/download_transfer.hpp"
#include "crypto/sealed_box.hpp"
#include "utils/file_utils.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace blobxfer::transfer {

namespace fs = std::filesystem;
using storage::Snapshot;
using storage::TaskStatus;
using State = TransferState::State;

namespace {

const char* const COMPONENT = "Download transfer";
const char* const TEMP_PREFIX = "blobxfer-";
const char* const STAGING_SUFFIX = ".blobxfer-partial";

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DownloadTransfer::DownloadTransfer(std::unique_ptr<storage::Reference> ref,
                                   fs::path destination,
                                   std::optional<crypto::SymmetricKey> key,
                                   std::shared_ptr<utils::WorkQueue> finalizer,
                                   fs::path temp_root)
  : ref_(std::move(ref))
  , destination_(std::move(destination))
  , key_(std::move(key))
  , finalizer_(std::move(finalizer))
  , temp_root_(std::move(temp_root))
  , link_(std::make_shared<EventLink<DownloadTransfer>>(this)) {
  if (!ref_) {
    throw std::invalid_argument("Download transfer: Reference must not be null");
  }
  if (!finalizer_) {
    throw std::invalid_argument("Download transfer: Finalizer queue must not be null");
  }
  if (destination_.filename().empty()) {
    throw std::invalid_argument("Download transfer: Destination must name a file: " + destination_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Download transfer: Created for " << ref_->path()
                           << " -> " << destination_.string()
                           << (key_ ? " (decrypting)" : "");
}

DownloadTransfer::~DownloadTransfer() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  State current = state_.get_state();
  if (current == State::STARTED || current == State::DOWNLOADING) {
    BOOST_LOG_TRIVIAL(warning) << "Download transfer: Destroyed while downloading " << ref_->name()
                               << ", cancelling backend task";
    if (task_) {
      task_->cancel();
    }
    utils::remove_all_quietly(temp_dir_, COMPONENT);
  }
  // A finalization job in flight finds the link detached and cleans up after itself
  link_->detach();
}


//==============================================
// TRANSFER CONTROL
//==============================================

void DownloadTransfer::start(ProgressFn on_progress, CompletionFn on_complete) {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());

  if (state_.is_terminal() && !outcome_delivered_) {
    // Cancelled before anyone subscribed
    BOOST_LOG_TRIVIAL(info) << "Download transfer: Start requested after cancellation of " << ref_->name();
    outcome_delivered_ = true;
    if (on_complete) {
      on_complete(TransferError(TransferErrc::CANCELLED));
    }
    return;
  }

  if (state_.has_started()) {
    BOOST_LOG_TRIVIAL(debug) << "Download transfer: Already started (" << state_.get_state_string()
                             << "), ignoring start for " << ref_->name();
    return;
  }

  on_progress_ = std::move(on_progress);
  on_complete_ = std::move(on_complete);
  state_.transition_to(State::STARTED);
  BOOST_LOG_TRIVIAL(info) << "Download transfer: Starting download of " << ref_->path();

  try {
    temp_dir_ = utils::create_private_directory(temp_root_, TEMP_PREFIX);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Download transfer: Failed to create temporary directory: " << e.what();
    finish(State::FAILED, TransferError(TransferErrc::DISK_IO,
      utils::describe_filesystem_error("Create temporary directory", e)));
    return;
  }
  temp_file_ = temp_dir_ / destination_.filename();

  task_ = ref_->write_to_file(temp_file_);
  if (!task_) {
    BOOST_LOG_TRIVIAL(error) << "Download transfer: Backend returned no task for " << ref_->path();
    utils::remove_all_quietly(temp_dir_, COMPONENT);
    finish(State::FAILED, TransferError(TransferErrc::UNKNOWN, "Backend returned no download task"));
    return;
  }

  state_.transition_to(State::DOWNLOADING);
  observe_task();
}

void DownloadTransfer::cancel() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());

  if (state_.is_terminal()) {
    BOOST_LOG_TRIVIAL(debug) << "Download transfer: Cancel ignored, already " << state_.get_state_string();
    return;
  }

  if (!state_.has_started()) {
    BOOST_LOG_TRIVIAL(info) << "Download transfer: Cancelled " << ref_->name() << " before start";
    state_.transition_to(State::CANCELLED);
    link_->detach();
    return;
  }

  State previous = state_.get_state();
  BOOST_LOG_TRIVIAL(info) << "Download transfer: Cancelling download of " << ref_->name()
                          << " while " << previous;

  if (task_) {
    task_->cancel();
  }
  // Once finalizing, the finalization job owns the temporary directory
  if (previous != State::FINALIZING) {
    utils::remove_all_quietly(temp_dir_, COMPONENT);
  }
  finish(State::CANCELLED, TransferError(TransferErrc::CANCELLED));
}

void DownloadTransfer::pause() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  if (state_.get_state() == State::DOWNLOADING && task_) {
    task_->pause();
  }
}

void DownloadTransfer::resume() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  if (state_.get_state() == State::DOWNLOADING && task_) {
    task_->resume();
  }
}


//==============================================
// GETTERS
//==============================================

Progress DownloadTransfer::latest_progress() const {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  return latest_progress_;
}

TransferState::State DownloadTransfer::state() const {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  return state_.get_state();
}

fs::path DownloadTransfer::temporary_directory() const {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  return temp_dir_;
}


//==============================================
// BACKEND EVENTS
//==============================================

void DownloadTransfer::observe_task() {
  auto link = link_;

  task_->observe(TaskStatus::FAILURE, [link](const Snapshot& snapshot) {
    link->dispatch([&](DownloadTransfer& transfer) { transfer.handle_failure(snapshot); });
  });
  task_->observe(TaskStatus::SUCCESS, [link](const Snapshot& snapshot) {
    link->dispatch([&](DownloadTransfer& transfer) { transfer.handle_success(snapshot); });
  });
  task_->observe(TaskStatus::PAUSE, [link](const Snapshot&) {
    link->dispatch([](DownloadTransfer& transfer) {
      BOOST_LOG_TRIVIAL(debug) << "Download transfer: Backend paused " << transfer.ref_->name();
    });
  });
  task_->observe(TaskStatus::RESUME, [link](const Snapshot&) {
    link->dispatch([](DownloadTransfer& transfer) {
      BOOST_LOG_TRIVIAL(debug) << "Download transfer: Backend resumed " << transfer.ref_->name();
    });
  });
  task_->observe(TaskStatus::PROGRESS, [link](const Snapshot& snapshot) {
    link->dispatch([&](DownloadTransfer& transfer) { transfer.handle_progress(snapshot); });
  });
}

void DownloadTransfer::handle_progress(const Snapshot& snapshot) {
  if (state_.get_state() != State::DOWNLOADING || !snapshot.progress) {
    return;
  }

  latest_progress_.update(snapshot.progress->completed_units, snapshot.progress->total_units);
  BOOST_LOG_TRIVIAL(debug) << "Download transfer: Downloading " << ref_->name() << ": " << latest_progress_;
  deliver_progress();
}

void DownloadTransfer::handle_failure(const Snapshot& snapshot) {
  if (state_.get_state() != State::DOWNLOADING) {
    return;
  }

  TransferError error = snapshot.error
    ? download_error_from(*snapshot.error)
    : TransferError(TransferErrc::UNKNOWN, "Failure reported without an error");
  BOOST_LOG_TRIVIAL(error) << "Download transfer: Download of " << ref_->name() << " failed: " << error;

  utils::remove_all_quietly(temp_dir_, COMPONENT);
  finish(error == TransferErrc::CANCELLED ? State::CANCELLED : State::FAILED, error);
}

void DownloadTransfer::handle_success(const Snapshot& snapshot) {
  if (state_.get_state() != State::DOWNLOADING) {
    return;
  }

  if (snapshot.error) {
    handle_failure(snapshot);
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Download transfer: Download of " << ref_->name() << " complete, finalizing";
  state_.transition_to(State::FINALIZING);
  latest_progress_.complete();
  deliver_progress();

  // The consumer may have cancelled from inside the progress callback
  if (state_.get_state() != State::FINALIZING) {
    utils::remove_all_quietly(temp_dir_, COMPONENT);
    return;
  }

  Finalization job{temp_dir_, temp_file_, destination_, key_};
  auto link = link_;
  bool queued = finalizer_->post([link, job]() { finalize(link, job); });
  if (!queued) {
    utils::remove_all_quietly(temp_dir_, COMPONENT);
    finish(State::FAILED, TransferError(TransferErrc::UNKNOWN, "Finalization worker is shut down"));
  }
}


//==============================================
// FINALIZATION
//==============================================

void DownloadTransfer::finalize(EventLinkPtr<DownloadTransfer> link, Finalization job) {
  fs::path staging;
  std::optional<TransferError> error;

  // Decrypting and copying happen outside the link so event delivery is never stalled
  try {
    staging = staging_path_for(job.destination);
    stage_output(job, staging);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Download transfer: Failed to decrypt " << job.temp_file.string() << ": " << e.what();
    error = TransferError(TransferErrc::DECRYPTION_FAILURE, e.what());
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Download transfer: Failed to stage " << job.destination.string() << ": " << e.what();
    error = TransferError(TransferErrc::DISK_IO, utils::describe_filesystem_error("Stage download", e));
  } catch (const std::exception& e) {
    // Out of memory on a large file, among others
    BOOST_LOG_TRIVIAL(error) << "Download transfer: Failed to finalize " << job.destination.string() << ": " << e.what();
    error = TransferError(TransferErrc::UNKNOWN, std::string("Finalize download: ") + e.what());
  }

  bool placed_or_failed = false;
  link->dispatch([&](DownloadTransfer& transfer) {
    if (transfer.state_.get_state() != State::FINALIZING) {
      return;
    }
    placed_or_failed = true;

    if (!error) {
      try {
        place_output(staging, job.destination);
      } catch (const fs::filesystem_error& e) {
        BOOST_LOG_TRIVIAL(error) << "Download transfer: Failed to place " << job.destination.string() << ": " << e.what();
        error = TransferError(TransferErrc::DISK_IO, utils::describe_filesystem_error("Place download", e));
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Download transfer: Failed to place " << job.destination.string() << ": " << e.what();
        error = TransferError(TransferErrc::UNKNOWN, std::string("Place download: ") + e.what());
      }
    }

    if (error) {
      utils::remove_all_quietly(staging, COMPONENT);
    }
    utils::remove_all_quietly(job.temp_dir, COMPONENT);

    if (error) {
      transfer.finish(State::FAILED, error);
    } else {
      BOOST_LOG_TRIVIAL(info) << "Download transfer: Placed " << transfer.ref_->name()
                              << " at " << job.destination.string();
      transfer.finish(State::SUCCEEDED, std::nullopt);
    }
  });

  if (!placed_or_failed) {
    // Cancelled or destroyed while finalizing
    BOOST_LOG_TRIVIAL(info) << "Download transfer: Discarding finalized output for " << job.destination.string();
    utils::remove_all_quietly(staging, COMPONENT);
    utils::remove_all_quietly(job.temp_dir, COMPONENT);
  }
}

void DownloadTransfer::stage_output(const Finalization& job, const fs::path& staging) {
  if (job.destination.has_parent_path()) {
    fs::create_directories(job.destination.parent_path());
  }

  if (job.key) {
    std::vector<uint8_t> sealed = utils::read_file(job.temp_file);
    std::vector<uint8_t> plaintext = crypto::SealedBox::open(sealed, *job.key);
    utils::write_file(staging, plaintext);
    return;
  }

  std::error_code ec;
  fs::rename(job.temp_file, staging, ec);
  if (ec == std::errc::cross_device_link) {
    // Temporary root lives on another filesystem
    fs::copy_file(job.temp_file, staging, fs::copy_options::overwrite_existing);
    fs::remove(job.temp_file);
  } else if (ec) {
    throw fs::filesystem_error("Failed to move downloaded file", job.temp_file, staging, ec);
  }
}

void DownloadTransfer::place_output(const fs::path& staging, const fs::path& destination) {
  std::error_code ec;
  fs::remove(destination, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Download transfer: Failed to remove existing " << destination.string()
                               << ": " << ec.message();
  }
  fs::rename(staging, destination);
}

fs::path DownloadTransfer::staging_path_for(const fs::path& destination) {
  // Unique per job so concurrent downloads to one destination never share a staging file
  return destination.parent_path() /
    ("." + destination.filename().string() + "." + utils::random_hex(8) + STAGING_SUFFIX);
}


//==============================================
// DELIVERY
//==============================================

void DownloadTransfer::deliver_progress() {
  // Copied so a consumer cancelling from inside the callback cannot destroy it mid-call
  ProgressFn on_progress = on_progress_;
  if (on_progress) {
    on_progress(latest_progress_);
  }
}

void DownloadTransfer::finish(State terminal, std::optional<TransferError> error) {
  if (!state_.transition_to(terminal)) {
    BOOST_LOG_TRIVIAL(warning) << "Download transfer: Dropping outcome, invalid transition "
                               << state_.get_state() << " -> " << terminal;
    return;
  }

  link_->detach();
  on_progress_ = nullptr;
  CompletionFn on_complete = std::move(on_complete_);
  on_complete_ = nullptr;
  outcome_delivered_ = true;

  if (on_complete) {
    on_complete(error);
  }
}

} // namespace blobxfer::transfer
