#include "transfer/upload_transfer.hpp"
#include "crypto/sealed_box.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <utility>

namespace blobxfer::transfer {

using storage::Snapshot;
using storage::TaskStatus;
using State = TransferState::State;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadTransfer::UploadTransfer(std::unique_ptr<storage::Reference> ref,
                               std::vector<uint8_t> payload,
                               std::optional<crypto::SymmetricKey> key)
  : ref_(std::move(ref))
  , payload_(std::move(payload))
  , key_(std::move(key))
  , latest_progress_{0, static_cast<uint64_t>(payload_.size())}
  , link_(std::make_shared<EventLink<UploadTransfer>>(this)) {
  if (!ref_) {
    throw std::invalid_argument("Upload transfer: Reference must not be null");
  }
  BOOST_LOG_TRIVIAL(debug) << "Upload transfer: Created for " << ref_->path()
                           << " (" << payload_.size() << " bytes, "
                           << (key_ ? "encrypted" : "plain") << ")";
}

UploadTransfer::~UploadTransfer() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  if (state_.has_started() && !state_.is_terminal() && task_) {
    BOOST_LOG_TRIVIAL(warning) << "Upload transfer: Destroyed while uploading " << ref_->name()
                               << ", cancelling backend task";
    task_->cancel();
  }
  link_->detach();
}


//==============================================
// TRANSFER CONTROL
//==============================================

void UploadTransfer::start(ProgressFn on_progress, CompletionFn on_complete) {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());

  if (state_.is_terminal() && !outcome_delivered_) {
    // Cancelled before anyone subscribed
    BOOST_LOG_TRIVIAL(info) << "Upload transfer: Start requested after cancellation of " << ref_->name();
    outcome_delivered_ = true;
    if (on_complete) {
      on_complete(TransferError(TransferErrc::CANCELLED));
    }
    return;
  }

  if (state_.has_started()) {
    BOOST_LOG_TRIVIAL(debug) << "Upload transfer: Already started (" << state_.get_state_string()
                             << "), ignoring start for " << ref_->name();
    return;
  }

  on_progress_ = std::move(on_progress);
  on_complete_ = std::move(on_complete);
  state_.transition_to(State::STARTED);
  BOOST_LOG_TRIVIAL(info) << "Upload transfer: Starting upload of " << ref_->path();

  std::vector<uint8_t> data;
  if (key_) {
    try {
      data = crypto::SealedBox::seal(payload_, *key_);
    } catch (const crypto::CryptoError& e) {
      BOOST_LOG_TRIVIAL(error) << "Upload transfer: Failed to seal payload for " << ref_->name() << ": " << e.what();
      finish(State::FAILED, TransferError(TransferErrc::UNKNOWN, e.what()));
      return;
    }
  } else {
    data = std::move(payload_);
  }
  payload_.clear();

  latest_progress_ = Progress{0, static_cast<uint64_t>(data.size())};
  task_ = ref_->put_data(std::move(data));
  if (!task_) {
    BOOST_LOG_TRIVIAL(error) << "Upload transfer: Backend returned no task for " << ref_->path();
    finish(State::FAILED, TransferError(TransferErrc::UNKNOWN, "Backend returned no upload task"));
    return;
  }

  observe_task();
}

void UploadTransfer::cancel() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());

  if (state_.is_terminal()) {
    BOOST_LOG_TRIVIAL(debug) << "Upload transfer: Cancel ignored, already " << state_.get_state_string();
    return;
  }

  if (!state_.has_started()) {
    BOOST_LOG_TRIVIAL(info) << "Upload transfer: Cancelled " << ref_->name() << " before start";
    state_.transition_to(State::CANCELLED);
    link_->detach();
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Upload transfer: Cancelling upload of " << ref_->name();
  // Do not wait for the backend to acknowledge
  finish(State::CANCELLED, TransferError(TransferErrc::CANCELLED));
  if (task_) {
    task_->cancel();
  }
}

void UploadTransfer::pause() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  if (state_.get_state() == State::STARTED && task_) {
    task_->pause();
  }
}

void UploadTransfer::resume() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  if (state_.get_state() == State::STARTED && task_) {
    task_->resume();
  }
}


//==============================================
// GETTERS
//==============================================

Progress UploadTransfer::latest_progress() const {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  return latest_progress_;
}

TransferState::State UploadTransfer::state() const {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  return state_.get_state();
}


//==============================================
// BACKEND EVENTS
//==============================================

void UploadTransfer::observe_task() {
  auto link = link_;

  task_->observe(TaskStatus::FAILURE, [link](const Snapshot& snapshot) {
    link->dispatch([&](UploadTransfer& transfer) { transfer.handle_failure(snapshot); });
  });
  task_->observe(TaskStatus::SUCCESS, [link](const Snapshot& snapshot) {
    link->dispatch([&](UploadTransfer& transfer) { transfer.handle_success(snapshot); });
  });
  task_->observe(TaskStatus::PAUSE, [link](const Snapshot&) {
    link->dispatch([&](UploadTransfer& transfer) {
      BOOST_LOG_TRIVIAL(debug) << "Upload transfer: Backend paused " << transfer.ref_->name();
    });
  });
  task_->observe(TaskStatus::RESUME, [link](const Snapshot&) {
    link->dispatch([&](UploadTransfer& transfer) {
      BOOST_LOG_TRIVIAL(debug) << "Upload transfer: Backend resumed " << transfer.ref_->name();
    });
  });
  task_->observe(TaskStatus::PROGRESS, [link](const Snapshot& snapshot) {
    link->dispatch([&](UploadTransfer& transfer) { transfer.handle_progress(snapshot); });
  });
}

void UploadTransfer::handle_progress(const Snapshot& snapshot) {
  if (state_.get_state() != State::STARTED || !snapshot.progress) {
    return;
  }

  latest_progress_.update(snapshot.progress->completed_units, snapshot.progress->total_units);
  BOOST_LOG_TRIVIAL(debug) << "Upload transfer: Uploading " << ref_->name() << ": " << latest_progress_;
  deliver_progress();
}

void UploadTransfer::handle_success(const Snapshot& snapshot) {
  if (state_.is_terminal()) {
    return;
  }

  if (snapshot.error) {
    TransferError error = upload_error_from(*snapshot.error);
    BOOST_LOG_TRIVIAL(error) << "Upload transfer: Success event for " << ref_->name()
                             << " carried an error: " << error;
    finish(error == TransferErrc::CANCELLED ? State::CANCELLED : State::FAILED, error);
    return;
  }

  latest_progress_.complete();
  deliver_progress();

  // The consumer may have cancelled from inside the progress callback
  if (state_.is_terminal()) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Upload transfer: Upload of " << ref_->path() << " complete";
  finish(State::SUCCEEDED, std::nullopt);
}

void UploadTransfer::handle_failure(const Snapshot& snapshot) {
  if (state_.is_terminal()) {
    return;
  }

  TransferError error = snapshot.error
    ? upload_error_from(*snapshot.error)
    : TransferError(TransferErrc::UNKNOWN, "Failure reported without an error");
  BOOST_LOG_TRIVIAL(error) << "Upload transfer: Upload of " << ref_->name() << " failed: " << error;
  finish(error == TransferErrc::CANCELLED ? State::CANCELLED : State::FAILED, error);
}


//==============================================
// DELIVERY
//==============================================

void UploadTransfer::deliver_progress() {
  // Copied so a consumer cancelling from inside the callback cannot destroy it mid-call
  ProgressFn on_progress = on_progress_;
  if (on_progress) {
    on_progress(latest_progress_);
  }
}

void UploadTransfer::finish(State terminal, std::optional<TransferError> error) {
  if (!state_.transition_to(terminal)) {
    BOOST_LOG_TRIVIAL(warning) << "Upload transfer: Dropping outcome, invalid transition "
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
