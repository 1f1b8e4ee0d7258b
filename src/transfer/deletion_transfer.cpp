#include "transfer/deletion_transfer.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <utility>

namespace blobxfer::transfer {

using State = TransferState::State;

DeletionTransfer::DeletionTransfer(std::unique_ptr<storage::Reference> ref)
  : ref_(std::move(ref))
  , link_(std::make_shared<EventLink<DeletionTransfer>>(this)) {
  if (!ref_) {
    throw std::invalid_argument("Deletion transfer: Reference must not be null");
  }
}

DeletionTransfer::~DeletionTransfer() {
  // A pending backend deletion still runs, its result is dropped
  link_->detach();
}

void DeletionTransfer::start(CompletionFn on_complete) {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());

  if (state_.is_terminal() && !outcome_delivered_) {
    outcome_delivered_ = true;
    if (on_complete) {
      on_complete(TransferError(TransferErrc::CANCELLED));
    }
    return;
  }

  if (state_.has_started()) {
    BOOST_LOG_TRIVIAL(debug) << "Deletion transfer: Already started, ignoring start for " << ref_->name();
    return;
  }

  on_complete_ = std::move(on_complete);
  state_.transition_to(State::STARTED);
  BOOST_LOG_TRIVIAL(info) << "Deletion transfer: Deleting " << ref_->path();

  auto link = link_;
  ref_->remove([link](const std::optional<storage::StorageError>& error) {
    link->dispatch([&](DeletionTransfer& transfer) { transfer.handle_result(error); });
  });
}

void DeletionTransfer::cancel() {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());

  if (!state_.has_started()) {
    BOOST_LOG_TRIVIAL(info) << "Deletion transfer: Cancelled " << ref_->name() << " before start";
    state_.transition_to(State::CANCELLED);
    link_->detach();
    return;
  }

  if (!state_.is_terminal()) {
    BOOST_LOG_TRIVIAL(info) << "Deletion transfer: Deletion of " << ref_->name()
                            << " is already in flight and cannot be cancelled";
  }
}

TransferState::State DeletionTransfer::state() const {
  std::lock_guard<std::recursive_mutex> lock(link_->mutex());
  return state_.get_state();
}

void DeletionTransfer::handle_result(const std::optional<storage::StorageError>& error) {
  if (state_.get_state() != State::STARTED) {
    return;
  }

  std::optional<TransferError> outcome;
  if (error) {
    outcome = download_error_from(*error);
    BOOST_LOG_TRIVIAL(error) << "Deletion transfer: Failed to delete " << ref_->name() << ": " << *outcome;
    state_.transition_to(*outcome == TransferErrc::CANCELLED ? State::CANCELLED : State::FAILED);
  } else {
    BOOST_LOG_TRIVIAL(info) << "Deletion transfer: Deleted " << ref_->path();
    state_.transition_to(State::SUCCEEDED);
  }

  link_->detach();
  outcome_delivered_ = true;
  CompletionFn on_complete = std::move(on_complete_);
  on_complete_ = nullptr;
  if (on_complete) {
    on_complete(outcome);
  }
}

} // namespace blobxfer::transfer
