#ifndef BLOBXFER_EVENT_LINK_HPP
#define BLOBXFER_EVENT_LINK_HPP

#include <memory>
#include <mutex>

namespace blobxfer::transfer {

// Back-reference from backend callbacks to the transfer that registered them.
// The transfer owns the link and detaches it once it reaches a terminal state
// or is destroyed; callbacks holding the link become no-ops from then on.
// The mutex is recursive so a consumer may call back into the transfer
// (cancel, accessors) from inside a delivered event.
template <typename Target>
class EventLink {
public:
  explicit EventLink(Target* target) : target_(target) {}

  EventLink(const EventLink&) = delete;
  EventLink& operator=(const EventLink&) = delete;

  // Runs fn against the target while holding the link, returns false once detached
  template <typename Fn>
  bool dispatch(Fn&& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!target_) {
      return false;
    }
    fn(*target_);
    return true;
  }

  void detach() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    target_ = nullptr;
  }

  bool attached() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return target_ != nullptr;
  }

  std::recursive_mutex& mutex() const { return mutex_; }

private:
  mutable std::recursive_mutex mutex_;
  Target* target_;
};

template <typename Target>
using EventLinkPtr = std::shared_ptr<EventLink<Target>>;

} // namespace blobxfer::transfer

#endif // BLOBXFER_EVENT_LINK_HPP
