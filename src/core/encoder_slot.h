// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_ENCODER_SLOT_H_
#define REELCORE_CORE_ENCODER_SLOT_H_

#include <memory>
#include <mutex>
#include <utility>

#include "core/video_encoder.h"

namespace reelcore {
namespace internal {

/// Exclusive cell holding the session's encoder.
///
/// The capture thread feeds frames through WithEncoder(); at stop time the
/// encoder is moved out with Take() and handed to the finalizer.  After a
/// Take() the slot stays empty until the next Put().
class EncoderSlot {
 public:
  EncoderSlot() = default;

  // Non-copyable.
  EncoderSlot(const EncoderSlot&) = delete;
  EncoderSlot& operator=(const EncoderSlot&) = delete;

  void Put(std::unique_ptr<VideoEncoder> encoder) {
    std::lock_guard<std::mutex> lock(mu_);
    encoder_ = std::move(encoder);
  }

  /// Move the encoder out.  Returns nullptr if the slot is empty.
  std::unique_ptr<VideoEncoder> Take() {
    std::lock_guard<std::mutex> lock(mu_);
    return std::move(encoder_);
  }

  /// Run `fn(VideoEncoder*)` under the slot lock.  `fn` is not called when
  /// the slot is empty.
  /// @return false if the slot was empty.
  template <typename Fn>
  bool WithEncoder(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!encoder_) return false;
    fn(encoder_.get());
    return true;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return encoder_ == nullptr;
  }

 private:
  mutable std::mutex mu_;
  std::unique_ptr<VideoEncoder> encoder_;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_ENCODER_SLOT_H_
