// Copyright 2026 The reelcore Authors

#ifndef REELCORE_CORE_INPUT_BACKEND_H_
#define REELCORE_CORE_INPUT_BACKEND_H_

#include <functional>
#include <memory>
#include <string>

namespace reelcore {
namespace internal {

/// Global pointer state at one instant.
struct PointerState {
  int x = 0;                // Virtual desktop coordinates
  int y = 0;
  std::string cursor_name;  // Platform cursor name, empty if unknown
};

/// Abstract interface for global pointer polling and button notifications.
class InputBackend {
 public:
  using ButtonCallback = std::function<void()>;

  virtual ~InputBackend() = default;

  // Non-copyable.
  InputBackend(const InputBackend&) = delete;
  InputBackend& operator=(const InputBackend&) = delete;

  /// Read the current pointer position and cursor.  Called from the input
  /// sampler thread only.
  /// @return false if the pointer could not be queried.
  virtual bool QueryPointer(PointerState* out_state) = 0;

  /// Start delivering primary-button press/release notifications.  The
  /// callbacks run on a dispatch thread owned by the backend.
  /// @return false if the subscription could not be established.
  virtual bool Subscribe(ButtonCallback on_press,
                         ButtonCallback on_release) = 0;

  /// Stop notifications and join the dispatch thread.  Idempotent.
  virtual void Unsubscribe() = 0;

 protected:
  InputBackend() = default;
};

/// Factory function implemented per-platform.
std::unique_ptr<InputBackend> CreatePlatformInputBackend();

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_CORE_INPUT_BACKEND_H_
