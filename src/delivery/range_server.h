// Copyright 2026 The reelcore Authors

#ifndef REELCORE_DELIVERY_RANGE_SERVER_H_
#define REELCORE_DELIVERY_RANGE_SERVER_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "delivery/mapped_artifact.h"
#include "reelcore/reelcore.h"

namespace httplib {
class Server;
}  // namespace httplib

namespace reelcore {
namespace internal {

struct RangeServerConfig {
  std::string host = "127.0.0.1";
  int base_port = 17890;
  int port_attempts = 20;
  std::string allowed_origin;
};

/// Poll `is_listening` until it holds.  Gives up as soon as `thread_alive`
/// drops (the accept loop already returned) or after `timeout`.
bool WaitForAcceptLoop(const std::function<bool()>& is_listening,
                       const std::atomic<bool>& thread_alive,
                       std::chrono::milliseconds timeout);

/// Local HTTP server exposing one mapped artifact at "/" with byte-range
/// support.
///
/// GET returns 200 with the full body, or 206 with Content-Range when the
/// request carries a satisfiable Range header.  OPTIONS returns 204.  CORS
/// headers admit `allowed_origin` only.
class RangeServer {
 public:
  explicit RangeServer(std::shared_ptr<const MappedArtifact> artifact);
  ~RangeServer();

  // Non-copyable.
  RangeServer(const RangeServer&) = delete;
  RangeServer& operator=(const RangeServer&) = delete;

  /// Bind the first free port in [base_port, base_port + port_attempts) and
  /// start the accept thread.
  /// @return kReelCoreErrorNoAvailablePort when every port is taken.
  ReelCoreError Start(const RangeServerConfig& config);

  /// Stop accepting, close the listening socket and join the accept thread.
  /// Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(); }

  /// Bound port, or -1 before a successful Start().
  int port() const { return port_; }

  /// "http://<host>:<port>/".  Empty before a successful Start().
  std::string url() const;

 private:
  void RegisterHandlers(const std::string& allowed_origin);

  std::shared_ptr<const MappedArtifact> artifact_;
  std::unique_ptr<httplib::Server> server_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::string host_;
  int port_ = -1;
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_DELIVERY_RANGE_SERVER_H_
