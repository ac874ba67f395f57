// Copyright 2026 The reelcore Authors

#include "delivery/range_server.h"

#include <sys/socket.h>

#include <chrono>
#include <functional>
#include <utility>

#include "httplib.h"

#include "core/logger.h"

namespace reelcore {
namespace internal {

namespace {

constexpr std::chrono::milliseconds kListenTimeout(2000);

}  // namespace

RangeServer::RangeServer(std::shared_ptr<const MappedArtifact> artifact)
    : artifact_(std::move(artifact)) {}

RangeServer::~RangeServer() { Stop(); }

std::string RangeServer::url() const {
  if (port_ < 0) return std::string();
  return "http://" + host_ + ":" + std::to_string(port_) + "/";
}

void RangeServer::RegisterHandlers(const std::string& allowed_origin) {
  // CORS headers go on every response, preflight included.
  server_->set_pre_routing_handler(
      [allowed_origin](const httplib::Request&, httplib::Response& res) {
        if (!allowed_origin.empty()) {
          res.set_header("Access-Control-Allow-Origin", allowed_origin);
        }
        res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Range");
        res.set_header("Access-Control-Expose-Headers",
                       "Content-Range, Content-Length, Accept-Ranges");
        return httplib::Server::HandlerResponse::Unhandled;
      });

  server_->Options("/", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  std::shared_ptr<const MappedArtifact> artifact = artifact_;
  server_->Get("/", [artifact](const httplib::Request& req,
                               httplib::Response& res) {
    REELCORE_LOG_DEBUG("GET / (Range: {})",
                       req.has_header("Range") ? req.get_header_value("Range")
                                               : std::string("none"));
    res.set_header("Accept-Ranges", "bytes");
    // httplib slices the provider output for Range requests and fills in
    // the 206 status and Content-Range.
    res.set_content_provider(
        artifact->size(), "video/mp4",
        [artifact](size_t offset, size_t length, httplib::DataSink& sink) {
          if (offset >= artifact->size()) return false;
          if (length > artifact->size() - offset) {
            length = artifact->size() - offset;
          }
          return sink.write(
              reinterpret_cast<const char*>(artifact->data()) + offset,
              length);
        });
  });
}

bool WaitForAcceptLoop(const std::function<bool()>& is_listening,
                       const std::atomic<bool>& thread_alive,
                       std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!is_listening()) {
    if (!thread_alive.load() || std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

ReelCoreError RangeServer::Start(const RangeServerConfig& config) {
  if (!artifact_ || artifact_->size() == 0) {
    REELCORE_LOG_ERROR("Range server: nothing to serve");
    return kReelCoreErrorEmptyArtifact;
  }
  if (running_.load()) {
    REELCORE_LOG_WARN("Range server already running on port {}", port_);
    return kReelCoreOk;
  }

  server_.reset(new httplib::Server());
  // SO_REUSEADDR only; with SO_REUSEPORT two servers could share a port.
  server_->set_socket_options([](httplib::socket_t sock) {
    int yes = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                 reinterpret_cast<const void*>(&yes), sizeof(yes));
  });
  RegisterHandlers(config.allowed_origin);

  int bound = -1;
  for (int i = 0; i < config.port_attempts; ++i) {
    int candidate = config.base_port + i;
    if (candidate > 65535) break;
    if (server_->bind_to_port(config.host, candidate)) {
      bound = candidate;
      break;
    }
    REELCORE_LOG_DEBUG("Port {} unavailable", candidate);
  }

  if (bound < 0) {
    REELCORE_LOG_ERROR("No free port in [{}, {})", config.base_port,
                       config.base_port + config.port_attempts);
    server_.reset();
    return kReelCoreErrorNoAvailablePort;
  }

  host_ = config.host;
  port_ = bound;
  running_.store(true);
  thread_ = std::thread([this]() {
    if (!server_->listen_after_bind()) {
      REELCORE_LOG_WARN("Range server on port {} stopped listening", port_);
    }
    running_.store(false);
  });
  // wait_until_ready() alone spins forever if listen fails at once.
  httplib::Server* server = server_.get();
  if (!WaitForAcceptLoop([server]() { return server->is_running(); },
                         running_, kListenTimeout)) {
    REELCORE_LOG_ERROR("Range server on port {} failed to start listening",
                       port_);
    Stop();
    return kReelCoreErrorNoAvailablePort;
  }

  REELCORE_LOG_INFO("Serving {} ({} bytes) at {}", artifact_->path(),
                    artifact_->size(), url());
  return kReelCoreOk;
}

void RangeServer::Stop() {
  if (server_) server_->stop();
  if (thread_.joinable()) {
    thread_.join();
    REELCORE_LOG_INFO("Range server on port {} stopped", port_);
  }
  server_.reset();
  running_.store(false);
  port_ = -1;
}

}  // namespace internal
}  // namespace reelcore
