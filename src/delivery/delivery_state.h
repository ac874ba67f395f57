// Copyright 2026 The reelcore Authors

#ifndef REELCORE_DELIVERY_DELIVERY_STATE_H_
#define REELCORE_DELIVERY_DELIVERY_STATE_H_

#include <memory>
#include <string>
#include <vector>

#include "delivery/artifact_reader.h"
#include "delivery/mapped_artifact.h"
#include "delivery/range_server.h"
#include "reelcore/reelcore.h"

namespace reelcore {
namespace internal {

/// Whatever keeps the last artifact reachable by the caller: a chunk cursor,
/// or a mapped view plus the server reading from it.  Whole-file delivery
/// leaves both empty.
struct DeliveryState {
  ReelCoreDeliveryMode mode = kReelCoreDeliveryWhole;
  std::string path;

  std::shared_ptr<const MappedArtifact> mapped;
  // Declared after `mapped` so the server is destroyed (and stopped) first.
  std::unique_ptr<RangeServer> server;
  std::unique_ptr<ChunkReader> chunks;

  std::vector<int> bound_ports;

  ~DeliveryState() {
    if (server) server->Stop();
  }
};

}  // namespace internal
}  // namespace reelcore

#endif  // REELCORE_DELIVERY_DELIVERY_STATE_H_
