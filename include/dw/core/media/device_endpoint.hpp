// File: include/dw/core/media/device_endpoint.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Remote side of the offer/answer exchange, one per device.
class DeviceEndpoint {
 public:
  virtual ~DeviceEndpoint() = default;

  // Trades the local offer for the device's answer SDP. Gives up with kTimeout once `budget`
  // has elapsed; the caller passes whatever is left of its capture deadline.
  virtual Result<std::string> negotiate(const SessionId& session_id, const std::string& offer_sdp,
                                        DurationNs budget) = 0;

  // Idempotent. Callers treat failure as non-fatal.
  virtual Status teardown(const SessionId& session_id) = 0;
};

// Device list plus motion history, supplied by the account the devices belong to.
class DeviceRegistry {
 public:
  virtual ~DeviceRegistry() = default;

  // Reloads device data; called at the top of every scan.
  virtual Status refresh() = 0;

  virtual std::vector<Device> doorbells() const = 0;

  // Most recent motion events for one device, newest first.
  virtual Result<std::vector<MotionSignal>> recent_motion(const Device& device, int limit) = 0;

  virtual std::shared_ptr<DeviceEndpoint> endpoint(const Device& device) = 0;
};

}  // namespace dw
