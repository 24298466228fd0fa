// Repository: TermReel
// Component: IDistanceTransport Interface
// Purpose: Source of raw distance samples for DistanceSignal.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_SENSOR_IDISTANCE_TRANSPORT_HPP_
#define TERMREEL_SENSOR_IDISTANCE_TRANSPORT_HPP_

#include <string>

namespace termreel::sensor {

enum class SampleStatus {
  kSample,   // value holds a fresh reading
  kTimeout,  // nothing arrived within the transport's read timeout
  kError,    // device failure or malformed read
};

// IDistanceTransport yields one reading per call. Owned and driven by the
// DistanceSignal sampling thread only.
class IDistanceTransport {
 public:
  virtual ~IDistanceTransport() = default;

  virtual bool Open() = 0;
  virtual void Close() = 0;

  // Blocks at most the transport's read timeout.
  virtual SampleStatus ReadSample(float& value) = 0;

  // Device name for logging.
  virtual std::string Describe() const = 0;
};

}  // namespace termreel::sensor

#endif  // TERMREEL_SENSOR_IDISTANCE_TRANSPORT_HPP_
