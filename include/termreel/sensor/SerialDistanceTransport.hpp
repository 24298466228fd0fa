// Repository: TermReel
// Component: Serial Distance Transport
// Purpose: Reads 4-byte little-endian float samples from a POSIX serial port.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_SENSOR_SERIAL_DISTANCE_TRANSPORT_HPP_
#define TERMREEL_SENSOR_SERIAL_DISTANCE_TRANSPORT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "termreel/sensor/IDistanceTransport.hpp"

namespace termreel::sensor {

struct SerialConfig {
  std::string device;
  int baud_rate = 115200;
  int read_timeout_ms = 500;
};

// Decodes an IEEE-754 single from 4 little-endian bytes.
float DecodeLittleEndianFloat(const uint8_t bytes[4]);

// 8N1 raw mode, no flow control. Each ReadSample() gathers exactly 4 bytes
// or reports a timeout/error. Bytes of a sample cut short by a timeout are
// kept and completed by the next call, so the stream stays 4-byte aligned;
// an error or Close() discards them.
class SerialDistanceTransport : public IDistanceTransport {
 public:
  explicit SerialDistanceTransport(SerialConfig config);
  ~SerialDistanceTransport() override;

  SerialDistanceTransport(const SerialDistanceTransport&) = delete;
  SerialDistanceTransport& operator=(const SerialDistanceTransport&) = delete;

  bool Open() override;
  void Close() override;
  SampleStatus ReadSample(float& value) override;
  std::string Describe() const override { return config_.device; }

 private:
  bool ConfigurePort();

  SerialConfig config_;
  int fd_ = -1;

  uint8_t partial_[4] = {0, 0, 0, 0};
  std::size_t partial_count_ = 0;
};

}  // namespace termreel::sensor

#endif  // TERMREEL_SENSOR_SERIAL_DISTANCE_TRANSPORT_HPP_
