// Repository: TermReel
// Component: Serial Distance Transport
// Copyright (c) 2025 TermReel

#include "termreel/sensor/SerialDistanceTransport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include "termreel/util/Logger.hpp"

namespace termreel::sensor {

using termreel::util::Logger;

namespace {

speed_t BaudConstant(int baud_rate) {
  switch (baud_rate) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    default: return 0;
  }
}

}  // namespace

float DecodeLittleEndianFloat(const uint8_t bytes[4]) {
  const uint32_t bits = static_cast<uint32_t>(bytes[0]) |
                        (static_cast<uint32_t>(bytes[1]) << 8) |
                        (static_cast<uint32_t>(bytes[2]) << 16) |
                        (static_cast<uint32_t>(bytes[3]) << 24);
  float value = 0.0f;
  static_assert(sizeof(value) == sizeof(bits), "float must be 32-bit");
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

SerialDistanceTransport::SerialDistanceTransport(SerialConfig config)
    : config_(std::move(config)) {}

SerialDistanceTransport::~SerialDistanceTransport() {
  Close();
}

bool SerialDistanceTransport::Open() {
  if (fd_ >= 0) {
    return true;
  }
  partial_count_ = 0;
  fd_ = ::open(config_.device.c_str(), O_RDONLY | O_NOCTTY | O_CLOEXEC);
  if (fd_ < 0) {
    Logger::Error("[SerialDistanceTransport] open FAILED device=" + config_.device +
                  " error=" + std::strerror(errno));
    return false;
  }
  if (!ConfigurePort()) {
    Close();
    return false;
  }
  std::ostringstream oss;
  oss << "[SerialDistanceTransport] Opened " << config_.device << " @" << config_.baud_rate;
  Logger::Info(oss.str());
  return true;
}

bool SerialDistanceTransport::ConfigurePort() {
  const speed_t speed = BaudConstant(config_.baud_rate);
  if (speed == 0) {
    std::ostringstream oss;
    oss << "[SerialDistanceTransport] Unsupported baud rate " << config_.baud_rate;
    Logger::Error(oss.str());
    return false;
  }

  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    Logger::Error("[SerialDistanceTransport] tcgetattr FAILED device=" + config_.device +
                  " error=" + std::strerror(errno));
    return false;
  }
  cfmakeraw(&tty);
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CREAD | CLOCAL;
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;
  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);
  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    Logger::Error("[SerialDistanceTransport] tcsetattr FAILED device=" + config_.device +
                  " error=" + std::strerror(errno));
    return false;
  }
  tcflush(fd_, TCIFLUSH);
  return true;
}

void SerialDistanceTransport::Close() {
  partial_count_ = 0;
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

SampleStatus SerialDistanceTransport::ReadSample(float& value) {
  if (fd_ < 0) {
    return SampleStatus::kError;
  }

  while (partial_count_ < sizeof(partial_)) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, config_.read_timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      Logger::Warn("[SerialDistanceTransport] poll FAILED error=" +
                   std::string(std::strerror(errno)));
      partial_count_ = 0;
      return SampleStatus::kError;
    }
    if (ready == 0) {
      // partial_ keeps what has arrived so far.
      return SampleStatus::kTimeout;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
      Logger::Warn("[SerialDistanceTransport] device hangup device=" + config_.device);
      partial_count_ = 0;
      return SampleStatus::kError;
    }

    const ssize_t n = ::read(fd_, partial_ + partial_count_, sizeof(partial_) - partial_count_);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      Logger::Warn("[SerialDistanceTransport] read FAILED error=" +
                   std::string(std::strerror(errno)));
      partial_count_ = 0;
      return SampleStatus::kError;
    }
    if (n == 0) {
      partial_count_ = 0;
      return SampleStatus::kError;
    }
    partial_count_ += static_cast<std::size_t>(n);
  }

  partial_count_ = 0;
  value = DecodeLittleEndianFloat(partial_);
  return SampleStatus::kSample;
}

}  // namespace termreel::sensor
