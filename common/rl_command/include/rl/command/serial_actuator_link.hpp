// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <string>

#include <rl/command/actuator_link.hpp>

namespace rl {

bool isSupportedBaudRate(int baud);

//! termios serial port, 8N1, no flow control, opened lazily on write.
class SerialActuatorLink : public ActuatorLink
{
public:
  SerialActuatorLink(const std::string& device, int baud, int write_timeout_ms = 50);
  ~SerialActuatorLink() override;

  SerialActuatorLink(const SerialActuatorLink&) = delete;
  SerialActuatorLink& operator=(const SerialActuatorLink&) = delete;

  //! Throws std::runtime_error if the device cannot be opened or configured.
  void open();
  void close();
  bool isOpen() const { return fd_ >= 0; }

  bool write(const std::string& bytes) override;
  std::string describe() const override;

private:
  const std::string device_;
  const int baud_;
  const int write_timeout_ms_;
  int fd_ = -1;
};

} // namespace rl
