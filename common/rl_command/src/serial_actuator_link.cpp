// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/command/serial_actuator_link.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <rl/common/logging.hpp>

namespace rl {

namespace {

speed_t to_speed(int baud)
{
  switch (baud)
  {
  case 9600: return B9600;
  case 19200: return B19200;
  case 38400: return B38400;
  case 57600: return B57600;
  case 115200: return B115200;
  case 230400: return B230400;
  case 460800: return B460800;
  case 921600: return B921600;
  default: return B115200;
  }
}

} // namespace

bool isSupportedBaudRate(const int baud)
{
  switch (baud)
  {
  case 9600:
  case 19200:
  case 38400:
  case 57600:
  case 115200:
  case 230400:
  case 460800:
  case 921600:
    return true;
  default:
    return false;
  }
}

SerialActuatorLink::SerialActuatorLink(const std::string& device,
                                       const int baud,
                                       const int write_timeout_ms)
  : device_(device)
  , baud_(baud)
  , write_timeout_ms_(write_timeout_ms)
{
  if (!isSupportedBaudRate(baud_))
  {
    LOG(WARNING) << "[Serial] Unsupported baud rate " << baud_ << "; using 115200.";
  }
}

SerialActuatorLink::~SerialActuatorLink()
{
  close();
}

std::string SerialActuatorLink::describe() const
{
  return device_ + "@" + std::to_string(baud_);
}

void SerialActuatorLink::open()
{
  if (fd_ >= 0)
  {
    return;
  }
  const int fd = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0)
  {
    throw std::runtime_error("Failed to open serial device " + device_ + ": " +
                             std::strerror(errno));
  }

  termios tty{};
  if (tcgetattr(fd, &tty) != 0)
  {
    ::close(fd);
    throw std::runtime_error("Failed to read serial attributes of " + device_);
  }

  cfsetospeed(&tty, to_speed(baud_));
  cfsetispeed(&tty, to_speed(baud_));

  tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
  tty.c_iflag &= ~IGNBRK;
  tty.c_lflag = 0;
  tty.c_oflag = 0;
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~(PARENB | PARODD);
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CRTSCTS;

  if (tcsetattr(fd, TCSANOW, &tty) != 0)
  {
    ::close(fd);
    throw std::runtime_error("Failed to set serial attributes of " + device_);
  }
  fd_ = fd;
  LOG(INFO) << "[Serial] Opened " << describe();
}

void SerialActuatorLink::close()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialActuatorLink::write(const std::string& bytes)
{
  if (fd_ < 0)
  {
    try
    {
      open();
    }
    catch (const std::exception& e)
    {
      static int warned_open = 0;
      if (warned_open++ < 3)
      {
        LOG(WARNING) << "[Serial] " << e.what();
      }
      return false;
    }
  }

  size_t offset = 0;
  while (offset < bytes.size())
  {
    const ssize_t w = ::write(fd_, bytes.data() + offset, bytes.size() - offset);
    if (w > 0)
    {
      offset += static_cast<size_t>(w);
      continue;
    }
    if (w < 0 && errno == EINTR)
    {
      continue;
    }
    if (w == 0 || errno == EAGAIN || errno == EWOULDBLOCK)
    {
      pollfd pfd{};
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      const int pr = ::poll(&pfd, 1, write_timeout_ms_);
      if (pr > 0 && (pfd.revents & POLLOUT))
      {
        continue;
      }
      if (pr < 0 && errno == EINTR)
      {
        continue;
      }
      LOG(WARNING) << "[Serial] Write to " << device_ << " timed out after "
                   << write_timeout_ms_ << "ms.";
      close();
      return false;
    }
    LOG(WARNING) << "[Serial] Write to " << device_ << " failed: " << std::strerror(errno);
    close();
    return false;
  }
  return true;
}

} // namespace rl
