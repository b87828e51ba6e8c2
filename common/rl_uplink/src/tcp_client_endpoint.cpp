// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/uplink/byte_stream_endpoint.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <rl/common/logging.hpp>

namespace rl {

TcpClientEndpoint::TcpClientEndpoint(const std::string& host, int port, int read_timeout_ms)
  : host_(host)
  , port_(port)
  , read_timeout_ms_(std::max(1, read_timeout_ms))
{
}

TcpClientEndpoint::~TcpClientEndpoint()
{
  close();
}

std::string TcpClientEndpoint::describe() const
{
  return "tcp://" + host_ + ":" + std::to_string(port_);
}

void TcpClientEndpoint::open()
{
  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string port = std::to_string(port_);
  const int rc = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &result);
  if (rc != 0)
  {
    throw std::runtime_error("Failed to resolve " + describe() + ": " + gai_strerror(rc));
  }

  std::string last_error = "no addresses";
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next)
  {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
    {
      last_error = std::strerror(errno);
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
    {
      const int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      fd_ = fd;
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
  }
  ::freeaddrinfo(result);

  if (fd_ < 0)
  {
    throw std::runtime_error("Failed to connect to " + describe() + ": " + last_error);
  }
}

ssize_t TcpClientEndpoint::readSome(uint8_t* buf, size_t n)
{
  if (fd_ < 0)
  {
    return -1;
  }

  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  const int ready = ::poll(&pfd, 1, read_timeout_ms_);
  if (ready == 0)
  {
    return 0;
  }
  if (ready < 0)
  {
    return (errno == EINTR) ? 0 : -1;
  }

  while (true)
  {
    const ssize_t r = ::recv(fd_, buf, n, 0);
    if (r > 0)
    {
      return r;
    }
    if (r == 0)
    {
      // Orderly shutdown by the capture pipeline.
      return -1;
    }
    if (errno == EINTR)
    {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK)
    {
      return 0;
    }
    return -1;
  }
}

void TcpClientEndpoint::close()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace rl
