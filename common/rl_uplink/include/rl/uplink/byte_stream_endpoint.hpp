// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>
#include <string>

#include <sys/types.h>

#include <rl/common/types.hpp>

namespace rl {

//! Source of the encoded video byte stream.
class ByteStreamEndpoint
{
public:
  using Ptr = std::shared_ptr<ByteStreamEndpoint>;

  virtual ~ByteStreamEndpoint() = default;

  //! Establishes the stream. Throws std::runtime_error on failure.
  virtual void open() = 0;

  //! Returns >0 bytes read, 0 if no data arrived within the read timeout,
  //! -1 if the stream closed or failed.
  virtual ssize_t readSome(uint8_t* buf, size_t n) = 0;

  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  virtual std::string describe() const = 0;
};

//! Client side of a TCP byte stream (e.g. gstreamer's tcpserversink).
class TcpClientEndpoint : public ByteStreamEndpoint
{
public:
  TcpClientEndpoint(const std::string& host, int port, int read_timeout_ms = 100);
  ~TcpClientEndpoint() override;

  void open() override;
  ssize_t readSome(uint8_t* buf, size_t n) override;
  void close() override;
  bool isOpen() const override { return fd_ >= 0; }
  std::string describe() const override;

private:
  std::string host_;
  int port_ = 0;
  int read_timeout_ms_ = 100;
  int fd_ = -1;
};

} // namespace rl
