// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace rl {

using real_t = double;

using Vector2 = Eigen::Matrix<real_t, 2, 1>;
using Vector4 = Eigen::Matrix<real_t, 4, 1>;

using Bytes = std::vector<uint8_t>;

//! Nanoseconds on the process-local monotonic clock.
using TimestampNs = int64_t;

} // namespace rl
