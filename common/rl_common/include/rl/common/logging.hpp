// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <gflags/gflags.h>
#include <glog/logging.h>

//! Checks that are only evaluated in debug builds.
#ifndef NDEBUG
#define RL_DEBUG_CHECK(cond) CHECK(cond)
#define RL_DEBUG_CHECK_EQ(a, b) CHECK_EQ(a, b)
#define RL_DEBUG_CHECK_LE(a, b) CHECK_LE(a, b)
#else
#define RL_DEBUG_CHECK(cond) DCHECK(cond)
#define RL_DEBUG_CHECK_EQ(a, b) DCHECK_EQ(a, b)
#define RL_DEBUG_CHECK_LE(a, b) DCHECK_LE(a, b)
#endif

