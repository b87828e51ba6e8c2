// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <ostream>

#include <rl/common/types.hpp>

namespace rl {

//! A handle composed of a slot index plus the generation of the container
//! that issued it. Containers that are rebuilt wholesale (e.g. a Session after
//! a reconnect) bump their generation, so handles issued before the rebuild
//! compare unequal and are rejected by isCurrent().
//! Generation 0 is reserved for "never issued".
template <typename T, int NumSlotBits, int NumGenerationBits>
struct GenerationHandle
{
  static_assert(NumSlotBits + NumGenerationBits <= static_cast<int>(sizeof(T) * 8),
                "Handle bits exceed storage type.");

  using value_t = T;

  static constexpr T maxSlot() { return (T{1} << NumSlotBits) - 1; }
  static constexpr T maxGeneration() { return (T{1} << NumGenerationBits) - 1; }

  T handle{0};

  GenerationHandle() = default;
  explicit GenerationHandle(T h) : handle(h) {}
  GenerationHandle(T slot, T generation)
    : handle(static_cast<T>((slot & maxSlot())
                            | ((generation & maxGeneration()) << NumSlotBits)))
  {}

  inline T slot() const { return static_cast<T>(handle & maxSlot()); }
  inline T generation() const
  {
    return static_cast<T>((handle >> NumSlotBits) & maxGeneration());
  }

  inline bool valid() const { return generation() != T{0}; }

  //! True if the handle was issued by the container at `generation`.
  inline bool isCurrent(const T generation) const
  {
    return valid() && this->generation() == (generation & maxGeneration());
  }

  //! Next generation number, skipping the reserved 0 on wrap-around.
  static T nextGeneration(const T generation)
  {
    const T next = static_cast<T>((generation + 1) & maxGeneration());
    return next == T{0} ? T{1} : next;
  }

  void reset() { handle = T{0}; }
};

template <typename T, int NumSlotBits, int NumGenerationBits>
inline bool operator==(const GenerationHandle<T, NumSlotBits, NumGenerationBits> lhs,
                       const GenerationHandle<T, NumSlotBits, NumGenerationBits> rhs)
{
  return lhs.handle == rhs.handle;
}

template <typename T, int NumSlotBits, int NumGenerationBits>
inline bool operator!=(const GenerationHandle<T, NumSlotBits, NumGenerationBits> lhs,
                       const GenerationHandle<T, NumSlotBits, NumGenerationBits> rhs)
{
  return !(lhs == rhs);
}

//! Orders by raw value (generation, then slot).
template <typename T, int NumSlotBits, int NumGenerationBits>
inline bool operator<(const GenerationHandle<T, NumSlotBits, NumGenerationBits> lhs,
                      const GenerationHandle<T, NumSlotBits, NumGenerationBits> rhs)
{
  return lhs.handle < rhs.handle;
}

template <typename T, int NumSlotBits, int NumGenerationBits>
inline std::ostream& operator<<(
    std::ostream& out, const GenerationHandle<T, NumSlotBits, NumGenerationBits> handle)
{
  out << handle.handle
      << " (slot: " << handle.slot() << ", generation: " << handle.generation() << ")";
  return out;
}

} // namespace rl
