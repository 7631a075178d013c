#pragma once

#include "alog/core/binary_id.h"

#include <atomic>
#include <mutex>
#include <random>

namespace alog::core {

// Abstract ID generator interface for dependency injection.
// Production code uses random ids while tests use a deterministic sequence.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate a fresh identifier.
  // Contract: the returned id is never nil.
  virtual BinaryId next() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: RFC 4122 version 4 (random) identifiers.
// Thread-safe; the engine is seeded once from std::random_device.
class RandomIdGenerator final : public IIdGenerator {
 public:
  RandomIdGenerator();
  ~RandomIdGenerator() override = default;

  // Not copyable or movable (owns engine state and mutex)
  RandomIdGenerator(const RandomIdGenerator&) = delete;
  RandomIdGenerator& operator=(const RandomIdGenerator&) = delete;
  RandomIdGenerator(RandomIdGenerator&&) = delete;
  RandomIdGenerator& operator=(RandomIdGenerator&&) = delete;

  BinaryId next() override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// Deterministic ID generator: sequential counter only.
// For tests and demos where reproducible output is required.
// Thread-safe. Same sequence of next() calls produces same IDs, starting at 1.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  BinaryId next() override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace alog::core
