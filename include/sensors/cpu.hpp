#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace pacer::sensors {

// Aggregate CPU utilization from /proc/stat, computed as the busy share of
// the tick delta between two consecutive calls.
class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  bool sample(float& cpu_percent) noexcept;

  // Drops the previous reading so the next sample() starts a fresh window.
  void reset() noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::uint64_t prev_total_{0};
  std::uint64_t prev_idle_{0};
  bool has_prev_{false};
};

}  // namespace pacer::sensors
