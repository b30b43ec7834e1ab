#include "sensors/memory.hpp"

#include <cstring>

namespace pacer::sensors {

MemorySensor::MemorySensor() : meminfo_(std::fopen("/proc/meminfo", "r")) {}

MemorySensor::MemorySensor(std::FILE* meminfo, const bool owns_file) : meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

bool MemorySensor::sample(float& memory_percent) noexcept {
  memory_percent = 0.0F;
  if (!parse_meminfo()) {
    return false;
  }

  const std::uint64_t available =
      raw_.mem_available_kb <= raw_.mem_total_kb ? raw_.mem_available_kb : raw_.mem_total_kb;
  const std::uint64_t used = raw_.mem_total_kb - available;
  memory_percent = (static_cast<float>(used) / static_cast<float>(raw_.mem_total_kb)) * 100.0F;
  return true;
}

const MemorySensor::RawFields& MemorySensor::raw() const noexcept { return raw_; }

bool MemorySensor::parse_meminfo() noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_.mem_total_kb = 0;
  raw_.mem_available_kb = 0;

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu kB", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw_.mem_total_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw_.mem_available_kb = value;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }

  return raw_.mem_total_kb != 0;
}

}  // namespace pacer::sensors
