#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pacer::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

int parse_positive_int(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0 || parsed > 1'000'000) {
    throw std::runtime_error(key + " must be in range 1..1000000");
  }
  return static_cast<int>(parsed);
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (!(parsed >= 0.0)) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return parsed;
}

double parse_positive(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (!(parsed > 0.0)) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

float parse_percent(const std::string& key, const std::string& value) {
  const float parsed = std::stof(value);
  if (!(parsed > 0.0F) || parsed > 100.0F) {
    throw std::runtime_error(key + " must be in range (0, 100]");
  }
  return parsed;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(EngineConfig& config, const std::string& key, const std::string& value) {
  if (key == "pool.min_workers") {
    config.pool.min_workers = static_cast<std::size_t>(parse_positive_int(key, value));
  } else if (key == "pool.max_workers") {
    config.pool.max_workers = static_cast<std::size_t>(parse_positive_int(key, value));
  } else if (key == "pool.cpu_threshold") {
    config.pool.cpu_threshold = parse_percent(key, value);
  } else if (key == "pool.memory_threshold") {
    config.pool.memory_threshold = parse_percent(key, value);
  } else if (key == "sampler.enabled") {
    config.sampler.enabled = parse_bool(value);
  } else if (key == "sampler.interval_ms") {
    config.sampler.interval = std::chrono::milliseconds(parse_positive_int(key, value));
  } else if (key == "sampler.cpu_window_ms") {
    config.sampler.cpu_window = std::chrono::milliseconds(static_cast<long long>(parse_non_negative(key, value)));
  } else if (key == "rate.initial_rate") {
    config.rate.initial_rate = parse_positive_int(key, value);
  } else if (key == "rate.min_rate") {
    config.rate.min_rate = parse_positive_int(key, value);
  } else if (key == "rate.max_rate") {
    config.rate.max_rate = parse_positive_int(key, value);
  } else if (key == "rate.window_s") {
    config.rate.window_s = parse_positive(key, value);
  } else if (key == "rate.limiter_window_s") {
    config.rate.limiter_window_s = parse_positive(key, value);
  } else if (key == "delay.base_s") {
    config.delay.base_s = parse_non_negative(key, value);
  } else if (key == "delay.jitter_s") {
    config.delay.jitter_s = parse_non_negative(key, value);
  } else if (key == "retry.max_retries") {
    const auto parsed = std::stoll(value);
    if (parsed < 0 || parsed > 32) {
      throw std::runtime_error("retry.max_retries must be in range 0..32");
    }
    config.retry.max_retries = static_cast<unsigned>(parsed);
  } else if (key == "retry.backoff_factor") {
    config.retry.backoff_factor = parse_non_negative(key, value);
  } else if (key == "threads.base_count") {
    config.thread_base_count = parse_positive_int(key, value);
  } else if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
  } else if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
  } else if (key == "redis.address") {
    apply_redis_address(config.redis, value);
  } else if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
  } else if (key == "redis.stream_maxlen") {
    config.redis.stream_maxlen = static_cast<std::size_t>(parse_positive_int(key, value));
  }
}

}  // namespace

void validate_engine_config(const EngineConfig& config) {
  if (config.pool.min_workers == 0) {
    throw std::runtime_error("pool.min_workers must be greater than 0");
  }
  if (config.pool.max_workers < config.pool.min_workers) {
    throw std::runtime_error("pool.max_workers must be greater than or equal to pool.min_workers");
  }
  if (config.rate.min_rate <= 0) {
    throw std::runtime_error("rate.min_rate must be greater than 0");
  }
  if (config.rate.max_rate < config.rate.min_rate) {
    throw std::runtime_error("rate.max_rate must be greater than or equal to rate.min_rate");
  }
  if (config.rate.initial_rate < config.rate.min_rate || config.rate.initial_rate > config.rate.max_rate) {
    throw std::runtime_error("rate.initial_rate must lie within [rate.min_rate, rate.max_rate]");
  }
}

EngineConfig load_engine_config(const std::string& path) {
  EngineConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.resize(depth);
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_engine_config(config);
  return config;
}

}  // namespace pacer::core
