#pragma once

#include <monitor/support/unit.hpp>

#include <fmt/core.h>

#include <wheels/core/assert.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace monitor::satellite {

/////////////////////////////////////////////////////////////////////////////

// Named event counters. Not synchronized: the owner increments and gathers
// them under its own lock.

template <bool CollectMetrics>
class Logger {
 public:
  class Metrics;

  explicit Logger(const std::vector<std::string>&) {
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void Increment(std::string_view, size_t) {
  }

  Metrics GatherMetrics() const {
    return Metrics();
  }

  class Metrics {
   public:
    Metrics() = default;

    Metrics(const Metrics&) = default;
    Metrics& operator=(const Metrics&) = default;

    Metrics(Metrics&&) = default;
    Metrics& operator=(Metrics&&) = default;

    void Print() const {
    }

    Unit Data() && {
      return {};
    }
  };
};

/////////////////////////////////////////////////////////////////////////////

template <>
class Logger<true> {
 public:
  class Metrics;

  Logger() = delete;

  explicit Logger(const std::vector<std::string>& names)
      : counters_(names.size(), 0) {
    for (size_t i = 0; i < names.size(); ++i) {
      indices_[names[i]] = i;
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void Increment(std::string_view name, size_t diff) {
    auto pos = indices_.find(name);

    WHEELS_VERIFY(pos != indices_.end(), "You must use a valid metric name!");

    counters_[pos->second] += diff;
  }

  Metrics GatherMetrics() const {
    return Metrics(*this);
  }

  /////////////////////////////////////////////////////////////////////////////

  class Metrics {
    friend class Logger<true>;

   public:
    Metrics() = delete;

    Metrics(const Metrics&) = default;
    Metrics& operator=(const Metrics&) = default;

    Metrics(Metrics&&) = default;
    Metrics& operator=(Metrics&&) = default;

    void Print() const {
      for (const auto& [name, count] : data_) {
        fmt::print("{}: {}\n", name, count);
      }
    }

    auto Data() && {
      return std::move(data_);
    }

   private:
    explicit Metrics(const Logger& source) {
      for (const auto& [name, index] : source.indices_) {
        data_.emplace_back(name, source.counters_[index]);
      }
    }

   private:
    std::vector<std::pair<std::string, size_t>> data_{};
  };

 private:
  // heterogenous lookup, so Increment never allocates

  struct StringHash {  // NOLINT
    using is_transparent = void;  // NOLINT
    [[nodiscard]] size_t operator()(std::string_view txt) const {
      return std::hash<std::string_view>{}(txt);
    }
    [[nodiscard]] size_t operator()(const std::string& txt) const {
      return std::hash<std::string_view>{}(txt);
    }
  };

  std::unordered_map<std::string, size_t, StringHash, std::equal_to<>>
      indices_{};
  std::vector<size_t> counters_;
};

}  // namespace monitor::satellite
