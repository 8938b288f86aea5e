#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <prometheus/histogram.h>

class ScopedTimer {
public:
  explicit ScopedTimer(prometheus::Histogram &histogram_metric)
      : metric_(histogram_metric),
        start_time_(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() { metric_.Observe(elapsed_seconds()); }

  double elapsed_seconds() const {
    auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(
        std::chrono::steady_clock::now() - start_time_);
    return duration.count();
  }

private:
  prometheus::Histogram &metric_;
  std::chrono::time_point<std::chrono::steady_clock> start_time_;
};

#endif // SCOPED_TIMER_HPP
