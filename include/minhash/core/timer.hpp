#pragma once
// ScopedTimer: adds the wall time of its scope, in seconds, to a caller's total.
// Several scopes may accumulate into the same double.
#include <chrono>

namespace minhash {

class ScopedTimer {
public:
  using clock = std::chrono::steady_clock;

  explicit ScopedTimer(double& total_seconds) : t0_(clock::now()), total_(total_seconds) {}
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;
  ~ScopedTimer() { total_ += elapsed(); }

  // Seconds since construction; the scope keeps running.
  double elapsed() const { return std::chrono::duration<double>(clock::now() - t0_).count(); }

private:
  clock::time_point t0_;
  double& total_;
};

} // namespace minhash
