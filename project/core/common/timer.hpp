#pragma once
#include <chrono>
// Logs the lifetime of a scope on the "app" channel at debug level.
class ScopedTimer {
public:
  explicit ScopedTimer(const char* name);
  ~ScopedTimer();
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;
  double elapsed_ms() const;
private:
  const char* name_;
  std::chrono::high_resolution_clock::time_point t0_;
};
