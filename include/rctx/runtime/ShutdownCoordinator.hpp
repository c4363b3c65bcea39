#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace rctx::rt {

// Named stop steps run once, lowest order first. Steps with the same order run in
// registration order.
class ShutdownCoordinator {
public:
  void registerStep(std::string name, int order, std::function<void()> fn);

  // Runs every step; a throwing step is logged and the next one still runs.
  // Returns how many steps failed. Later calls do nothing and return 0.
  std::size_t stop();

  bool stopping() const noexcept { return stopping_.load(std::memory_order_acquire); }
  std::size_t steps() const;

private:
  struct Step {
    std::string           name;
    int                   order;
    std::function<void()> fn;
  };

  mutable std::mutex mx_;
  std::vector<Step>  steps_;
  std::atomic<bool>  stopping_{false};
};

} // namespace rctx::rt
