// File: src/main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rctx/ContextRegistry.hpp"
#include "rctx/PoolDecorator.hpp"
#include "rctx/RetryContext.hpp"
#include "rctx/rt/ScheduledThreadPool.hpp"
#include "rctx/rt/ThreadPool.hpp"
#include "rctx/runtime/ShutdownCoordinator.hpp"
#include "rctx/util/Config.hpp"
#include "rctx/util/Logger.hpp"
#include "rctx/util/Metrics.hpp"

// ---------------------------
// Helpers
// ---------------------------
static std::string threadTag() {
  std::ostringstream os;
  os << std::this_thread::get_id();
  return os.str();
}

static std::string currentContext() {
  auto ctx = rctx::ContextRegistry::getCurrent();
  return ctx ? ctx->describe() : std::string("none");
}

static rctx::rt::ShutdownCoordinator gShutdown;
static volatile std::sig_atomic_t gSignalled = 0;

static void handleSignal(int) {
  gSignalled = 1;
}

// ---------------------------
// Retry loop
// ---------------------------
// Every attempt runs on a scheduler thread with the shared retry context installed and
// hands the work to the user pool through one long-lived decorator, which picks up the
// attempt's context at submission. The work's completion decides what comes next: the
// downstream callback on success, another attempt after the backoff on failure. No
// thread waits for the work to finish.
class ReschedulingDemo : public std::enable_shared_from_this<ReschedulingDemo> {
public:
  using UserPool = rctx::PoolDecorator<rctx::rt::ThreadPool, rctx::AmbientAugment>;

  ReschedulingDemo(const rctx::util::Config& cfg,
                   rctx::rt::ScheduledThreadPool& scheduler,
                   std::shared_ptr<rctx::rt::ThreadPool> userPool)
    : cfg_(cfg),
      scheduler_(scheduler),
      userPool_(userPool),
      user_(std::move(userPool)),
      context_(std::make_shared<rctx::RetryContext>("demo-retry")) {}

  std::future<std::string> start() {
    auto fut = done_.get_future();
    auto self = shared_from_this();
    if (!scheduler_.tryPost([self] { self->attempt(); })) {
      fail("scheduler refused the first attempt");
    }
    return fut;
  }

private:
  void attempt() {
    using namespace rctx::util;
    rctx::ContextScope scope(context_);
    context_->registerAttempt();
    const int n = context_->retryCount();
    Logger::Scoped tag({{"attempt", std::to_string(n)}});
    logger().log(LogLevel::Debug, "attempt.start",
                 {{"thread", threadTag()}, {"ctx", currentContext()}});

    auto self = shared_from_this();
    if (!user_.tryPost([self, n] { self->complete(n); })) {
      fail("user pool refused the work");
    }
  }

  // Runs on the user pool under the attempt's context.
  void complete(int n) {
    using namespace rctx::util;
    Logger::Scoped tag({{"attempt", std::to_string(n)}});
    try {
      std::string value = work();
      RCTX_METRIC_HIT("demo.succeeded");
      finish(std::move(value));
      return;
    } catch (const std::exception& e) {
      RCTX_METRIC_HIT("demo.attempt_failed");
      logger().log(LogLevel::Warn, "attempt.failed", {{"what", e.what()}});
    }

    if (n >= cfg_.maxAttempts) {
      logger().log(LogLevel::Error, "retry.exhausted", {{"attempts", std::to_string(n)}});
      fail("retry attempts exhausted");
      return;
    }
    if (scheduler_.isShutdown()) {
      fail("scheduler stopped before the next attempt");
      return;
    }
    auto self = shared_from_this();
    scheduler_.schedule([self] { self->attempt(); }, std::chrono::milliseconds(cfg_.backoffMs));
  }

  std::string work() {
    using namespace rctx::util;
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.workMs));
    Logger::Scoped tag(std::vector<Field>{{"pool", "user"}});
    if (runs_.fetch_add(1, std::memory_order_acq_rel) + 1 > cfg_.succeedAfter) {
      logger().log(LogLevel::Info, "work.done", {{"thread", threadTag()}, {"ctx", currentContext()}});
      return "done";
    }
    logger().log(LogLevel::Info, "work.fail", {{"thread", threadTag()}, {"ctx", currentContext()}});
    throw std::runtime_error("work failed");
  }

  // Downstream callback goes to the plain pool: no context is installed there.
  void finish(std::string value) {
    auto self = shared_from_this();
    bool accepted = userPool_->tryPost([self, value = std::move(value)]() mutable {
      rctx::util::logger().log(rctx::util::LogLevel::Info, "downstream",
                               {{"thread", threadTag()}, {"ctx", currentContext()}});
      self->done_.set_value(std::move(value));
    });
    if (!accepted) fail("user pool refused the downstream callback");
  }

  void fail(const char* why) {
    done_.set_exception(std::make_exception_ptr(std::runtime_error(why)));
  }

  const rctx::util::Config&                      cfg_;
  rctx::rt::ScheduledThreadPool&                 scheduler_;   // outlives the demo's handlers
  std::shared_ptr<rctx::rt::ThreadPool>          userPool_;
  UserPool                                       user_;
  rctx::ContextRef                               context_;
  std::promise<std::string>                      done_;
  std::atomic<int>                               runs_{0};
};

// ---------------------------
// main
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace rctx::util;

  std::signal(SIGINT,  handleSignal);
  std::signal(SIGTERM, handleSignal);

  // argv[1] = configFilePath (optional)
  Config cfg;
  bool cfgLoaded = true;
  if (argc > 1) cfgLoaded = cfg.loadFromFile(argv[1]);

  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logJson);
  if (!cfg.logFile.empty()) logger().setFile(cfg.logFile);

  if (!cfgLoaded) {
    logger().log(LogLevel::Warn, "config.load_failed", {{"path", argv[1]}});
  }
  logger().log(LogLevel::Info, "boot", {
    {"poolThreads",      std::to_string(cfg.poolThreads)},
    {"schedulerThreads", std::to_string(cfg.schedulerThreads)},
    {"maxAttempts",      std::to_string(cfg.maxAttempts)},
    {"backoffMs",        std::to_string(cfg.backoffMs)}
  });

  auto scheduler = std::make_shared<rctx::rt::ScheduledThreadPool>(
    static_cast<unsigned>(cfg.schedulerThreads));
  auto userPool  = std::make_shared<rctx::rt::ThreadPool>(static_cast<unsigned>(cfg.poolThreads));

  gShutdown.registerStep("scheduler-stop", 10, [scheduler = scheduler.get()] {
    scheduler->shutdownNow();
    while (!scheduler->awaitTermination(std::chrono::seconds(1))) {}
  });
  gShutdown.registerStep("user-pool-stop", 20, [userPool = userPool.get()] {
    userPool->shutdown();
    while (!userPool->awaitTermination(std::chrono::seconds(1))) {}
  });
  gShutdown.registerStep("metrics-dump", 90, [] {
    std::vector<Field> fields;
    for (const auto& kv : rctx::util::MetricRegistry::instance().snapshotCounters()) {
      fields.push_back({kv.first, std::to_string(static_cast<long long>(kv.second))});
    }
    logger().log(LogLevel::Info, "metrics", fields);
  });

  auto demo = std::make_shared<ReschedulingDemo>(cfg, *scheduler, userPool);
  auto result = demo->start();

  int rc = EXIT_SUCCESS;
  for (;;) {
    if (gSignalled) {
      logger().log(LogLevel::Info, "signal", {});
      rc = EXIT_FAILURE;
      break;
    }
    if (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) continue;
    try {
      logger().log(LogLevel::Info, "result", {{"value", result.get()}});
    } catch (const std::exception& e) {
      logger().log(LogLevel::Error, "result", {{"what", e.what()}});
      rc = EXIT_FAILURE;
    }
    break;
  }

  if (gShutdown.stop() > 0) rc = EXIT_FAILURE;

  logger().log(LogLevel::Info, "stopped", {});
  return rc;
}
