#include "core/MaintenanceScheduler.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>

namespace sbu::core {

MaintenanceScheduler::MaintenanceScheduler() = default;

MaintenanceScheduler::~MaintenanceScheduler() {
  stop();
}

void MaintenanceScheduler::schedule(const std::string& sName, std::chrono::seconds durInterval,
                                    TaskFn fnTask) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vTasks.push_back(Task{
      sName,
      durInterval,
      std::move(fnTask),
      std::chrono::steady_clock::now()  // run immediately on first pass
  });
}

void MaintenanceScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    auto spLog = common::Logger::get();

    while (!stToken.stop_requested()) {
      const auto tpNow = std::chrono::steady_clock::now();

      for (auto& task : _vTasks) {
        if (stToken.stop_requested()) break;
        if (tpNow < task.tpNextRun) continue;

        const auto tpStarted = std::chrono::steady_clock::now();
        try {
          task.fn(stToken);
          spLog->debug("Scheduler: task '{}' finished in {}ms", task.sName,
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - tpStarted)
                           .count());
        } catch (const common::AppError& ex) {
          spLog->error("Scheduler: task '{}' failed [{}]: {}", task.sName, ex._sErrorCode,
                       ex.what());
        } catch (const std::exception& ex) {
          spLog->error("Scheduler: task '{}' failed: {}", task.sName, ex.what());
        }
        task.tpNextRun = std::chrono::steady_clock::now() + task.durInterval;
      }

      auto tpNextWake = std::chrono::steady_clock::now() + std::chrono::hours(1);
      for (const auto& task : _vTasks) {
        tpNextWake = std::min(tpNextWake, task.tpNextRun);
      }

      // Sleep until the next task is due, or until stop is requested
      std::unique_lock<std::mutex> ulock(_mtx);
      _cv.wait_until(ulock, stToken, tpNextWake, [] { return false; });
    }
  });
}

void MaintenanceScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  _thread.request_stop();
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace sbu::core
