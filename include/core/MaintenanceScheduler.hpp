#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace sbu::core {

/// Runs the sync passes on independent intervals from one background thread.
/// Tasks receive the scheduler's stop token so a long pass can abort when the
/// process shuts down. A throwing task is logged and rescheduled.
/// Class abbreviation: ms
class MaintenanceScheduler {
 public:
  using TaskFn = std::function<void(std::stop_token)>;

  MaintenanceScheduler();
  ~MaintenanceScheduler();

  /// Register a task. The first run happens as soon as the scheduler starts.
  void schedule(const std::string& sName, std::chrono::seconds durInterval, TaskFn fnTask);
  void start();
  void stop();

 private:
  struct Task {
    std::string sName;
    std::chrono::seconds durInterval;
    TaskFn fn;
    std::chrono::steady_clock::time_point tpNextRun;
  };

  std::vector<Task> _vTasks;
  std::jthread _thread;
  std::mutex _mtx;
  std::condition_variable_any _cv;
  bool _bRunning = false;
};

}  // namespace sbu::core
