#include "posmon/concurrent/worker_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace posmon {

WorkerThread::WorkerThread(std::string name) : name_(std::move(name)) {}

// Joins before queue_ is destroyed; the worker touches it until run() returns.
WorkerThread::~WorkerThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void WorkerThread::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
// close() wakes the worker if it is idle in pop(). If it is inside a task,
// join() waits for that task; a sink call is itself bounded by the process
// runner's deadline, so this does not hang forever.
// -----------------------------------------------------------------------------
void WorkerThread::stop() {
  queue_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool WorkerThread::post(Task task) { return queue_.push(std::move(task)); }

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
// pop() blocks until a task arrives; std::nullopt means closed and drained.
// -----------------------------------------------------------------------------
void WorkerThread::run() {
  while (auto task = queue_.pop()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      std::cerr << "[WorkerThread] " << name_
                << ": task threw: " << e.what() << '\n';
    }
  }
}

}  // namespace posmon
