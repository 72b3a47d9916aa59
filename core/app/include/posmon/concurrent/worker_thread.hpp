#pragma once

#include "posmon/concurrent/thread_safe_queue.hpp"

#include <functional>
#include <string>
#include <thread>

namespace posmon {

// -----------------------------------------------------------------------------
// WorkerThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one std::thread that runs submitted tasks in FIFO
// order. NotificationDispatcher keeps one per enabled sink, so a sink that
// hangs only ever stalls its own queue.
//
// Tasks must not throw. The dispatcher wraps every sink call in a task that
// converts exceptions into a SinkReport before it reaches this class; an
// exception that still escapes is reported on std::cerr and the loop carries
// on with the next task.
//
// Lifecycle: construct → start() → post()... → stop(). stop() closes the
// queue, lets the worker finish the task it is running plus whatever is
// queued, and joins. The destructor calls stop().
//
// Thread model: post(), start() and stop() may be called from any thread.
// Tasks run only on the owned thread.
// -----------------------------------------------------------------------------
class WorkerThread {
 public:
  using Task = std::function<void()>;

  // `name` only labels log lines, e.g. "sink:desktop_notification".
  explicit WorkerThread(std::string name);
  ~WorkerThread();

  WorkerThread(const WorkerThread&) = delete;
  WorkerThread& operator=(const WorkerThread&) = delete;
  WorkerThread(WorkerThread&&) = delete;
  WorkerThread& operator=(WorkerThread&&) = delete;

  // Starts the thread. No-op if already running.
  void start();

  // Closes the queue and joins. No-op if not running. A stopped worker
  // cannot be restarted: the queue stays closed.
  void stop();

  // -------------------------------------------------------------------------
  // post(task)
  // -------------------------------------------------------------------------
  // Enqueues a task. Returns false when the worker has been stopped; the task
  // is then dropped and the caller must report the failure itself.
  // -------------------------------------------------------------------------
  bool post(Task task);

  const std::string& name() const { return name_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Task> queue_;
  std::thread thread_;
};

}  // namespace posmon
