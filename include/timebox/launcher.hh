#ifndef LIBTIMEBOX_LAUNCHER_HH
#define LIBTIMEBOX_LAUNCHER_HH

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "timebox/signal.hh"
#include "timebox/thread_guard.hh"

namespace timebox {

//! strategy used by deadline::run to start a task concurrently
class launcher {
public:
    typedef std::function<void ()> task_type;

    virtual ~launcher() {}

    //! start task concurrently
    //
    //! if the task can not be started right away the implementation waits
    //! on cancel, and once cancel is closed it returns without ever calling
    //! the task. otherwise the task is called exactly once.
    virtual void launch(signal_ref cancel, task_type task) = 0;
};

//! one detached thread per task
class thread_launcher : public launcher {
public:
    void launch(signal_ref cancel, task_type task) override;
};

//! fixed set of worker threads
//
//! launch() only queues a task when a worker is idle to take it, otherwise
//! it waits for a worker or for cancel.
class worker_pool : public launcher {
public:
    explicit worker_pool(size_t nworkers, const std::string &name = "workers");
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator =(const worker_pool &) = delete;

    void launch(signal_ref cancel, task_type task) override;

    size_t size() const { return _threads.size(); }
    size_t idle() const;
    //! launches given up because cancel closed first
    uint64_t abandoned() const;
    const std::string &name() const { return _name; }

private:
    void work();
    bool has_slot() const { return _idle > _queue.size(); }

    const std::string _name;
    mutable std::mutex _mu;
    std::condition_variable _work;
    std::condition_variable _ready;
    std::deque<task_type> _queue;
    size_t _idle;
    uint64_t _abandoned;
    bool _quit;
    std::vector<thread_guard> _threads;
};

} // end namespace timebox

#endif // LIBTIMEBOX_LAUNCHER_HH
