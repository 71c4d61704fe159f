#ifndef LIBTIMEBOX_DEADLINE_HH
#define LIBTIMEBOX_DEADLINE_HH

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include "timebox/alarm.hh"
#include "timebox/clock.hh"
#include "timebox/error.hh"
#include "timebox/launcher.hh"
#include "timebox/signal.hh"
#include "timebox/signal_pool.hh"

namespace timebox {

//! resettable deadline for running tasks, in the manner of a socket deadline
//
//! set() may be called any number of times from any thread, moving the
//! point in time at which done() closes. a handle from done() obtained
//! before set() is closed by the new deadline as long as it had not
//! expired yet; once expired, the next set() installs a fresh signal.
class deadline {
public:
    typedef std::chrono::steady_clock clock;
    typedef clock::time_point time_point;
    typedef clock::duration duration;
    typedef std::function<void ()> task_type;

    //! \param l how run() starts tasks, a detached thread each when null
    explicit deadline(std::shared_ptr<launcher> l = nullptr,
            alarm_clock &ac = alarm_clock::global(),
            signal_pool &pool = signal_pool::global());
    ~deadline();

    deadline(const deadline &) = delete;
    deadline &operator =(const deadline &) = delete;

    //! move the deadline to t, a default constructed time_point clears it.
    //! a time already passed expires done() before returning.
    void set(time_point t);
    template <class Rep, class Period>
    void set_after(const std::chrono::duration<Rep, Period> &d) { set(time_after(clock::now(), d)); }
    //! clear the deadline
    void cancel() { set(time_point{}); }

    //! signal closed when the deadline expires
    signal_ref done();

    //! run task concurrently and wait for it or the deadline
    //
    //! rethrows an exception thrown by the task. throws deadline_exceeded
    //! when the deadline elapses first, the task keeps running in the
    //! background.
    void run(task_type task);

    //! the current target, the epoch when unset
    time_point when() const;

    //! time left, zero if expired, duration::max() when unset
    duration remaining() const;

private:
    void expire();

    std::shared_ptr<launcher> _launcher;
    alarm_clock &_clock;
    signal_pool &_pool;

    mutable std::mutex _mu;
    time_point _when;
    std::shared_ptr<signal> _done;
    std::unique_ptr<alarm_clock::timer> _timer;
};

//! run task with a one-off deadline
//
//! \throw deadline_exceeded
void run_with_deadline(deadline::time_point t, deadline::task_type task,
        std::shared_ptr<launcher> l = nullptr);

} // end namespace timebox

#endif // LIBTIMEBOX_DEADLINE_HH
