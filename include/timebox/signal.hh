#ifndef LIBTIMEBOX_SIGNAL_HH
#define LIBTIMEBOX_SIGNAL_HH

#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>
#include "timebox/clock.hh"

namespace timebox {

class signal;
class signal_pool;

//! receive-only handle to a signal, it can be waited on but not closed
typedef std::shared_ptr<const signal> signal_ref;

//! wakes an external condition variable when a signal closes
//
//! construct and destroy it without holding mu, signal::close() locks mu
//! while holding the signal's own lock. fired() must be read under mu.
class signal_watch {
    friend class signal;
public:
    signal_watch(const signal &s, std::mutex &mu, std::condition_variable &cv);
    ~signal_watch();

    signal_watch(const signal_watch &) = delete;
    signal_watch &operator =(const signal_watch &) = delete;

    bool fired() const { return _fired; }

private:
    const signal &_s;
    std::mutex &_mu;
    std::condition_variable &_cv;
    bool _fired;
};

//! one-shot broadcast event
//
//! starts open, close() moves it to closed exactly once and wakes every
//! waiter. a closed signal never opens again, except when it is recycled
//! by the signal_pool after the last reference is gone.
class signal {
    friend class signal_pool;
    friend class signal_watch;
public:
    typedef std::chrono::steady_clock clock;

    signal() : _closed(false) {}
    ~signal();

    signal(const signal &) = delete;
    signal &operator =(const signal &) = delete;

    //! \return true if this call closed the signal, false if it was already closed
    bool close();

    bool closed() const;

    //! block until closed
    void wait() const;

    //! \return true if closed before the time point
    bool wait_until(const clock::time_point &abs) const;

    //! \return true if closed within the duration
    template <class Rep, class Period>
    bool wait_for(const std::chrono::duration<Rep, Period> &d) const {
        return wait_until(time_after(clock::now(), d));
    }

private:
    void reopen();

    mutable std::mutex _mu;
    mutable std::condition_variable _cv;
    mutable std::vector<signal_watch *> _watches;
    bool _closed;
};

//! block until any of the signals is closed
//
//! \return index of the first closed signal in list order
size_t wait_any(std::initializer_list<const signal *> signals);

} // end namespace timebox

#endif // LIBTIMEBOX_SIGNAL_HH
