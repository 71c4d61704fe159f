#ifndef LIBTIMEBOX_ALARM_HH
#define LIBTIMEBOX_ALARM_HH

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include "timebox/clock.hh"
#include "timebox/thread_guard.hh"

namespace timebox {

//! ordered set of alarms fired from a dedicated thread
//
//! callbacks run on the clock's thread without the clock's lock held,
//! one at a time, in deadline order.
class alarm_clock {
public:
    typedef std::chrono::steady_clock clock;
    typedef clock::time_point time_point;
    typedef clock::duration duration;
    typedef std::function<void ()> callback;

    class timer;

    alarm_clock();
    ~alarm_clock();

    alarm_clock(const alarm_clock &) = delete;
    alarm_clock &operator =(const alarm_clock &) = delete;

    //! number of armed alarms
    size_t pending() const;

    //! process wide clock, never destroyed
    static alarm_clock &global();

private:
    typedef uint64_t alarm_id;

    struct data {
        time_point when;
        alarm_id id;
        callback fn;
    };

    struct order {
        bool operator ()(const data &a, const data &b) const {
            return a.when < b.when;
        }
    };

    alarm_id arm(const time_point &when, const callback &fn);
    bool disarm(alarm_id id);
    void wait_fired(alarm_id id);
    void loop();

    mutable std::mutex _mu;
    std::condition_variable _tick;
    std::condition_variable _fired;
    std::vector<data> _set;
    alarm_id _next_id;
    alarm_id _firing;
    bool _quit;
    // must be last, the thread uses the members above
    thread_guard _thread;
};

//! resettable one-shot timer on an alarm_clock
//
//! not thread safe, the owner serializes calls.
class alarm_clock::timer {
public:
    //! create a disarmed timer
    timer(alarm_clock &c, callback fn);
    //! create a timer armed to call fn after d
    timer(alarm_clock &c, duration d, callback fn);
    ~timer();

    timer(const timer &) = delete;
    timer &operator =(const timer &) = delete;

    //! \return true if a pending firing was prevented,
    //! false if the timer already fired, is firing, or was not armed
    bool stop();

    //! arm again with the same callback
    //! \return true if a pending firing was replaced
    bool reset(duration d);

    //! armed since the last stop(), it may have fired already
    bool armed() const { return _id != 0; }

private:
    alarm_clock &_clock;
    callback _fn;
    alarm_id _id;
    alarm_id _last;
};

} // end namespace timebox

#endif // LIBTIMEBOX_ALARM_HH
