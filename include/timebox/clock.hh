#ifndef LIBTIMEBOX_CLOCK_HH
#define LIBTIMEBOX_CLOCK_HH

#include <chrono>

namespace timebox {

//! now + d, clamped instead of overflowing
//
//! a duration reaching past time_point::max() gives time_point::max(),
//! one reaching before the clock's epoch gives the first tick after it.
template <class Clock, class Dur, class Rep, class Period>
std::chrono::time_point<Clock, Dur> time_after(
        const std::chrono::time_point<Clock, Dur> &now,
        const std::chrono::duration<Rep, Period> &d)
{
    using namespace std::chrono;
    typedef time_point<Clock, Dur> point;
    typedef duration<Rep, Period> span;
    if (d >= span::zero()) {
        // compare in d's units so a coarse d is never widened
        if (d >= duration_cast<span>(point::max() - now)) {
            return point::max();
        }
    } else if (d <= -duration_cast<span>(now.time_since_epoch())) {
        return point{} + Dur{1};
    }
    return now + duration_cast<Dur>(d);
}

} // end namespace timebox

#endif // LIBTIMEBOX_CLOCK_HH
