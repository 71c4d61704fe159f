#ifndef LIBTIMEBOX_LOGGING_HH
#define LIBTIMEBOX_LOGGING_HH

#include <glog/logging.h>
#include <chrono>
#include <ostream>

namespace timebox {

//! print a duration as milliseconds with a unit suffix
template <class Rep, class Period>
struct ms_printer {
    std::chrono::duration<Rep, Period> d;
};

template <class Rep, class Period>
inline ms_printer<Rep, Period> as_ms(std::chrono::duration<Rep, Period> d) {
    return ms_printer<Rep, Period>{d};
}

template <class Rep, class Period>
std::ostream &operator << (std::ostream &os, const ms_printer<Rep, Period> &p) {
    using namespace std::chrono;
    return os << duration_cast<duration<double, std::milli>>(p.d).count() << "ms";
}

} // end namespace timebox

#endif // LIBTIMEBOX_LOGGING_HH
