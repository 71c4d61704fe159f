#include "timebox/term.hh"
#include <sys/ioctl.h>

namespace timebox {

unsigned terminal_width() {
#ifdef TIOCGWINSZ
    winsize sz;
    if (ioctl(2, TIOCGWINSZ, &sz) == 0 && sz.ws_col)
        return sz.ws_col;
#endif
    return 80;
}

} // end namespace timebox
