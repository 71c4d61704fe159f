#ifndef LIBTIMEBOX_TERM_HH
#define LIBTIMEBOX_TERM_HH

namespace timebox {

//! width of the terminal on stderr, 80 when unknown
unsigned terminal_width();

} // end namespace timebox

#endif // LIBTIMEBOX_TERM_HH
