#include "timebox/error.hh"

#include <execinfo.h>
#include <cxxabi.h>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <sstream>
#include <stdlib.h>

namespace timebox {

constexpr size_t saved_backtrace::max_frames;
constexpr size_t errorx::_bufsize;

void saved_backtrace::capture() {
    size = backtrace(array, max_frames);
}

std::string saved_backtrace::str() const {
    std::stringstream ss;
    std::unique_ptr<char *, void (*)(void*)> messages{backtrace_symbols(array, size), free};
    // skip the first frame which is capture()
    for (int i = 1; i < size && messages; ++i) {
        char *mangled_name = 0, *offset_begin = 0, *offset_end = 0;

        // find parantheses and +address offset surrounding mangled name
        for (char *p = messages.get()[i]; *p; ++p) {
            if (*p == '(') {
                mangled_name = p;
            } else if (*p == '+') {
                offset_begin = p;
            } else if (*p == ')') {
                offset_end = p;
                break;
            }
        }

        if (mangled_name && offset_begin && offset_end &&
            mangled_name < offset_begin)
        {
            *mangled_name++ = '\0';
            *offset_begin++ = '\0';
            *offset_end++ = '\0';

            int status;
            std::unique_ptr<char, void (*)(void*)> real_name{abi::__cxa_demangle(mangled_name, 0, 0, &status), free};

            ss << "[bt]: (" << i << ") " << messages.get()[i] << " : "
                << (status == 0 ? real_name.get() : mangled_name)
                << "+" << offset_begin << offset_end << std::endl;
        } else {
            ss << "[bt]: (" << i << ") " << messages.get()[i] << std::endl;
        }
    }
    return ss.str();
}

void errorx::init(const char *msg, size_t len) {
    len = std::min(len, _bufsize - 1);
    memcpy(_buf, msg, len);
    _buf[len] = 0;
}

void errorx::initf(const char *fmt, ...) {
    _buf[0] = 0;
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(_buf, _bufsize, fmt, ap);
    va_end(ap);
}

} // end namespace timebox
