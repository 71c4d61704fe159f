#ifndef LIBTIMEBOX_ERROR_HH
#define LIBTIMEBOX_ERROR_HH

#include <exception>
#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <typeinfo>
#include <string.h>
#include "timebox/logging.hh"

namespace timebox {

//! capture the current stack trace
struct saved_backtrace {
    static constexpr size_t max_frames = 50;
    void *array[max_frames];
    int size;

    saved_backtrace() { capture(); }

    void capture();
    std::string str() const;
};

//! captures the backtrace in the constructor
class backtrace_exception : public std::exception {
public:
    std::string backtrace_str() const { return bt.str(); }
private:
    saved_backtrace bt;
};

//! construct a what() string in printf() format
class errorx : public backtrace_exception {
protected:
    static constexpr size_t _bufsize = 256;
    char _buf[_bufsize];

    void init(const char *msg, size_t len);
    void initf(const char *fmt, ...) __attribute__((format (printf, 2, 3)));

    errorx() { _buf[0] = '\0'; }

public:
    errorx(const std::string &msg) { init(msg.data(), msg.size()); }
    errorx(const char *msg)        { init(msg, strlen(msg)); }

    //! \param fmt printf-style format string
    template <typename A, typename... Args>
    errorx(const char *fmt, A &&a, Args&&... args) { initf(fmt, std::forward<A>(a), std::forward<Args>(args)...); }

    //! \return a string describing the error
    const char *what() const noexcept override { return _buf; }
};

//! thrown by deadline::run when the deadline elapses before the task finishes
//
//! no backtrace is captured, this is raised on a hot path and is always
//! recoverable by retrying
struct deadline_exceeded : std::exception {
    const char *what() const noexcept override { return "deadline exceeded"; }

    //! the operation timed out
    bool timeout() const noexcept { return true; }
    //! retrying may succeed
    bool temporary() const noexcept { return true; }
};

//! conveniently create an errorx with stream output

enum endx_t { endx };

template <class Exception>
class error_stream {
    std::unique_ptr<std::ostringstream> _os;

public:
    error_stream()                     : _os(new std::ostringstream) {}
    error_stream(error_stream &&other) : _os(std::move(other._os))   {}
    ~error_stream()                    { if (_os) LOG(FATAL) << "error_stream<" << typeid(Exception).name() << "> missing endx"; }

    error_stream(const error_stream &) = delete;
    error_stream & operator = (const error_stream &) = delete;
    error_stream & operator = (error_stream &&) = delete;

    template <class T>
    error_stream & operator << (const T &t) {
        if (_os) *_os << t;
        return *this;
    }
    void operator << (endx_t) {
        if (_os) {
            auto os = std::move(_os);
            throw Exception(os->str());
        }
    }
};

template <class Exception = errorx>
inline error_stream<Exception> throw_stream() { return error_stream<Exception>(); }

} // end namespace timebox

#endif // LIBTIMEBOX_ERROR_HH
