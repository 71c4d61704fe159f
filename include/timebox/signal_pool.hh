#ifndef LIBTIMEBOX_SIGNAL_POOL_HH
#define LIBTIMEBOX_SIGNAL_POOL_HH

#include "timebox/signal.hh"
#include <memory>
#include <string>

namespace timebox {

//! thread safe free-list of open signals
//
//! acquire() hands out a shared_ptr whose deleter gives the signal back to
//! the pool once the last reference is dropped, so a recycled signal is
//! never visible to an old waiter or closer. recycling is only an
//! allocation optimization, a pool with max_idle 0 behaves the same.
class signal_pool {
public:
    typedef std::shared_ptr<signal> pointer;

    static constexpr size_t default_max_idle = 1024;

    explicit signal_pool(const std::string &name = "signals",
            size_t max_idle = default_max_idle);

    signal_pool(const signal_pool &) = delete;
    signal_pool &operator =(const signal_pool &) = delete;

    //! \return an open signal, recycled or new
    pointer acquire();

    //! give an unreferenced signal back for reuse, it is reopened
    void release(std::unique_ptr<signal> s);

    //! number of signals ready for reuse
    size_t idle() const;
    size_t max_idle() const;
    const std::string &name() const;

    //! process wide pool, never destroyed
    static signal_pool &global();

private:
    struct pool_impl;
    struct recycler;

    static void reopen(signal &s) { s.reopen(); }

    std::shared_ptr<pool_impl> _impl;
};

} // end namespace timebox

#endif // LIBTIMEBOX_SIGNAL_POOL_HH
