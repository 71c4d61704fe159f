#include "timebox/signal_pool.hh"
#include "timebox/logging.hh"
#include <mutex>
#include <vector>

namespace timebox {

constexpr size_t signal_pool::default_max_idle;

struct signal_pool::pool_impl {
    std::mutex mut;
    std::vector<std::unique_ptr<signal>> avail;
    std::string name;
    size_t max_idle;

    std::unique_ptr<signal> take() {
        std::lock_guard<std::mutex> lk(mut);
        if (avail.empty()) {
            return nullptr;
        }
        std::unique_ptr<signal> s{std::move(avail.back())};
        avail.pop_back();
        return s;
    }

    void put(std::unique_ptr<signal> s) {
        if (!s) return;
        signal_pool::reopen(*s);
        std::unique_lock<std::mutex> lk(mut);
        if (avail.size() < max_idle) {
            avail.push_back(std::move(s));
            return;
        }
        lk.unlock();
        DVLOG(5) << "signal pool " << name << " full, freeing " << s.get();
    }
};

//! deleter returning the signal to its pool, if the pool still exists
struct signal_pool::recycler {
    std::weak_ptr<pool_impl> pool;

    void operator ()(signal *s) const {
        std::unique_ptr<signal> p{s};
        if (auto im = pool.lock()) {
            im->put(std::move(p));
        }
    }
};

signal_pool::signal_pool(const std::string &name, size_t max_idle)
    : _impl(std::make_shared<pool_impl>())
{
    _impl->name = name;
    _impl->max_idle = max_idle;
}

signal_pool::pointer signal_pool::acquire() {
    std::unique_ptr<signal> s = _impl->take();
    if (!s) {
        s.reset(new signal);
    }
    DCHECK(!s->closed());
    return pointer{s.release(), recycler{_impl}};
}

void signal_pool::release(std::unique_ptr<signal> s) {
    _impl->put(std::move(s));
}

size_t signal_pool::idle() const {
    std::lock_guard<std::mutex> lk(_impl->mut);
    return _impl->avail.size();
}

size_t signal_pool::max_idle() const {
    return _impl->max_idle;
}

const std::string &signal_pool::name() const {
    return _impl->name;
}

signal_pool &signal_pool::global() {
    static signal_pool *pool = new signal_pool("global");
    return *pool;
}

} // end namespace timebox
