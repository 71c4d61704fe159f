#include "timebox/signal.hh"
#include "timebox/logging.hh"
#include <algorithm>

namespace timebox {

signal_watch::signal_watch(const signal &s, std::mutex &mu, std::condition_variable &cv)
    : _s(s), _mu(mu), _cv(cv), _fired(false)
{
    std::lock_guard<std::mutex> lk(_s._mu);
    if (_s._closed) {
        // not attached yet, nobody else can see _fired
        _fired = true;
    } else {
        _s._watches.push_back(this);
    }
}

signal_watch::~signal_watch() {
    std::lock_guard<std::mutex> lk(_s._mu);
    auto i = std::find(begin(_s._watches), end(_s._watches), this);
    if (i != end(_s._watches)) {
        _s._watches.erase(i);
    }
}

signal::~signal() {
    DCHECK(_watches.empty()) << "signal destroyed with watchers attached";
}

bool signal::close() {
    std::lock_guard<std::mutex> lk(_mu);
    if (_closed) {
        return false;
    }
    _closed = true;
    _cv.notify_all();
    // notified under our lock so a watch can't be destroyed mid-flight
    for (signal_watch *w : _watches) {
        {
            std::lock_guard<std::mutex> wlk(w->_mu);
            w->_fired = true;
        }
        w->_cv.notify_all();
    }
    _watches.clear();
    return true;
}

bool signal::closed() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _closed;
}

void signal::wait() const {
    std::unique_lock<std::mutex> lk(_mu);
    _cv.wait(lk, [this] { return _closed; });
}

bool signal::wait_until(const clock::time_point &abs) const {
    std::unique_lock<std::mutex> lk(_mu);
    if (abs == clock::time_point::max()) {
        _cv.wait(lk, [this] { return _closed; });
        return true;
    }
    return _cv.wait_until(lk, abs, [this] { return _closed; });
}

void signal::reopen() {
    std::lock_guard<std::mutex> lk(_mu);
    DCHECK(_watches.empty());
    _closed = false;
}

size_t wait_any(std::initializer_list<const signal *> signals) {
    CHECK(signals.size() > 0) << "wait_any on no signals";
    std::mutex mu;
    std::condition_variable cv;
    std::vector<std::unique_ptr<signal_watch>> watches;
    watches.reserve(signals.size());
    for (const signal *s : signals) {
        watches.emplace_back(new signal_watch(*s, mu, cv));
    }

    size_t idx = 0;
    {
        std::unique_lock<std::mutex> lk(mu);
        auto any_fired = [&] {
            for (idx = 0; idx < watches.size(); ++idx) {
                if (watches[idx]->fired()) return true;
            }
            return false;
        };
        cv.wait(lk, any_fired);
    }
    // watches detach here, after mu is released
    return idx;
}

} // end namespace timebox
