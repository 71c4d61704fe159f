#include "timebox/alarm.hh"
#include "timebox/logging.hh"
#include <algorithm>
#include <exception>

namespace timebox {

alarm_clock::alarm_clock()
    : _next_id(1), _firing(0), _quit(false),
    _thread([this] { loop(); })
{
}

alarm_clock::~alarm_clock() {
    std::vector<data> dropped;
    {
        std::lock_guard<std::mutex> lk(_mu);
        _quit = true;
        std::swap(dropped, _set);
    }
    _tick.notify_all();
    if (!dropped.empty()) {
        VLOG(3) << "alarm clock " << this << " dropped " << dropped.size() << " pending alarms";
    }
    // _thread joins as the last member is destroyed
}

size_t alarm_clock::pending() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _set.size();
}

alarm_clock &alarm_clock::global() {
    static alarm_clock *clock = new alarm_clock;
    return *clock;
}

alarm_clock::alarm_id alarm_clock::arm(const time_point &when, const callback &fn) {
    std::unique_lock<std::mutex> lk(_mu);
    data d{when, _next_id++, fn};
    // after equal deadlines so ties fire in arming order
    auto i = std::upper_bound(std::begin(_set), std::end(_set), d, order());
    const bool earliest = (i == std::begin(_set));
    const alarm_id id = d.id;
    _set.insert(i, std::move(d));
    lk.unlock();
    if (earliest) {
        _tick.notify_one();
    }
    return id;
}

bool alarm_clock::disarm(alarm_id id) {
    std::vector<data> removed;
    {
        std::lock_guard<std::mutex> lk(_mu);
        auto i = std::find_if(std::begin(_set), std::end(_set),
                [id](const data &d) { return d.id == id; });
        if (i == std::end(_set)) {
            return false;
        }
        removed.push_back(std::move(*i));
        _set.erase(i);
    }
    // callback captures are destroyed outside the lock
    return true;
}

void alarm_clock::wait_fired(alarm_id id) {
    if (std::this_thread::get_id() == _thread.get_id()) {
        // called from a callback, waiting on ourselves would never finish
        return;
    }
    std::unique_lock<std::mutex> lk(_mu);
    _fired.wait(lk, [this, id] { return _firing != id; });
}

void alarm_clock::loop() {
    std::unique_lock<std::mutex> lk(_mu);
    while (!_quit) {
        if (_set.empty()) {
            _tick.wait(lk);
            continue;
        }
        const time_point when = _set.front().when;
        const time_point now = clock::now();
        if (now < when) {
            // bounded so a saturated alarm never reaches the condition
            // variable's clock conversion
            _tick.wait_until(lk, std::min(when, time_after(now, std::chrono::hours{24})));
            continue;
        }

        data d = std::move(_set.front());
        _set.erase(std::begin(_set));
        _firing = d.id;
        lk.unlock();

        DVLOG(5) << "alarm " << d.id << " firing "
            << as_ms(clock::now() - d.when) << " late";
        try {
            d.fn();
        } catch (std::exception &e) {
            LOG(ERROR) << "alarm " << d.id << " callback threw: " << e.what();
        } catch (...) {
            LOG(ERROR) << "alarm " << d.id << " callback threw an unknown exception";
        }
        d.fn = nullptr;

        lk.lock();
        _firing = 0;
        _fired.notify_all();
    }
}

alarm_clock::timer::timer(alarm_clock &c, callback fn)
    : _clock(c), _fn(std::move(fn)), _id(0), _last(0)
{
}

alarm_clock::timer::timer(alarm_clock &c, duration d, callback fn)
    : _clock(c), _fn(std::move(fn)), _id(0), _last(0)
{
    reset(d);
}

alarm_clock::timer::~timer() {
    stop();
    if (_last) {
        _clock.wait_fired(_last);
    }
}

bool alarm_clock::timer::stop() {
    if (_id == 0) {
        return false;
    }
    const bool stopped = _clock.disarm(_id);
    _id = 0;
    return stopped;
}

bool alarm_clock::timer::reset(duration d) {
    const bool replaced = stop();
    _id = _last = _clock.arm(time_after(clock::now(), d), _fn);
    return replaced;
}

} // end namespace timebox
