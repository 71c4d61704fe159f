#include "timebox/deadline.hh"
#include "timebox/logging.hh"
#include <exception>

namespace timebox {

namespace {

//! state shared between run() and the launched task
struct outcome {
    std::shared_ptr<signal> finished;
    deadline::task_type task;
    std::exception_ptr error;

    outcome(std::shared_ptr<signal> f, deadline::task_type t)
        : finished(std::move(f)), task(std::move(t)) {}

    ~outcome() {
        if (!error) return;
        // nobody waited for the task, it finished after the deadline
        try {
            std::rethrow_exception(error);
        } catch (std::exception &e) {
            LOG(WARNING) << "task abandoned by deadline threw: " << e.what();
        } catch (...) {
            LOG(WARNING) << "task abandoned by deadline threw an unknown exception";
        }
    }

    void complete() {
        try {
            task();
        } catch (...) {
            // handed to run() or logged when the outcome is destroyed
            error = std::current_exception();
        }
        task = nullptr;
        finished->close();
    }
};

} // end anonymous namespace

deadline::deadline(std::shared_ptr<launcher> l, alarm_clock &ac, signal_pool &pool)
    : _launcher(std::move(l)), _clock(ac), _pool(pool)
{
    if (!_launcher) {
        _launcher = std::make_shared<thread_launcher>();
    }
}

deadline::~deadline() {
    std::unique_ptr<alarm_clock::timer> t;
    {
        std::lock_guard<std::mutex> lk(_mu);
        t = std::move(_timer);
    }
    // waits for a firing in progress, expire() does not take _mu
    t.reset();
}

void deadline::set(time_point t) {
    std::lock_guard<std::mutex> lk(_mu);

    // past this point nobody else writes _done: either the timer was
    // stopped before firing, or it fired and we wait for the close.
    if (_timer && _timer->armed() && !_timer->stop()) {
        DVLOG(5) << "deadline " << this << " waiting for in-flight expiry";
        _done->wait();
    }

    _when = t;
    if (t == time_point{}) {
        // cleared. an expired signal is swapped out so done() reads open
        if (_done && _done->closed()) {
            _done = _pool.acquire();
        }
        DVLOG(4) << "deadline " << this << " cleared";
        return;
    }

    if (!_done || _done->closed()) {
        _done = _pool.acquire();
    }

    const time_point now = clock::now();
    if (t <= now) {
        DVLOG(4) << "deadline " << this << " already passed";
        _done->close();
        return;
    }
    const duration n = t - now;
    if (!_timer) {
        _timer.reset(new alarm_clock::timer(_clock, n, [this] { expire(); }));
    } else {
        // losing a race with a concurrent firing only closes done early
        _timer->reset(n);
    }
    DVLOG(4) << "deadline " << this << " set in " << as_ms(n);
}

void deadline::expire() {
    // runs on the alarm thread. _done is stable until this close is
    // observed by set(), which holds _mu and waits for it.
    _done->close();
    DVLOG(4) << "deadline " << this << " expired";
}

signal_ref deadline::done() {
    std::lock_guard<std::mutex> lk(_mu);
    if (!_done) {
        _done = _pool.acquire();
    }
    return _done;
}

void deadline::run(task_type task) {
    const signal_ref expired = done();
    auto state = std::make_shared<outcome>(_pool.acquire(), std::move(task));

    _launcher->launch(expired, [state] { state->complete(); });

    // completion is checked first when both are already closed, so a
    // task finishing right at an expired deadline may go either way
    if (wait_any({state->finished.get(), expired.get()}) == 0) {
        std::exception_ptr error;
        std::swap(error, state->error);
        if (error) {
            std::rethrow_exception(error);
        }
        return;
    }
    VLOG(3) << "deadline " << this << " exceeded before task finished";
    throw deadline_exceeded();
}

deadline::time_point deadline::when() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _when;
}

deadline::duration deadline::remaining() const {
    std::lock_guard<std::mutex> lk(_mu);
    if (_when == time_point{}) {
        return duration::max();
    }
    const time_point now = clock::now();
    return _when > now ? _when - now : duration::zero();
}

void run_with_deadline(deadline::time_point t, deadline::task_type task,
        std::shared_ptr<launcher> l)
{
    deadline d{std::move(l)};
    d.set(t);
    d.run(std::move(task));
}

} // end namespace timebox
