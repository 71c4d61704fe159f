#include "timebox/launcher.hh"
#include "timebox/error.hh"
#include "timebox/logging.hh"
#include <system_error>
#include <thread>

namespace timebox {

void thread_launcher::launch(signal_ref, task_type task) {
    std::thread(std::move(task)).detach();
}

worker_pool::worker_pool(size_t nworkers, const std::string &name)
    : _name(name), _idle(0), _abandoned(0), _quit(false)
{
    if (nworkers == 0) {
        throw errorx("worker pool %s needs at least one worker", _name.c_str());
    }
    _threads.reserve(nworkers);
    try {
        for (size_t i = 0; i < nworkers; ++i) {
            _threads.emplace_back(std::thread([this] { work(); }));
        }
    } catch (std::system_error &e) {
        LOG(ERROR) << "worker pool " << _name << " failed to start workers: " << e.what();
        {
            std::lock_guard<std::mutex> lk(_mu);
            _quit = true;
        }
        _work.notify_all();
        _threads.clear();
        throw;
    }
    VLOG(3) << "worker pool " << _name << " started " << nworkers << " workers";
}

worker_pool::~worker_pool() {
    {
        std::lock_guard<std::mutex> lk(_mu);
        _quit = true;
    }
    _work.notify_all();
    _ready.notify_all();
    // workers drain the queue before exiting
    _threads.clear();
}

size_t worker_pool::idle() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _idle;
}

uint64_t worker_pool::abandoned() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _abandoned;
}

void worker_pool::launch(signal_ref cancel, task_type task) {
    // the watch is attached before taking _mu, see signal_watch
    std::unique_ptr<signal_watch> watch;
    if (cancel) {
        watch.reset(new signal_watch(*cancel, _mu, _ready));
    }

    std::unique_lock<std::mutex> lk(_mu);
    _ready.wait(lk, [&] {
        return _quit || has_slot() || (watch && watch->fired());
    });
    if (!_quit && has_slot()) {
        _queue.push_back(std::move(task));
        lk.unlock();
        _work.notify_one();
        return;
    }
    ++_abandoned;
    lk.unlock();
    VLOG(3) << "worker pool " << _name
        << (_quit ? " shutting down" : " busy until cancel")
        << ", task abandoned";
}

void worker_pool::work() {
    std::unique_lock<std::mutex> lk(_mu);
    for (;;) {
        ++_idle;
        _ready.notify_all();
        _work.wait(lk, [this] { return _quit || !_queue.empty(); });
        --_idle;
        if (_queue.empty()) {
            // quitting with nothing left to run
            return;
        }
        task_type task{std::move(_queue.front())};
        _queue.pop_front();
        lk.unlock();

        try {
            task();
        } catch (std::exception &e) {
            LOG(ERROR) << "worker pool " << _name << " task threw: " << e.what();
        } catch (...) {
            LOG(ERROR) << "worker pool " << _name << " task threw an unknown exception";
        }
        task = nullptr;

        lk.lock();
    }
}

} // end namespace timebox
