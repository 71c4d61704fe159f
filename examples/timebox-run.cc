#include "timebox/app.hh"
#include "timebox/deadline.hh"
#include <atomic>
#include <thread>

using namespace std::chrono;

const char version[] = "0.1.0";

struct run_config : timebox::app_config {
    unsigned deadline_ms;
    unsigned task_ms;
    unsigned workers;
    unsigned repeat;
};

int main(int argc, char *argv[]) {
    run_config conf;
    timebox::application app{version, conf};
    namespace po = boost::program_options;
    app.opts.configuration.add_options()
        ("deadline-ms", po::value(&conf.deadline_ms)->default_value(100), "deadline for each run")
        ("task-ms", po::value(&conf.task_ms)->default_value(10), "how long the task sleeps")
        ("workers", po::value(&conf.workers)->default_value(0), "worker pool size, 0 starts a thread per task")
        ("repeat", po::value(&conf.repeat)->default_value(1), "number of runs on the same deadline")
        ;
    app.usage = "run a sleeping task under a deadline";
    app.usage_example = std::string(app.name) + " --deadline-ms=1 --task-ms=10";
    app.parse_args(argc, argv);
    const run_config &c = app.conf<run_config>();

    std::shared_ptr<timebox::launcher> l;
    if (c.workers > 0) {
        l = std::make_shared<timebox::worker_pool>(c.workers);
    }

    timebox::deadline d{l};
    // abandoned tasks may outlive main's stack frame
    auto finished = std::make_shared<std::atomic<unsigned>>(0);
    const milliseconds task_ms{c.task_ms};
    unsigned exceeded = 0;
    for (unsigned i = 0; i < c.repeat; ++i) {
        d.set_after(milliseconds{c.deadline_ms});
        const auto start = steady_clock::now();
        try {
            d.run([task_ms, finished] {
                std::this_thread::sleep_for(task_ms);
                ++*finished;
            });
            LOG(INFO) << "run " << i << " finished in "
                << timebox::as_ms(steady_clock::now() - start);
        } catch (timebox::deadline_exceeded &e) {
            ++exceeded;
            LOG(WARNING) << "run " << i << ": " << e.what()
                << " after " << timebox::as_ms(steady_clock::now() - start)
                << " (timeout=" << e.timeout() << " temporary=" << e.temporary() << ")";
        }
    }

    std::cout << c.repeat - exceeded << " ok, " << exceeded << " exceeded, "
        << *finished << " tasks finished so far\n";
    return exceeded ? 2 : 0;
}
