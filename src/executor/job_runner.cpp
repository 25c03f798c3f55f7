/**
 * @file job_runner.cpp
 * @brief Sequential, threaded and process-isolated job runners.
 */

#include "executor/job_runner.hpp"
#include "executor/completion_codec.hpp"
#include "executor/thread_pool.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <future>
#include <iostream>
#include <thread>

namespace automl_bench {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

JobCompletion error_completion(const Job& job, std::string message, double duration = 0.0) {
    JobCompletion completion;
    completion.key = job.key();
    completion.state = JobState::Failed;
    completion.duration = duration;
    completion.error = std::move(message);
    return completion;
}

bool write_all(int fd, const std::vector<uint8_t>& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        auto n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

std::string describe_exit(int status) {
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        return "was killed by signal " + std::to_string(sig) + " (" + ::strsignal(sig) + ")";
    }
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    return "ended abnormally";
}

/// A forked child running one job.
struct Worker {
    size_t index;
    pid_t pid;
    int fd;
    std::vector<uint8_t> payload;
    std::chrono::steady_clock::time_point started;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// IJobRunner
// ─────────────────────────────────────────────

std::vector<JobCompletion> IJobRunner::run(const JobList& jobs) {
    logger_.info("Running " + std::to_string(jobs.size()) + " jobs with the "
                 + std::string(name()) + " runner.");
    auto completions = run_jobs(jobs);
    reconcile_durations(completions);
    logger_.info("All " + std::to_string(completions.size()) + " jobs executed.");
    return completions;
}

void reconcile_durations(std::vector<JobCompletion>& completions) {
    for (auto& completion : completions) {
        if (completion.result && std::isnan(completion.result->duration)) {
            completion.result->duration = completion.duration;
        }
    }
}

// ─────────────────────────────────────────────
// SequentialJobRunner
// ─────────────────────────────────────────────

std::vector<JobCompletion> SequentialJobRunner::run_jobs(const JobList& jobs) {
    std::vector<JobCompletion> completions;
    completions.reserve(jobs.size());
    for (const auto& job : jobs) {
        completions.push_back(job->start());
    }
    return completions;
}

// ─────────────────────────────────────────────
// ThreadedJobRunner
// ─────────────────────────────────────────────

ThreadedJobRunner::ThreadedJobRunner(ParallelOptions options, Logger& logger)
    : IJobRunner(logger), options_(options) {
    options_.max_workers = std::max<size_t>(options_.max_workers, 1);
}

std::vector<JobCompletion> ThreadedJobRunner::run_jobs(const JobList& jobs) {
    ThreadPool pool(options_.max_workers);
    std::vector<std::future<JobCompletion>> futures;
    futures.reserve(jobs.size());

    for (size_t i = 0; i < jobs.size(); ++i) {
        if (i > 0 && options_.delay.count() > 0) {
            std::this_thread::sleep_for(options_.delay);
        }
        futures.push_back(pool.submit([job = jobs[i]] { return job->start(); }));
    }

    std::vector<JobCompletion> completions;
    completions.reserve(jobs.size());
    auto collect = [&](size_t i) {
        try {
            completions.push_back(futures[i].get());
        } catch (const std::exception& e) {
            auto completion = error_completion(*jobs[i], "Job " + jobs[i]->name() + " raised: " + e.what());
            logger_.error(*completion.error);
            completions.push_back(std::move(completion));
        } catch (...) {
            auto completion = error_completion(*jobs[i], "Job " + jobs[i]->name() + " raised an unknown exception");
            logger_.error(*completion.error);
            completions.push_back(std::move(completion));
        }
    };

    if (!options_.done_async) {
        for (size_t i = 0; i < futures.size(); ++i) collect(i);
        return completions;
    }

    std::vector<size_t> pending(futures.size());
    for (size_t i = 0; i < pending.size(); ++i) pending[i] = i;
    while (!pending.empty()) {
        for (auto it = pending.begin(); it != pending.end();) {
            if (futures[*it].wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
                collect(*it);
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
        if (!pending.empty()) std::this_thread::sleep_for(options_.poll_interval);
    }
    return completions;
}

// ─────────────────────────────────────────────
// ProcessJobRunner
// ─────────────────────────────────────────────

ProcessJobRunner::ProcessJobRunner(ParallelOptions options, Logger& logger)
    : IJobRunner(logger), options_(options) {
    options_.max_workers = std::max<size_t>(options_.max_workers, 1);
}

std::vector<JobCompletion> ProcessJobRunner::run_jobs(const JobList& jobs) {
    std::vector<JobCompletion> completions;
    completions.reserve(jobs.size());
    std::vector<Worker> workers;
    size_t next = 0;
    bool forked_any = false;

    auto reap = [&](Worker& worker) {
        const auto& job = *jobs[worker.index];
        ::close(worker.fd);
        int status = 0;
        while (::waitpid(worker.pid, &status, 0) < 0 && errno == EINTR) {}

        JobCompletion completion;
        completion.key = job.key();
        bool clean_exit = WIFEXITED(status) && WEXITSTATUS(status) == 0;
        if (!clean_exit || !CompletionCodec::decode(worker.payload, completion)) {
            completion = error_completion(job,
                "Worker process for job " + job.name() + " " + describe_exit(status)
                + " before reporting a completion",
                seconds_since(worker.started));
            logger_.error(*completion.error);
        }
        jobs[worker.index]->settle(completion.state);
        completions.push_back(std::move(completion));
    };

    while (next < jobs.size() || !workers.empty()) {
        while (next < jobs.size() && workers.size() < options_.max_workers) {
            size_t index = next++;
            auto& job = *jobs[index];
            if (!job.claim()) {
                completions.push_back(error_completion(job, "Job " + job.name() + " was already started"));
                continue;
            }
            if (forked_any && options_.delay.count() > 0) {
                std::this_thread::sleep_for(options_.delay);
            }
            forked_any = true;

            // Buffered output must not be duplicated into the child.
            logger_.flush();
            std::cout.flush();
            std::fflush(nullptr);

            int fds[2];
            if (::pipe(fds) != 0) {
                job.settle(JobState::Failed);
                completions.push_back(error_completion(
                    job, std::string("Could not create a pipe for job ") + job.name() + ": " + std::strerror(errno)));
                continue;
            }

            pid_t pid = ::fork();
            if (pid < 0) {
                int err = errno;
                ::close(fds[0]);
                ::close(fds[1]);
                job.settle(JobState::Failed);
                completions.push_back(error_completion(
                    job, std::string("Could not fork a worker for job ") + job.name() + ": " + std::strerror(err)));
                continue;
            }

            if (pid == 0) {
                ::close(fds[0]);
                int code = 0;
                try {
                    auto completion = job.run_claimed();
                    code = write_all(fds[1], CompletionCodec::encode(completion)) ? 0 : 2;
                } catch (const std::exception& e) {
                    logger_.error("Worker for job " + job.name() + " failed: " + e.what());
                    code = 3;
                } catch (...) {
                    logger_.error("Worker for job " + job.name() + " failed: unknown exception");
                    code = 3;
                }
                logger_.flush();
                ::close(fds[1]);
                ::_exit(code);
            }

            ::close(fds[1]);
            workers.push_back(Worker{
                .index = index,
                .pid = pid,
                .fd = fds[0],
                .payload = {},
                .started = std::chrono::steady_clock::now()
            });
        }

        if (workers.empty()) continue;

        std::vector<pollfd> polled;
        polled.reserve(workers.size());
        for (const auto& worker : workers) {
            polled.push_back(pollfd{.fd = worker.fd, .events = POLLIN, .revents = 0});
        }

        int ready = poll_workers(polled.data(), polled.size(),
                                 static_cast<int>(options_.poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::string("poll on worker pipes failed: ") + std::strerror(errno);
            logger_.error("Stopping the process runner, " + reason);

            // Every job still gets exactly one completion.
            for (auto& worker : workers) {
                ::kill(worker.pid, SIGKILL);
                reap(worker);
            }
            workers.clear();
            for (; next < jobs.size(); ++next) {
                auto& job = *jobs[next];
                if (job.claim()) job.settle(JobState::Failed);
                completions.push_back(error_completion(job, "Job " + job.name() + " was not run: " + reason));
            }
            break;
        }

        // Backwards so erasing keeps the remaining indices valid.
        for (size_t i = polled.size(); i-- > 0;) {
            if ((polled[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            auto& worker = workers[i];
            uint8_t buf[4096];
            auto n = ::read(worker.fd, buf, sizeof(buf));
            if (n > 0) {
                worker.payload.insert(worker.payload.end(), buf, buf + n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            reap(worker);
            workers.erase(workers.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
    return completions;
}

int ProcessJobRunner::poll_workers(pollfd* fds, size_t count, int timeout_ms) {
    return ::poll(fds, static_cast<nfds_t>(count), timeout_ms);
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

Result<std::unique_ptr<IJobRunner>> make_job_runner(const RunnerConfig& config, Logger& logger) {
    std::string strategy = config.strategy;
    std::transform(strategy.begin(), strategy.end(), strategy.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (strategy != "sequential" && strategy != "threads" && strategy != "processes") {
        return Error{ErrorCode::ConfigParse,
                     "Unknown runner strategy " + config.strategy
                     + "; expected sequential, threads or processes."};
    }

    std::unique_ptr<IJobRunner> runner;
    ParallelOptions options{
        .max_workers = config.parallel_jobs,
        .delay = std::chrono::seconds{config.delay_secs},
        .done_async = config.done_async,
        .poll_interval = std::chrono::milliseconds{config.poll_interval_ms}
    };

    if (config.parallel_jobs <= 1 || strategy == "sequential") {
        runner = std::make_unique<SequentialJobRunner>(logger);
    } else if (strategy == "threads") {
        runner = std::make_unique<ThreadedJobRunner>(options, logger);
    } else {
        runner = std::make_unique<ProcessJobRunner>(options, logger);
    }
    return runner;
}

}  // namespace automl_bench
