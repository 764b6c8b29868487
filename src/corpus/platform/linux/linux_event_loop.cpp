#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      capture_(config_.audio.buffer_seconds),
      core_(config_, verbose_, capture_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Core init (sources, dataset)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    return true;
}

int LinuxEventLoop::run_record() {
    if (!core_.has_dataset()) {
        std::println(stderr, "No dataset: set --root and --name (or dataset.* in the config)");
        return 1;
    }
    if (core_.prompt().empty() && !core_.generate()) {
        std::println(stderr, "No sentence sources: add one with --source");
        return 1;
    }

    epoll_event stdin_ev{.events = EPOLLIN, .data = {.fd = STDIN_FILENO}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, STDIN_FILENO, &stdin_ev) < 0) {
        std::println(stderr, "cannot watch stdin: {}", std::strerror(errno));
        return 1;
    }

    show_prompt();

    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];
    running_.store(true, std::memory_order_release);
    int rc = 0;

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            rc = 1;
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                ::read(timer_fd_, &expirations, sizeof(expirations));
                if (core_.session_state() != SessionState::Recording) continue;

                // One bounded device read per wakeup, however many ticks were missed.
                if (auto res = core_.poll(); !res) {
                    std::println(stderr, "{}: {}", to_string(res.error().kind), res.error().message);
                    arm_poll_timer(false);
                    show_prompt();
                }
                continue;
            }

            if (fd == STDIN_FILENO) {
                char tmp[512];
                ssize_t got = ::read(STDIN_FILENO, tmp, sizeof(tmp));
                if (got <= 0) {
                    log("End of input");
                    running_.store(false, std::memory_order_release);
                    break;
                }
                stdin_buf_.append(tmp, static_cast<size_t>(got));

                size_t pos;
                while ((pos = stdin_buf_.find('\n')) != std::string::npos) {
                    auto line = stdin_buf_.substr(0, pos);
                    stdin_buf_.erase(0, pos + 1);
                    handle_line(line);
                    if (!running_.load(std::memory_order_relaxed)) break;
                }
            }
        }
    }

    arm_poll_timer(false);
    if (core_.session_state() == SessionState::Recording) {
        std::println("Recording discarded.");
    }
    core_.shutdown();
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, STDIN_FILENO, nullptr);
    return rc;
}

void LinuxEventLoop::handle_line(const std::string& raw) {
    auto line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();

    if (line == "?") {
        std::println("{}", core_.status().dump(2));
        return;
    }

    if (core_.session_state() == SessionState::Recording) {
        arm_poll_timer(false);
        auto utt = core_.stop_recording();
        if (!utt) {
            std::println(stderr, "{}: {}", to_string(utt.error().kind), utt.error().message);
        } else {
            std::println("Saved {} ({} entries)", utt->recording_id, core_.ledger().size());
            core_.generate();
        }
        show_prompt();
        return;
    }

    if (line == "q") {
        running_.store(false, std::memory_order_release);
        return;
    }

    if (line == "s") {
        core_.generate();
        show_prompt();
        return;
    }

    if (!line.empty()) {
        std::println("Unknown input '{}'", line);
        show_prompt();
        return;
    }

    if (auto res = core_.start_recording(); !res) {
        std::println(stderr, "{}: {}", to_string(res.error().kind), res.error().message);
        show_prompt();
        return;
    }
    if (!arm_poll_timer(true)) {
        core_.abort_recording();
        show_prompt();
        return;
    }
    std::println("Recording... press Enter to stop.");
}

void LinuxEventLoop::show_prompt() {
    std::println("\n  {}\n", core_.prompt());
    std::println("[Enter] record  [s] other sentence  [?] status  [q] quit");
}

bool LinuxEventLoop::arm_poll_timer(bool on) {
    itimerspec spec{};
    if (on) {
        long ns = static_cast<long>(config_.audio.poll_interval_ms) * 1'000'000L;
        spec.it_interval.tv_sec = ns / 1'000'000'000L;
        spec.it_interval.tv_nsec = ns % 1'000'000'000L;
        spec.it_value = spec.it_interval;
    }
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

int LinuxEventLoop::run_trim() {
    if (!core_.has_dataset()) {
        std::println(stderr, "No dataset: set --root and --name (or dataset.* in the config)");
        return 1;
    }
    if (core_.ledger().empty()) {
        std::println("Nothing to trim.");
        return 0;
    }

    Result<TrimReport> outcome = TrimReport{};

    worker_ = std::jthread([this, &outcome](std::stop_token stop) {
        outcome = core_.trim_silence(stop, [](const TrimProgress& p) {
            const char* verb = p.phase == TrimPhase::Compute ? "Computing" : "Saving";
            std::println("[{}/{}] {} {}", p.index + 1, p.total, verb, p.recording_id);
        });

        uint64_t val = 1;
        ::write(worker_event_fd_, &val, sizeof(val));
    });

    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];
    bool done = false;

    while (!done) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            worker_.request_stop();
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, cancelling trim");
                worker_.request_stop();
            } else if (fd == worker_event_fd_) {
                uint64_t val;
                ::read(worker_event_fd_, &val, sizeof(val));
                done = true;
            } else if (fd == timer_fd_) {
                uint64_t expirations;
                ::read(timer_fd_, &expirations, sizeof(expirations));
            }
        }
    }

    worker_.join();

    if (!outcome) {
        std::println(stderr, "{}: {}", to_string(outcome.error().kind), outcome.error().message);
        return 1;
    }

    const auto& report = *outcome;
    if (report.cancelled) {
        std::println("Cancelled: {} of {} files rewritten.", report.written, core_.ledger().size());
    } else {
        std::println("Trimmed {} files.", report.written);
    }
    return 0;
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[speech-corpus] {}", msg);
    }
}
