#pragma once

#include "config.hpp"
#include "corpus_core.hpp"
#include "platform/linux/pipewire_capture.hpp"

#include <atomic>
#include <string>
#include <thread>

// epoll loop behind the terminal front end. A timerfd drives the capture
// poll while recording, stdin carries the user's commands, a signalfd turns
// Ctrl-C into an abort, and an eventfd reports the trim worker's completion.
class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();

    // Interactive prompt/record cycle until 'q', end of input or a signal.
    int run_record();

    // Trim batch on a worker thread; a signal requests cancellation.
    int run_trim();

    CorpusCore& core() { return core_; }

private:
    bool arm_poll_timer(bool on);
    void handle_line(const std::string& line);
    void show_prompt();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementation (constructed before core_)
    PipeWireCapture capture_;

    CorpusCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
    std::string stdin_buf_;
    std::jthread worker_;
};
