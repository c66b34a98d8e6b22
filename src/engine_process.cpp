#include "engine_process.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <stdexcept>

#include "engine_error.hpp"

namespace {

// Both ends are close-on-exec so sibling engines never inherit them.
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_end(0);
        close_end(1);
    }

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }

    int release(int end) {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }

    void close_end(int end) {
        if (fds[end] != -1) {
            close(fds[end]);
            fds[end] = -1;
        }
    }
};

EngineError spawn_error(const std::string &what, int err) {
    return EngineError(EngineErrorKind::SPAWN_FAILURE,
                       std::format("{}: {}", what, std::strerror(err)));
}

}  // namespace

EngineProcess::EngineProcess(Logger &logger) : logger_(logger) {}

EngineProcess::~EngineProcess() {
    stop();
}

void EngineProcess::start(const std::string &path) {
    if (pid_ != -1 || watcher_.joinable()) {
        throw std::logic_error("engine process already started");
    }

    // A dead engine must show up as a failed write, not as SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    Pipe parent_to_child;
    Pipe child_to_parent;
    Pipe exec_status;

    if (!parent_to_child.open() || !child_to_parent.open() || !exec_status.open()) {
        throw spawn_error("pipe creation failed", errno);
    }

    // Prepared before fork; the child may only make async-signal-safe calls.
    char *const argv[] = {const_cast<char *>(path.c_str()), nullptr};

    pid_t pid = fork();
    if (pid == -1) {
        throw spawn_error("fork failed", errno);
    }

    if (pid == 0) {  // Child process
        dup2(parent_to_child.fds[0], STDIN_FILENO);
        dup2(child_to_parent.fds[1], STDOUT_FILENO);

        // Ignored dispositions survive exec; the engine gets the default back.
        signal(SIGPIPE, SIG_DFL);

        // Bare names are looked up on PATH.
        execvp(path.c_str(), argv);

        // Only reached when exec failed; report errno to the parent.
        int err = errno;
        ssize_t written = write(exec_status.fds[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent process
    parent_to_child.close_end(0);
    child_to_parent.close_end(1);
    exec_status.close_end(1);

    // EOF means exec succeeded and closed the close-on-exec write end.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_status.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);

    if (n > 0) {
        waitpid(pid, nullptr, 0);
        throw spawn_error(std::format("cannot execute {}", path), exec_errno);
    }

    engine_pipe_write_.reset(fdopen(parent_to_child.fds[1], "w"));
    if (engine_pipe_write_) parent_to_child.release(1);
    engine_pipe_read_.reset(fdopen(child_to_parent.fds[0], "r"));
    if (engine_pipe_read_) child_to_parent.release(0);

    if (!engine_pipe_write_ || !engine_pipe_read_) {
        engine_pipe_write_.reset();
        engine_pipe_read_.reset();
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        throw EngineError(EngineErrorKind::STDIO_UNAVAILABLE,
                          std::format("cannot open pipes of {}", path));
    }

    setvbuf(engine_pipe_write_.get(), NULL, _IOLBF, 0);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid_ = pid;
    }
    watcher_ = std::thread(&EngineProcess::watch_exit, this);
}

void EngineProcess::watch_exit() {
    // Wait without reaping: the pid stays reserved until reaped under
    // state_mutex_, so stop() can never signal a recycled pid.
    siginfo_t info{};
    while (waitid(P_PID, pid_, &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) {
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        int status = 0;
        while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
        exited_ = true;
        exit_status_ = status;
    }
    exit_cv_.notify_all();

    logger_.log_event(std::format("child status was: {}", exit_description()));
}

FileHandle EngineProcess::take_output() {
    return std::move(engine_pipe_read_);
}

void EngineProcess::write_line(const std::string &line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!engine_pipe_write_) {
        throw EngineError(EngineErrorKind::WRITE_FAILURE, "engine input is closed");
    }

    FILE *out = engine_pipe_write_.get();
    if (fprintf(out, "%s\n", line.c_str()) < 0 || fflush(out) != 0) {
        int err = errno;
        clearerr(out);
        throw EngineError(EngineErrorKind::WRITE_FAILURE,
                          std::format("write to engine failed: {}", std::strerror(err)));
    }
}

void EngineProcess::close_input() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    engine_pipe_write_.reset();
}

bool EngineProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (pid_ == -1) return true;
    return exit_cv_.wait_for(lock, timeout, [this] { return exited_; });
}

void EngineProcess::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (pid_ > 0 && !exited_) {
            kill(pid_, SIGKILL);
        }
    }
    if (watcher_.joinable()) {
        watcher_.join();
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid_ = -1;
    }
    close_input();
    engine_pipe_read_.reset();
}

bool EngineProcess::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_ != -1 && !exited_;
}

std::string EngineProcess::exit_description() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exited_) return "";
    if (WIFEXITED(exit_status_)) {
        return std::format("exited with code {}", WEXITSTATUS(exit_status_));
    }
    if (WIFSIGNALED(exit_status_)) {
        return std::format("killed by signal {}", WTERMSIG(exit_status_));
    }
    return std::format("raw status {}", exit_status_);
}
