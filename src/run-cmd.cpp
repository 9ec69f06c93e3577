#include "run-cmd.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <string>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Both ends of a pipe, closed on scope exit
struct pipe_fds {
    int rd = -1;
    int wr = -1;

    pipe_fds() = default;
    pipe_fds(const pipe_fds &) = delete;
    pipe_fds & operator=(const pipe_fds &) = delete;
    ~pipe_fds() {
        close_rd();
        close_wr();
    }

    bool open() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) < 0) return false;
        rd = fds[0];
        wr = fds[1];
        return true;
    }

    void close_rd() { if (rd >= 0) { close(rd); rd = -1; } }
    void close_wr() { if (wr >= 0) { close(wr); wr = -1; } }
};

using clock_type = std::chrono::steady_clock;

int ms_left(clock_type::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now()).count();
    return left > 0 ? (int)left : 0;
}

// Child side: wire up stdio and exec, never returns
[[noreturn]] void exec_child(const char * const argv[], pipe_fds * in, pipe_fds * out) {
    if (in)  dup2(in->rd, STDIN_FILENO);
    if (out) dup2(out->wr, STDOUT_FILENO);

    // Children never write to our stderr
    int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
        dup2(devnull, STDERR_FILENO);
        close(devnull);
    }

    execvp(argv[0], const_cast<char * const *>(argv));
    _exit(127);
}

// Feed stdin and drain stdout together so neither side can stall the
// other. Returns false when the deadline passes first.
bool pump(pipe_fds * in, const std::string * stdin_data,
          pipe_fds * out, std::string * stdout_data,
          clock_type::time_point deadline) {
    size_t written = 0;
    if (in && written == stdin_data->size()) in->close_wr();

    char buf[4096];
    while ((in && in->wr >= 0) || (out && out->rd >= 0)) {
        struct pollfd fds[2];
        nfds_t n = 0;
        if (in && in->wr >= 0)   fds[n++] = {in->wr, POLLOUT, 0};
        if (out && out->rd >= 0) fds[n++] = {out->rd, POLLIN, 0};

        const int ready = poll(fds, n, ms_left(deadline));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ready == 0) return false;

        for (nfds_t i = 0; i < n; i++) {
            if (fds[i].revents == 0) continue;

            if (in && fds[i].fd == in->wr) {
                const ssize_t w = write(in->wr, stdin_data->data() + written, stdin_data->size() - written);
                if (w < 0 && errno == EINTR) continue;
                if (w <= 0) {
                    // Child closed its stdin early
                    in->close_wr();
                    continue;
                }
                written += (size_t)w;
                if (written == stdin_data->size()) in->close_wr();
            } else if (out && fds[i].fd == out->rd) {
                const ssize_t r = read(out->rd, buf, sizeof(buf));
                if (r < 0 && errno == EINTR) continue;
                if (r <= 0) {
                    out->close_rd();
                    continue;
                }
                stdout_data->append(buf, (size_t)r);
            }
        }
    }
    return true;
}

int reap(pid_t pid, clock_type::time_point deadline, bool timed_out, const char * prog, int timeout_ms) {
    int status = 0;
    while (!timed_out) {
        const pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        if (ret < 0 && errno != EINTR) return -1;
        if (clock_type::now() >= deadline) break;
        usleep(10000);
    }

    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    fprintf(stderr, "run-cmd: %s timed out after %d ms\n", prog, timeout_ms);
    return -1;
}

} // namespace

int run_cmd(const char * const argv[], int timeout_ms,
            const std::string * stdin_data,
            std::string * stdout_data) {
    const auto deadline = clock_type::now() + std::chrono::milliseconds(timeout_ms);

    pipe_fds in_pipe;
    pipe_fds out_pipe;
    pipe_fds * in  = stdin_data  ? &in_pipe  : nullptr;
    pipe_fds * out = stdout_data ? &out_pipe : nullptr;

    if ((in && !in->open()) || (out && !out->open())) {
        fprintf(stderr, "run-cmd: pipe failed for %s: %s\n", argv[0], strerror(errno));
        return -1;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        fprintf(stderr, "run-cmd: fork failed for %s: %s\n", argv[0], strerror(errno));
        return -1;
    }
    if (pid == 0) {
        exec_child(argv, in, out);
    }

    // Parent keeps the write end of stdin and the read end of stdout
    if (in)  in->close_rd();
    if (out) {
        out->close_wr();
        stdout_data->clear();
    }

    // A child exiting early closes its stdin; don't die writing to it
    struct sigaction ignore_pipe = {};
    struct sigaction old_pipe    = {};
    ignore_pipe.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ignore_pipe, &old_pipe);

    const bool done = pump(in, stdin_data, out, stdout_data, deadline);

    sigaction(SIGPIPE, &old_pipe, nullptr);

    return reap(pid, deadline, !done, argv[0], timeout_ms);
}

bool have_program(const char * prog) {
    const std::string script = std::string("command -v ") + prog;
    const char * argv[] = {"sh", "-c", script.c_str(), nullptr};
    std::string out;
    return run_cmd(argv, CMD_TIMEOUT_MS, nullptr, &out) == 0;
}

void chomp(std::string & s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
}
