#include "logvec/ingest/line_source.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logvec/common/logger.h"

namespace logvec {
namespace ingest {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr size_t kReadChunk = 4096;

std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        out += arg;
    }
    return out;
}

void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

// ============================================================================
// SubprocessLineSource
// ============================================================================

SubprocessLineSource::SubprocessLineSource(std::vector<std::string> argv,
                                           std::chrono::milliseconds stop_grace)
    : argv_(std::move(argv)), stop_grace_(stop_grace) {
}

SubprocessLineSource::~SubprocessLineSource() {
    stop();
    close_pipe();
}

core::Result<void> SubprocessLineSource::start() {
    if (argv_.empty()) {
        return core::Result<void>::error("No command configured",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ > 0) {
        return core::Result<void>::error("Source process already running (pid " +
                                         std::to_string(pid_) + ")");
    }
    close_pipe();
    buffer_.clear();

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return core::Result<void>::error(std::string("pipe failed: ") + std::strerror(errno),
                                         core::Error::Code::INTERNAL);
    }

    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        // Child: stdout -> pipe, stderr -> /dev/null
        if (dup2(fds[1], STDOUT_FILENO) < 0) {
            _exit(127);
        }
        close(fds[0]);
        close(fds[1]);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(args[0], args.data());
        _exit(127);
    }
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        return core::Result<void>::error(std::string("fork failed: ") + std::strerror(err),
                                         core::Error::Code::INTERNAL);
    }

    close(fds[1]);
    read_fd_ = fds[0];
    pid_ = pid;
    stopping_.store(false);
    LOGVEC_INFO("Started log source '{}' (pid {})", join_argv(argv_), pid_);
    return core::Result<void>();
}

std::optional<std::string> SubprocessLineSource::read_line() {
    char chunk[kReadChunk];
    while (true) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            strip_carriage_return(line);
            return line;
        }
        if (stopping_.load() || read_fd_ < 0) {
            return std::nullopt;
        }

        pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOGVEC_ERROR("poll on log source failed: {}", std::strerror(errno));
            return std::nullopt;
        }

        ssize_t n = read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            LOGVEC_ERROR("read from log source failed: {}", std::strerror(errno));
        }

        // End of stream: hand out a final unterminated line, if any.
        close_pipe();
        if (!buffer_.empty()) {
            std::string line;
            line.swap(buffer_);
            strip_carriage_return(line);
            return line;
        }
        return std::nullopt;
    }
}

void SubprocessLineSource::stop() {
    stopping_.store(true);
    terminate_and_reap();
}

void SubprocessLineSource::terminate_and_reap() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ <= 0) {
        return;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        if (kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
            LOGVEC_WARN("kill(SIGTERM) on log source pid {} failed: {}", pid_, std::strerror(errno));
        }
        auto deadline = std::chrono::steady_clock::now() + stop_grace_;
        while (std::chrono::steady_clock::now() < deadline) {
            result = waitpid(pid_, &status, WNOHANG);
            if (result != 0) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (result == 0) {
            LOGVEC_WARN("Log source pid {} ignored SIGTERM, sending SIGKILL", pid_);
            if (kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
                LOGVEC_ERROR("kill(SIGKILL) on log source pid {} failed: {}", pid_, std::strerror(errno));
            }
            result = waitpid(pid_, &status, 0);
        }
    }

    if (result == pid_) {
        last_status_ = status;
        if (WIFEXITED(status)) {
            LOGVEC_INFO("Log source pid {} exited with code {}", pid_, WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            LOGVEC_INFO("Log source pid {} terminated by signal {}", pid_, WTERMSIG(status));
        }
    } else if (result < 0 && errno != ECHILD) {
        LOGVEC_ERROR("waitpid({}) failed: {}", pid_, std::strerror(errno));
    }
    pid_ = -1;
}

void SubprocessLineSource::close_pipe() {
    if (read_fd_ >= 0) {
        close(read_fd_);
        read_fd_ = -1;
    }
}

std::string SubprocessLineSource::describe() const {
    return "subprocess '" + join_argv(argv_) + "'";
}

pid_t SubprocessLineSource::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return pid_;
}

int SubprocessLineSource::last_exit_status() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return last_status_;
}

// ============================================================================
// StreamLineSource
// ============================================================================

StreamLineSource::StreamLineSource(std::istream& in)
    : in_(&in) {
}

StreamLineSource::StreamLineSource(std::string path)
    : path_(std::move(path)) {
}

core::Result<void> StreamLineSource::start() {
    if (in_ != nullptr) {
        return core::Result<void>();
    }
    file_ = std::make_unique<std::ifstream>(path_);
    if (!file_->is_open()) {
        file_.reset();
        return core::Result<void>::error("Cannot open replay file: " + path_,
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    in_ = file_.get();
    return core::Result<void>();
}

std::optional<std::string> StreamLineSource::read_line() {
    if (stopped_.load() || in_ == nullptr) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(*in_, line)) {
        return std::nullopt;
    }
    strip_carriage_return(line);
    return line;
}

std::string StreamLineSource::describe() const {
    return path_.empty() ? std::string("input stream") : "file '" + path_ + "'";
}

std::unique_ptr<LineSource> CreateLineSource(const std::vector<std::string>& command,
                                             const std::string& replay_file,
                                             std::chrono::milliseconds stop_grace) {
    if (!replay_file.empty()) {
        return std::make_unique<StreamLineSource>(replay_file);
    }
    return std::make_unique<SubprocessLineSource>(command, stop_grace);
}

} // namespace ingest
} // namespace logvec
