#ifndef LOGVEC_INGEST_LINE_SOURCE_H_
#define LOGVEC_INGEST_LINE_SOURCE_H_

#include <atomic>
#include <chrono>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "logvec/core/result.h"

namespace logvec {
namespace ingest {

/**
 * @brief Producer of newline-delimited raw log lines
 */
class LineSource {
public:
    virtual ~LineSource() = default;

    virtual core::Result<void> start() = 0;

    /**
     * @brief Next line without its trailing newline.
     * @return std::nullopt at end of stream or once stop() was called
     */
    virtual std::optional<std::string> read_line() = 0;

    /**
     * @brief Make read_line() return promptly and release OS resources.
     *
     * Safe to call from any thread and more than once.
     */
    virtual void stop() = 0;

    /**
     * @brief Whether start() may be called again after end of stream
     */
    virtual bool restartable() const = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Streams the stdout of a child process (e.g. `journalctl -f`).
 *
 * stop() sends SIGTERM, waits up to the grace period, escalates to SIGKILL
 * and always reaps the child, so no zombie outlives the source. The pipe is
 * polled with a short timeout so a reader blocked in read_line() notices
 * stop() without needing the child to write anything.
 */
class SubprocessLineSource : public LineSource {
public:
    explicit SubprocessLineSource(std::vector<std::string> argv,
                                  std::chrono::milliseconds stop_grace = std::chrono::milliseconds(5000));
    ~SubprocessLineSource() override;

    SubprocessLineSource(const SubprocessLineSource&) = delete;
    SubprocessLineSource& operator=(const SubprocessLineSource&) = delete;

    core::Result<void> start() override;
    std::optional<std::string> read_line() override;
    void stop() override;
    bool restartable() const override { return true; }
    std::string describe() const override;

    pid_t pid() const;

    /**
     * @brief Raw wait status of the last reaped child, -1 if none yet
     */
    int last_exit_status() const;

private:
    void terminate_and_reap();
    void close_pipe();

    std::vector<std::string> argv_;
    std::chrono::milliseconds stop_grace_;

    mutable std::mutex process_mutex_;
    pid_t pid_ = -1;
    int last_status_ = -1;

    int read_fd_ = -1;
    std::string buffer_;
    std::atomic<bool> stopping_{false};
};

/**
 * @brief Reads lines from a std::istream, or from a file it opens itself.
 *
 * Used to replay captured logs. End of stream is final.
 */
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& in);
    explicit StreamLineSource(std::string path);

    core::Result<void> start() override;
    std::optional<std::string> read_line() override;
    void stop() override { stopped_.store(true); }
    bool restartable() const override { return false; }
    std::string describe() const override;

private:
    std::string path_;
    std::unique_ptr<std::ifstream> file_;
    std::istream* in_ = nullptr;
    std::atomic<bool> stopped_{false};
};

/**
 * @brief Build the configured source: a replay file if one is set, otherwise
 *        the subprocess command
 */
std::unique_ptr<LineSource> CreateLineSource(const std::vector<std::string>& command,
                                             const std::string& replay_file,
                                             std::chrono::milliseconds stop_grace);

} // namespace ingest
} // namespace logvec

#endif // LOGVEC_INGEST_LINE_SOURCE_H_
