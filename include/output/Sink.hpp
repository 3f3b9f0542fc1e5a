#pragma once

#include <functional>
#include <string>

namespace castbar::output {

// Destination for rendered frames (one line per frame).
class Sink {
public:
    virtual ~Sink() = default;

    // Writes `line` plus '\n' in full or throws std::system_error.
    virtual void write_line(const std::string& line) = 0;
};

/**
 * File, FIFO or stdout ("-") opened once for appending.
 * Each line goes out through a single buffer so a reader never sees a
 * partial frame from this process.
 *
 * Opening a FIFO blocks until a reader appears. When a signal interrupts
 * the open or a write and `interrupted` returns true, the call gives up
 * with std::system_error(EINTR) instead of retrying.
 */
class FileSink : public Sink {
public:
    using Interrupted = std::function<bool()>;

    explicit FileSink(const std::string& path, Interrupted interrupted = nullptr);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write_line(const std::string& line) override;

    const std::string& path() const { return path_; }

private:
    bool should_abort() const { return interrupted_ && interrupted_(); }

    std::string path_;
    Interrupted interrupted_;
    int fd_ = -1;
    bool owns_fd_ = false;
};

}  // namespace castbar::output
