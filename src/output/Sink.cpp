#include "output/Sink.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace castbar::output {

FileSink::FileSink(const std::string& path, Interrupted interrupted)
    : path_(path), interrupted_(std::move(interrupted)) {
    if (path_.empty() || path_ == "-") {
        fd_ = STDOUT_FILENO;
        owns_fd_ = false;
        util::Logger::info("FileSink: Writing frames to stdout");
        return;
    }

    // Blocks until a reader opens the FIFO, like a shell redirect would
    while ((fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644)) < 0) {
        int err = errno;
        if (err == EINTR && !should_abort()) {
            continue;
        }
        throw std::system_error(err, std::generic_category(), "open " + path_);
    }
    owns_fd_ = true;
    util::Logger::info("FileSink: Writing frames to " + path_);
}

FileSink::~FileSink() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

void FileSink::write_line(const std::string& line) {
    std::string buffer = line;
    buffer += '\n';

    size_t written = 0;
    while (written < buffer.size()) {
        ssize_t n = ::write(fd_, buffer.data() + written, buffer.size() - written);
        if (n < 0) {
            int err = errno;
            if (err == EINTR && !should_abort()) {
                continue;
            }
            throw std::system_error(err, std::generic_category(), "write " + path_);
        }
        written += static_cast<size_t>(n);
    }
}

}  // namespace castbar::output
