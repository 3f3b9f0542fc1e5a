#include "collectors/FeedCollector.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace castbar::collectors {

namespace {

constexpr int kPollTimeoutMs = 200;
constexpr auto kRetryDelay = std::chrono::milliseconds(1000);

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        auto tab = line.find('\t', start);
        fields.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return fields;
}

// Sleeps in short slices so a stop request is seen promptly
void wait_for(std::stop_token& stop_token, std::chrono::milliseconds total) {
    auto deadline = std::chrono::steady_clock::now() + total;
    while (!stop_token.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs));
    }
}

}  // namespace

FeedCollector::FeedCollector(std::string path) : path_(std::move(path)) {
}

std::vector<std::string> FeedCollector::list_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {known_.begin(), known_.end()};
}

void FeedCollector::set_listener(UpdateHandler on_update, RemoveHandler on_remove) {
    on_update_ = std::move(on_update);
    on_remove_ = std::move(on_remove);
}

std::optional<FeedEvent> FeedCollector::parse_line(const std::string& line) {
    auto fields = split_tabs(line);
    if (fields.empty()) {
        return std::nullopt;
    }

    FeedEvent event;
    if (fields[0] == "update") {
        event.kind = FeedEvent::Kind::Update;
    } else if (fields[0] == "remove") {
        event.kind = FeedEvent::Kind::Remove;
    } else {
        return std::nullopt;
    }

    auto& snap = event.snapshot;
    for (size_t i = 1; i < fields.size(); ++i) {
        const auto& field = fields[i];
        if (field.empty()) continue;

        auto eq = field.find('=');
        if (eq == std::string::npos) {
            return std::nullopt;
        }
        std::string key = field.substr(0, eq);
        std::string value = field.substr(eq + 1);

        if (key == "id") snap.id = value;
        else if (key == "name") snap.name = value;
        else if (key == "status") snap.status = model::parse_status(value);
        else if (key == "artist") snap.artist = value;
        else if (key == "title") snap.title = value;
        else if (key == "album") snap.album = value;
        else if (key == "app") snap.app = value;
        // Unknown keys are ignored so bridges can send extra fields
    }

    if (snap.id.empty()) {
        return std::nullopt;
    }
    return event;
}

bool FeedCollector::handle_line(const std::string& line) {
    if (line.empty() || line[0] == '#') {
        return true;
    }

    auto event = parse_line(line);
    if (!event) {
        util::Logger::warn("FeedCollector: Skipping malformed line: " + line);
        return false;
    }

    const auto& id = event->snapshot.id;
    if (event->kind == FeedEvent::Kind::Update) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            known_.insert(id);
        }
        if (on_update_) on_update_(id, event->snapshot);
    } else {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            known_.erase(id);
        }
        if (on_remove_) on_remove_(id);
    }
    return true;
}

void FeedCollector::consume(std::string_view data) {
    pending_.append(data);

    size_t newline;
    while ((newline = pending_.find('\n')) != std::string::npos) {
        if (discarding_) {
            // Tail of an oversize line
            pending_.erase(0, newline + 1);
            discarding_ = false;
            continue;
        }
        std::string line = pending_.substr(0, newline);
        pending_.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.size() > kMaxLineBytes) {
            util::Logger::warn("FeedCollector: Dropping " + std::to_string(line.size()) +
                "-byte line from " + path_);
            continue;
        }
        handle_line(line);
    }

    if (pending_.size() > kMaxLineBytes) {
        if (!discarding_) {
            util::Logger::warn("FeedCollector: Dropping line over " + std::to_string(kMaxLineBytes) +
                " bytes from " + path_);
        }
        discarding_ = true;
        pending_.clear();
    }
}

void FeedCollector::reset_pending() {
    pending_.clear();
    discarding_ = false;
}

int FeedCollector::open_feed() const {
    return ::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
}

void FeedCollector::run(std::stop_token stop_token) {
    bool open_error_logged = false;

    while (!stop_token.stop_requested()) {
        int fd = open_feed();
        if (fd < 0) {
            if (!open_error_logged) {
                util::Logger::warn("FeedCollector: Cannot open " + path_ + ": " +
                    std::strerror(errno) + ", retrying");
                open_error_logged = true;
            }
            wait_for(stop_token, kRetryDelay);
            continue;
        }
        open_error_logged = false;

        struct stat st {};
        bool is_fifo = ::fstat(fd, &st) == 0 && S_ISFIFO(st.st_mode);
        util::Logger::info("FeedCollector: Reading " + path_ + (is_fifo ? " (fifo)" : ""));

        reset_pending();
        bool reopen = false;
        while (!stop_token.stop_requested() && !reopen) {
            struct pollfd pfd = {fd, POLLIN, 0};
            int ret = ::poll(&pfd, 1, kPollTimeoutMs);
            if (ret < 0) {
                if (errno == EINTR) continue;
                util::Logger::error("FeedCollector: poll failed: " + std::string(std::strerror(errno)));
                reopen = true;
                break;
            }
            if (ret == 0) continue;

            char buf[4096];
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                util::Logger::error("FeedCollector: read failed: " + std::string(std::strerror(errno)));
                reopen = true;
                break;
            }
            if (n == 0) {
                if (is_fifo) {
                    // Writer went away; reopen to wait for the next one
                    util::Logger::debug("FeedCollector: Writer closed " + path_);
                    reopen = true;
                } else {
                    // Regular file: follow appends
                    wait_for(stop_token, std::chrono::milliseconds(kPollTimeoutMs));
                }
                continue;
            }

            consume(std::string_view(buf, static_cast<size_t>(n)));
        }

        ::close(fd);
    }

    util::Logger::info("FeedCollector: Stopped");
}

}  // namespace castbar::collectors
