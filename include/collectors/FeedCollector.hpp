#pragma once

#include "collectors/DiscoveryClient.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace castbar::collectors {

// One parsed line of the device feed.
struct FeedEvent {
    enum class Kind { Update, Remove };
    Kind kind = Kind::Update;
    model::DeviceSnapshot snapshot;   // Only id is set for Remove
};

/**
 * Discovery client reading device events from a FIFO or file written by a
 * cast bridge. One event per line, TAB separated:
 *
 *   update  id=<uuid>  name=<name>  status=PLAYING  artist=..  title=..
 *   remove  id=<uuid>
 *
 * Optional update keys: artist, title, album, app. Blank lines and lines
 * starting with '#' are skipped.
 */
class FeedCollector : public DiscoveryClient {
public:
    explicit FeedCollector(std::string path);
    ~FeedCollector() override = default;

    std::vector<std::string> list_devices() const override;
    void set_listener(UpdateHandler on_update, RemoveHandler on_remove) override;
    void run(std::stop_token stop_token) override;

    // Applies one line; returns false when it was malformed
    bool handle_line(const std::string& line);

    // Splits raw feed bytes into lines and applies each complete one. A line
    // longer than kMaxLineBytes is logged and dropped up to its newline.
    void consume(std::string_view data);
    void reset_pending();
    size_t pending_bytes() const { return pending_.size(); }

    static constexpr size_t kMaxLineBytes = 64 * 1024;

    static std::optional<FeedEvent> parse_line(const std::string& line);

private:
    int open_feed() const;

    std::string path_;
    UpdateHandler on_update_;
    RemoveHandler on_remove_;

    // Partial line, only touched by the reading thread
    std::string pending_;
    bool discarding_ = false;

    std::set<std::string> known_;
    mutable std::mutex mutex_;
};

}  // namespace castbar::collectors
