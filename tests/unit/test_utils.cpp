#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "model/DeviceSnapshot.hpp"
#include "ui/Formatting.hpp"
#include "ui/Marquee.hpp"
#include "ui/StatusFormatter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace castbar;
using model::DeviceSnapshot;
using model::PlaybackStatus;
using std::chrono::milliseconds;

static DeviceSnapshot playing(const std::string& artist, const std::string& title) {
    DeviceSnapshot d;
    d.id = "uuid-1";
    d.name = "Kitchen";
    d.artist = artist;
    d.title = title;
    d.status = PlaybackStatus::Playing;
    return d;
}

// ---------- Formatting ----------

TEST_CASE(test_display_cols_counts_codepoints_not_bytes) {
    ASSERT_EQ(ui::display_cols("abc"), 3);
    ASSERT_EQ(ui::display_cols("Björk"), 5);
    ASSERT_EQ(ui::display_cols("▶ 日本"), 4);
    // e + combining acute normalizes to a single é
    ASSERT_EQ(ui::display_cols("e\xCC\x81"), 1);
    ASSERT_EQ(ui::display_cols(""), 0);
}

TEST_CASE(test_take_cols_and_trunc_pad) {
    ASSERT_EQ(ui::take_cols("Sigur Rós", 8), "Sigur Ró");
    ASSERT_EQ(ui::take_cols("abc", 0), "");
    ASSERT_EQ(ui::trunc_pad("ab", 4), "ab  ");
    ASSERT_EQ(ui::trunc_pad("日本語です", 3), "日本語");
    ASSERT_EQ(ui::trunc_pad("abc", 3), "abc");
}

// ---------- DeviceSnapshot ----------

TEST_CASE(test_parse_status_words) {
    ASSERT_TRUE(model::parse_status("PLAYING") == PlaybackStatus::Playing);
    ASSERT_TRUE(model::parse_status("buffering") == PlaybackStatus::Playing);
    ASSERT_TRUE(model::parse_status("Paused") == PlaybackStatus::Paused);
    ASSERT_TRUE(model::parse_status("IDLE") == PlaybackStatus::Idle);
    ASSERT_TRUE(model::parse_status("UNKNOWN") == PlaybackStatus::Idle);
    ASSERT_TRUE(model::parse_status("") == PlaybackStatus::Idle);
}

// ---------- StatusFormatter ----------

TEST_CASE(test_formatter_substitutes_fields) {
    auto snap = playing("Daft Punk", "One More Time");
    std::string out = ui::StatusFormatter::format("{name}: {artist} - {title}", snap, false);
    ASSERT_EQ(out, "Kitchen: Daft Punk - One More Time");
}

TEST_CASE(test_formatter_status_glyphs_and_labels) {
    DeviceSnapshot snap = playing("A", "B");
    ASSERT_EQ(ui::StatusFormatter::format("{status}", snap, true), "▶");
    ASSERT_EQ(ui::StatusFormatter::format("{status}", snap, false), ">");

    snap.status = PlaybackStatus::Paused;
    ASSERT_EQ(ui::StatusFormatter::format("{status}", snap, true), "⏸");
    ASSERT_EQ(ui::StatusFormatter::format("{status}", snap, false), "||");

    snap.status = PlaybackStatus::Idle;
    ASSERT_EQ(ui::StatusFormatter::format("{status}", snap, true), "⏹");
    ASSERT_EQ(ui::StatusFormatter::format("{status}", snap, false), "#");

    // Explicit spellings ignore the mode
    ASSERT_EQ(ui::StatusFormatter::format("{unicode_status}{status_text}", snap, false), "⏹#");
}

TEST_CASE(test_formatter_idle_blanks_media_fields) {
    DeviceSnapshot snap = playing("Stale Artist", "Stale Title");
    snap.album = "Stale Album";
    snap.status = PlaybackStatus::Idle;
    std::string out = ui::StatusFormatter::format("[{artist}|{title}|{album}|{name}]", snap, false);
    ASSERT_EQ(out, "[|||Kitchen]");
}

TEST_CASE(test_formatter_missing_values_render_empty) {
    DeviceSnapshot snap;
    snap.id = "x";
    snap.status = PlaybackStatus::Playing;
    ASSERT_EQ(ui::StatusFormatter::format("<{artist}><{app}><{album}>", snap, false), "<><><>");
}

TEST_CASE(test_formatter_unknown_placeholders_pass_through) {
    auto snap = playing("A", "B");
    ASSERT_EQ(ui::StatusFormatter::format("{bogus} {title}", snap, false), "{bogus} B");
    ASSERT_EQ(ui::StatusFormatter::format("{{title}} {title", snap, false), "{title} {title");
    ASSERT_EQ(ui::StatusFormatter::format("}{}", snap, false), "}{}");
}

TEST_CASE(test_formatter_accepts_p_prefix) {
    auto snap = playing("Artist", "Title");
    ASSERT_EQ(ui::StatusFormatter::format("{p.status}{p.artist} - {p.title}", snap, true),
              "▶Artist - Title");
}

TEST_CASE(test_formatter_artist_title_joins_present_parts) {
    auto snap = playing("Artist", "Title");
    ASSERT_EQ(ui::StatusFormatter::format("{artist_title}", snap, false), "Artist - Title");
    snap.artist.reset();
    ASSERT_EQ(ui::StatusFormatter::format("{artist_title}", snap, false), "Title");
}

TEST_CASE(test_formatter_default_layout) {
    auto snap = playing("Artist", "Title");
    snap.app = "Spotify";
    ASSERT_EQ(ui::StatusFormatter::format("", snap, false), "Kitchen : Spotify | Artist - Title");

    snap.app.reset();
    snap.artist.reset();
    ASSERT_EQ(ui::StatusFormatter::default_layout(snap), "Kitchen - Title");

    ASSERT_EQ(ui::StatusFormatter::default_layout(model::placeholder_snapshot()), "");
}

TEST_CASE(test_formatter_placeholder_renders_empty_fields) {
    ui::StatusFormatter formatter("{status} {artist} - {title}", false);
    ASSERT_EQ(formatter.format(model::placeholder_snapshot()), "#  - ");
}

// ---------- Marquee ----------

TEST_CASE(test_marquee_fitting_text_is_padded_forever) {
    ui::Marquee marquee("Hello", 8, 5.0, 2.0);
    ASSERT_TRUE(marquee.fits());
    for (int ms = 0; ms < 60000; ms += 137) {
        ASSERT_EQ(marquee.frame_at(milliseconds(ms)), "Hello   ");
    }
    ASSERT_TRUE(marquee.cycle_duration().count() == 0);
}

TEST_CASE(test_marquee_exact_width_is_static) {
    ui::Marquee marquee("abcde", 5, 10.0, 0.0);
    ASSERT_TRUE(marquee.fits());
    ASSERT_EQ(marquee.frame_at(milliseconds(0)), "abcde");
    ASSERT_EQ(marquee.frame_at(milliseconds(12345)), "abcde");
}

TEST_CASE(test_marquee_now_playing_first_frame) {
    ui::Marquee still("Now Playing: Foo", 10, 0.0, 2.0);
    ASSERT_FALSE(still.fits());
    for (int ms = 0; ms < 30000; ms += 500) {
        ASSERT_EQ(still.frame_at(milliseconds(ms)), "Now Playin");
    }

    ui::Marquee moving("Now Playing: Foo", 10, 4.0, 2.0);
    ASSERT_EQ(moving.frame_at(milliseconds(0)), "Now Playin");
    ASSERT_EQ(moving.frame_at(milliseconds(1999)), "Now Playin");
}

TEST_CASE(test_marquee_scrolls_with_space_separator) {
    // speed 4 -> one step every 250ms, pause 1s
    ui::Marquee marquee("abcdef", 4, 4.0, 1.0);
    ASSERT_EQ(marquee.frame_at(milliseconds(0)), "abcd");
    ASSERT_EQ(marquee.frame_at(milliseconds(1000)), "abcd");   // scrolling, offset 0
    ASSERT_EQ(marquee.frame_at(milliseconds(1250)), "bcde");
    ASSERT_EQ(marquee.frame_at(milliseconds(1500)), "cdef");
    ASSERT_EQ(marquee.frame_at(milliseconds(1750)), "def ");
    ASSERT_EQ(marquee.frame_at(milliseconds(2000)), "ef a");
    ASSERT_EQ(marquee.frame_at(milliseconds(2250)), "f ab");
    ASSERT_EQ(marquee.frame_at(milliseconds(2500)), " abc");
}

TEST_CASE(test_marquee_caps_unbounded_timings) {
    const double inf = std::numeric_limits<double>::infinity();

    // An endless pause holds the first slice instead of wrapping into scrolling
    ui::Marquee held("A long status line that does not fit", 10, 5.0, inf);
    ASSERT_EQ(held.frame_at(std::chrono::seconds(5)), "A long sta");
    ASSERT_EQ(held.frame_at(std::chrono::hours(23)), "A long sta");
    ASSERT_TRUE(held.position_at(std::chrono::hours(23)).phase == ui::Marquee::Phase::Paused);

    // A near-zero speed steps at most once per kMaxInterval
    ui::Marquee crawl("abcdef", 4, 1e-12, 0.0);
    ASSERT_EQ(crawl.frame_at(std::chrono::hours(23)), "abcd");
    ASSERT_EQ(crawl.frame_at(std::chrono::hours(25)), "bcde");
    ASSERT_TRUE(crawl.cycle_duration() == std::chrono::duration_cast<ui::Marquee::Duration>(
        ui::Marquee::kMaxInterval * 7));

    // NaN behaves like 0: no pause, no movement
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ui::Marquee still("abcdef", 4, nan, nan);
    ASSERT_EQ(still.frame_at(std::chrono::seconds(90)), "abcd");
}

TEST_CASE(test_marquee_round_trip_returns_to_paused_start) {
    ui::Marquee marquee("abcdef", 4, 4.0, 1.0);
    std::string initial = marquee.frame_at(milliseconds(0));

    // pause + (length + 1) steps
    auto loop_end = milliseconds(1000 + 7 * 250);
    auto pos = marquee.position_at(loop_end);
    ASSERT_EQ(pos.offset, 0u);
    ASSERT_TRUE(pos.phase == ui::Marquee::Phase::Paused);
    ASSERT_EQ(marquee.frame_at(loop_end), initial);
    ASSERT_TRUE(marquee.cycle_duration() == loop_end);

    // One step before the end is the last scrolled offset
    auto before = marquee.position_at(loop_end - milliseconds(1));
    ASSERT_EQ(before.offset, 6u);
    ASSERT_TRUE(before.phase == ui::Marquee::Phase::Scrolling);
}

TEST_CASE(test_marquee_zero_pause_shows_start_once_per_loop) {
    ui::Marquee marquee("abcdef", 4, 4.0, 0.0);
    ASSERT_EQ(marquee.frame_at(milliseconds(0)), "abcd");
    ASSERT_EQ(marquee.frame_at(milliseconds(250)), "bcde");
    ASSERT_EQ(marquee.frame_at(milliseconds(7 * 250)), "abcd");
}

TEST_CASE(test_marquee_frame_records_state) {
    auto start = ui::Marquee::Clock::now();
    ui::Marquee marquee("abcdef", 4, 4.0, 1.0, start);

    marquee.frame(start + milliseconds(500));
    ASSERT_TRUE(marquee.state().phase == ui::Marquee::Phase::Paused);
    ASSERT_TRUE(marquee.state().phase_started_at == start);

    marquee.frame(start + milliseconds(1600));
    ASSERT_TRUE(marquee.state().phase == ui::Marquee::Phase::Scrolling);
    ASSERT_EQ(marquee.state().offset, 2u);
    ASSERT_TRUE(marquee.state().phase_started_at == start + milliseconds(1000));

    marquee.restart(start + milliseconds(1600));
    ASSERT_EQ(marquee.frame(start + milliseconds(1600)), "abcd");
}

TEST_CASE(test_marquee_unicode_offsets_are_codepoints) {
    ui::Marquee marquee("▶ 日本語の歌", 3, 1.0, 0.0);
    ASSERT_EQ(marquee.length(), 7u);
    ASSERT_EQ(marquee.frame_at_offset(0), "▶ 日");
    ASSERT_EQ(marquee.frame_at_offset(2), "日本語");
    ASSERT_EQ(marquee.frame_at_offset(6), "歌 ▶");
    ASSERT_EQ(marquee.frame_at_offset(8), marquee.frame_at_offset(0));
}

// ---------- Config ----------

TEST_CASE(test_config_defaults_are_valid) {
    backend::Config cfg;
    cfg.validate();
    ASSERT_EQ(cfg.width, 85);
    ASSERT_NEAR(cfg.period, 10.0, 1e-9);
    ASSERT_NEAR(cfg.marquee_speed, 5.0, 1e-9);
    ASSERT_NEAR(cfg.marquee_pause, 2.0, 1e-9);
    ASSERT_EQ(cfg.blacklist_regex, "^$");
}

TEST_CASE(test_config_rejects_bad_values) {
    backend::Config cfg;
    cfg.width = 0;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);

    cfg = backend::Config{};
    cfg.period = 0;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);

    cfg = backend::Config{};
    cfg.marquee_speed = -1;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);

    cfg = backend::Config{};
    cfg.marquee_pause = -0.5;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);

    cfg = backend::Config{};
    cfg.blacklist_regex = "([unclosed";
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);
}

TEST_CASE(test_config_rejects_non_finite_and_huge_timings) {
    const std::vector<std::vector<std::string>> bad_args = {
        {"--marquee_pause", "inf"},
        {"--marquee_pause", "nan"},
        {"--marquee_pause", "1e300"},
        {"--period", "inf"},
        {"--period", "nan"},
        {"--period", "1e300"},
        {"--marquee_speed", "inf"},
        {"--marquee_speed", "nan"},
        {"--marquee_speed", "1e-12"},
    };
    for (const auto& args : bad_args) {
        backend::Config cfg;
        backend::ConfigLoader::apply_args(cfg, args);
        ASSERT_THROWS(cfg.validate(), std::invalid_argument);
    }

    // The bound itself is accepted
    backend::Config cfg;
    cfg.period = backend::Config::kMaxSeconds;
    cfg.marquee_pause = backend::Config::kMaxSeconds;
    cfg.marquee_speed = 1.0 / backend::Config::kMaxSeconds;
    cfg.validate();
}

TEST_CASE(test_config_args_override) {
    backend::Config cfg;
    backend::ConfigLoader::apply_args(cfg, {
        "--period", "3.5", "-f", "{status} {title}", "-u", "--width=40",
        "--marquee_speed", "0", "--marquee_pause", "1", "--dedupe", "-v", "-v"});

    ASSERT_NEAR(cfg.period, 3.5, 1e-9);
    ASSERT_EQ(cfg.format, "{status} {title}");
    ASSERT_TRUE(cfg.unicode);
    ASSERT_EQ(cfg.width, 40);
    ASSERT_NEAR(cfg.marquee_speed, 0.0, 1e-9);
    ASSERT_TRUE(cfg.dedupe);
    ASSERT_EQ(cfg.effective_log_level(), "DEBUG");
    cfg.validate();
}

TEST_CASE(test_config_args_errors) {
    backend::Config cfg;
    ASSERT_THROWS(backend::ConfigLoader::apply_args(cfg, {"--width", "wide"}), std::invalid_argument);
    ASSERT_THROWS(backend::ConfigLoader::apply_args(cfg, {"--period"}), std::invalid_argument);
    ASSERT_THROWS(backend::ConfigLoader::apply_args(cfg, {"--frobnicate"}), std::invalid_argument);
}

TEST_CASE(test_config_quiet_clamps_at_warning) {
    backend::Config cfg;
    cfg.quiet = 5;
    ASSERT_EQ(cfg.effective_log_level(), "WARNING");
}

TEST_CASE(test_config_file_sections) {
    auto path = std::filesystem::temp_directory_path() / "castbar_test_config.toml";
    {
        std::ofstream f(path);
        f << "# castbar\n"
          << "[display]\n"
          << "format = \"{name} {status}\"\n"
          << "unicode = true\n"
          << "width = 30\n"
          << "[cycle]\n"
          << "period = 4\n"
          << "[marquee]\n"
          << "speed = 8\n"
          << "pause = not-a-number\n"
          << "[io]\n"
          << "output = /tmp/castbar.fifo\n"
          << "[log]\n"
          << "level = debug\n";
    }

    auto cfg = backend::ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.format, "{name} {status}");
    ASSERT_TRUE(cfg.unicode);
    ASSERT_EQ(cfg.width, 30);
    ASSERT_NEAR(cfg.period, 4.0, 1e-9);
    ASSERT_NEAR(cfg.marquee_speed, 8.0, 1e-9);
    ASSERT_NEAR(cfg.marquee_pause, 2.0, 1e-9);  // Bad value keeps the default
    ASSERT_EQ(cfg.output_path, "/tmp/castbar.fifo");
    ASSERT_EQ(cfg.log_level, "DEBUG");
}

int main() {
    return castbar::test::TestRunner::instance().run_all();
}
