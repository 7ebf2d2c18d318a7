#include <cassert>
#include <string>
#include "app/seek_mapper.hpp"

using app::Segment;
using app::Transcript;

static Transcript sample() {
    return Transcript{
        {0.0, 2.5, "こんにちは。"},
        {2.5, 5.0, "今日はいい天気ですね。"},
        {4.8, 7.2, "そうですね。"},   // overlaps the previous one
        {9.0, 12.0, "さようなら。"},
    };
}

static void test_map_selection() {
    Transcript t = sample();
    app::SeekCommand cmd;
    for (size_t i = 0; i < t.size(); ++i) {
        assert(app::map_selection(t, i, cmd));
        assert(cmd.segment_index == i);
        assert(cmd.offset_s == t[i].start_time);
    }
    cmd = app::SeekCommand{};
    assert(!app::map_selection(t, t.size(), cmd));
    assert(!app::map_selection(Transcript{}, 0, cmd));
    assert(cmd.offset_s == 0.0);
}

static void test_find_segment_at() {
    Transcript t = sample();
    assert(app::find_segment_at(Transcript{}, 1.0) == -1);
    assert(app::find_segment_at(t, 0.0) == 0);
    assert(app::find_segment_at(t, 2.49) == 0);
    assert(app::find_segment_at(t, 2.5) == 1);
    assert(app::find_segment_at(t, 4.9) == 2);
    assert(app::find_segment_at(t, 8.0) == 2);   // gap keeps the last started row
    assert(app::find_segment_at(t, 100.0) == 3);

    Transcript late{{1.0, 2.0, "a"}};
    assert(app::find_segment_at(late, 0.5) == -1);
}

static void test_format() {
    assert(app::format_timestamp(0.0) == "00:00.00");
    assert(app::format_timestamp(-3.0) == "00:00.00");
    assert(app::format_timestamp(2.5) == "00:02.50");
    assert(app::format_timestamp(61.234) == "01:01.23");
    assert(app::format_timestamp(3599.994) == "59:59.99");
    assert(app::format_timestamp(3723.0) == "1:02:03.00");
    assert(app::format_row(Segment{12.3, 14.0, "はい"}) == "[00:12.30] はい");
}

int main() {
    test_map_selection();
    test_find_segment_at();
    test_format();
    return 0;
}
