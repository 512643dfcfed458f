#include "meshcast/transport/FrameTag.hpp"

#include <cassert>
#include <stdexcept>

using meshcast::transport::FrameTag;
using meshcast::transport::kMaxFrameNumber;
using meshcast::transport::pack_frame_tag;
using meshcast::transport::unpack_frame_tag;

int main() {
    // frame * 10000 + part + total * 100
    assert(pack_frame_tag(FrameTag{7, 0, 0}) == 70000);
    assert(pack_frame_tag(FrameTag{7, 2, 3}) == 70302);
    assert(pack_frame_tag(FrameTag{0, 98, 99}) == 9998);

    const auto decoded = unpack_frame_tag(70302);
    assert(decoded.has_value());
    assert(decoded->frame_number == 7);
    assert(decoded->part_number == 2);
    assert(decoded->total_parts == 3);
    assert(!decoded->single_part());

    const auto single = unpack_frame_tag(120000);
    assert(single.has_value());
    assert(single->frame_number == 12);
    assert(single->single_part());

    for (const FrameTag tag : {FrameTag{0, 0, 0}, FrameTag{1, 0, 2}, FrameTag{1, 1, 2}, FrameTag{99999, 42, 99},
                               FrameTag{kMaxFrameNumber, 98, 99}}) {
        const auto round_trip = unpack_frame_tag(pack_frame_tag(tag));
        assert(round_trip.has_value());
        assert(*round_trip == tag);
    }

    assert(meshcast::transport::is_signal_tag(-1));
    assert(meshcast::transport::is_signal_tag(-10));
    assert(!meshcast::transport::is_signal_tag(-11));
    assert(!meshcast::transport::is_signal_tag(0));
    assert(!unpack_frame_tag(-1).has_value());
    assert(!unpack_frame_tag(-10).has_value());

    bool threw = false;
    try {
        (void)pack_frame_tag(FrameTag{-1, 0, 0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)pack_frame_tag(FrameTag{kMaxFrameNumber + 1, 0, 0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)pack_frame_tag(FrameTag{1, 0, 100});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
