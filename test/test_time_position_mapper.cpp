#include <cassert>
#include <cstdio>
#include <cmath>
#include <cstdlib>
#include "FakeSurface.h"
#include "trimmer/TimePositionMapper.h"

void test_no_asset_yields_nothing() {
    FakeSurface surface;
    TimePositionMapper mapper(surface);

    assert(!mapper.positionFor(MediaTime::fromSeconds(5.0)));
    assert(!mapper.timeFor(150.0));
    assert(mapper.pixelsFor(3.0) == 0.0);

    surface.duration = MediaTime(0, 600);
    assert(!mapper.positionFor(MediaTime::fromSeconds(1.0)));
    assert(!mapper.timeFor(10.0));
    assert(mapper.pixelsFor(3.0) == 0.0);
    printf("PASS: test_no_asset_yields_nothing\n");
}

void test_linear_mapping() {
    FakeSurface surface;
    surface.loadSeconds(10.0);
    TimePositionMapper mapper(surface);

    auto mid = mapper.positionFor(MediaTime::fromSeconds(5.0));
    assert(mid && std::abs(*mid - 150.0) < 1e-9);

    // Different timescale than the asset
    auto quarter = mapper.positionFor(MediaTime(2500, 1000));
    assert(quarter && std::abs(*quarter - 75.0) < 1e-9);

    auto t = mapper.timeFor(150.0);
    assert(t && *t == MediaTime(3000, 600));
    assert(t->timescale == 600);
    printf("PASS: test_linear_mapping\n");
}

void test_time_clamped_to_asset() {
    FakeSurface surface;
    surface.loadSeconds(10.0);
    TimePositionMapper mapper(surface);

    assert(mapper.timeFor(-20.0)->value == 0);
    assert(*mapper.timeFor(400.0) == MediaTime::fromSeconds(10.0));

    surface.width = 0.0;
    assert(!mapper.timeFor(10.0));
    printf("PASS: test_time_clamped_to_asset\n");
}

void test_round_trip_within_one_tick() {
    FakeSurface surface;
    surface.loadSeconds(10.0);
    surface.width = 317.0;
    TimePositionMapper mapper(surface);

    for (int64_t v = 0; v <= 6000; v += 37) {
        MediaTime time(v, 600);
        auto position = mapper.positionFor(time);
        assert(position);
        auto back = mapper.timeFor(*position);
        assert(back);
        assert(std::llabs(back->value - v) <= 1);
    }
    printf("PASS: test_round_trip_within_one_tick\n");
}

void test_min_gap_pixels() {
    FakeSurface surface;
    surface.loadSeconds(1.0);
    surface.width = 1000.0;
    TimePositionMapper mapper(surface);

    assert(std::abs(mapper.pixelsFor(0.2) - 200.0) < 1e-9);

    // Follows the live geometry
    surface.width = 500.0;
    assert(std::abs(mapper.pixelsFor(0.2) - 100.0) < 1e-9);
    printf("PASS: test_min_gap_pixels\n");
}

int main() {
    test_no_asset_yields_nothing();
    test_linear_mapping();
    test_time_clamped_to_asset();
    test_round_trip_within_one_tick();
    test_min_gap_pixels();
    printf("All time position mapper tests passed.\n");
    return 0;
}
