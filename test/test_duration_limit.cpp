#include <cassert>
#include <cstdio>
#include <cmath>
#include "FakeSurface.h"
#include "trimmer/TimePositionMapper.h"
#include "trimmer/TrimBounds.h"
#include "trimmer/TrimmerSettings.h"
#include "trimmer/HandleDragController.h"
#include "trimmer/DurationLimiter.h"

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

struct LimitFixture {
    FakeSurface surface;
    TrimmerSettings settings;
    TimePositionMapper mapper{surface};
    TrimBounds bounds{mapper, settings};
    DurationLimiter limiter{bounds, mapper, settings};
    HandleDragController drag{bounds};

    LimitFixture() {
        surface.loadSeconds(10.0);
        bounds.setViewWidth(330.0);
    }

    double selected() const {
        return bounds.endTime()->seconds() - bounds.startTime()->seconds();
    }
};

void test_no_cap_is_noop() {
    LimitFixture f;
    assert(!f.limiter.enforce(TrimHandle::TrimStart));
    assert(f.bounds.state().rightOffset == 0.0);
    printf("PASS: test_no_cap_is_noop\n");
}

void test_cap_pulls_end_handle() {
    LimitFixture f;
    f.settings.maxDuration = 5.0;
    assert(f.limiter.enforce(TrimHandle::TrimStart));
    assert(near(f.bounds.state().rightOffset, -150.0));
    assert(*f.bounds.endTime() == MediaTime::fromSeconds(5.0));
    assert(near(f.selected(), 5.0));

    // Already within the cap
    assert(!f.limiter.enforce(TrimHandle::TrimStart));
    printf("PASS: test_cap_pulls_end_handle\n");
}

void test_dragging_end_pushes_start() {
    LimitFixture f;
    f.settings.maxDuration = 5.0;
    f.limiter.enforce(TrimHandle::TrimStart);

    f.drag.begin(TrimHandle::TrimEnd);
    f.drag.move(TrimHandle::TrimEnd, 150.0);
    assert(f.limiter.enforce(TrimHandle::TrimEnd));
    f.drag.finish(TrimHandle::TrimEnd);

    assert(f.bounds.state().rightOffset == 0.0);
    assert(near(f.bounds.state().leftOffset, 150.0));
    assert(*f.bounds.startTime() == MediaTime::fromSeconds(5.0));
    assert(near(f.selected(), 5.0));
    printf("PASS: test_dragging_end_pushes_start\n");
}

void test_dragging_start_pulls_end() {
    LimitFixture f;
    f.settings.maxDuration = 4.0;
    f.bounds.setOffset(TrimHandle::TrimStart, 150.0);
    f.bounds.setOffset(TrimHandle::TrimEnd, -30.0);

    f.drag.begin(TrimHandle::TrimStart);
    f.drag.move(TrimHandle::TrimStart, -90.0);
    assert(f.limiter.enforce(TrimHandle::TrimStart));
    f.drag.finish(TrimHandle::TrimStart);

    assert(*f.bounds.startTime() == MediaTime::fromSeconds(2.0));
    assert(*f.bounds.endTime() == MediaTime::fromSeconds(6.0));
    printf("PASS: test_dragging_start_pulls_end\n");
}

void test_mark_moves_are_not_capped() {
    LimitFixture f;
    f.settings.maxDuration = 5.0;
    assert(!f.limiter.enforce(TrimHandle::MarkStart));
    assert(!f.limiter.enforce(TrimHandle::PositionBar));
    assert(f.bounds.state().rightOffset == 0.0);
    printf("PASS: test_mark_moves_are_not_capped\n");
}

void test_cap_reclamps_position() {
    LimitFixture f;
    f.bounds.setOffset(TrimHandle::PositionBar, 300.0);
    f.settings.maxDuration = 5.0;
    f.limiter.enforce(TrimHandle::TrimStart);
    assert(near(f.bounds.state().positionOffset, 150.0));
    printf("PASS: test_cap_reclamps_position\n");
}

void test_without_asset() {
    LimitFixture f;
    f.surface.duration.reset();
    f.settings.maxDuration = 5.0;
    assert(!f.limiter.enforce(TrimHandle::TrimStart));
    printf("PASS: test_without_asset\n");
}

int main() {
    test_no_cap_is_noop();
    test_cap_pulls_end_handle();
    test_dragging_end_pushes_start();
    test_dragging_start_pulls_end();
    test_mark_moves_are_not_capped();
    test_cap_reclamps_position();
    test_without_asset();
    printf("All duration limit tests passed.\n");
    return 0;
}
