#include <cassert>
#include <cstdio>
#include <cstdlib>
#include "media/MediaProbe.h"

void test_missing_file_fails() {
    MediaProbe probe;
    assert(!probe.probe("/nonexistent/cliptrimmer/clip.mp4"));
    assert(!probe.errorString().isEmpty());
    assert(probe.info().duration.isZero());
    printf("PASS: test_missing_file_fails\n");
}

void test_probe_video() {
    printf("=== test_probe_video ===\n");

#ifdef HAS_FFMPEG
    const char* path = std::getenv("CLIPTRIMMER_TEST_VIDEO");
    if (!path || !*path) {
        printf("SKIP: test_probe_video (CLIPTRIMMER_TEST_VIDEO not set)\n\n");
        return;
    }

    MediaProbe probe;
    bool ok = probe.probe(path);
    if (!ok) {
        printf("FAIL: probe failed - %s\n", probe.errorString().toUtf8().constData());
        assert(false);
    }

    const AssetInfo& info = probe.info();
    printf("  Container: %s\n", info.containerFormat.toUtf8().constData());
    printf("  Duration: %lld/%d (%.3f s)\n", static_cast<long long>(info.duration.value),
           info.duration.timescale, info.durationSeconds());
    if (info.hasVideo) {
        printf("  Video: %dx%d @ %.2f fps, %s\n", info.videoWidth, info.videoHeight,
               info.videoFps, info.videoCodec.toUtf8().constData());
    }

    assert(info.duration.isValid());
    assert(info.duration.value > 0);
    assert(info.durationSeconds() > 0.0);

    printf("PASS: test_probe_video\n\n");
#else
    printf("SKIP: test_probe_video (no FFmpeg)\n\n");
#endif
}

int main() {
    test_missing_file_fails();
    test_probe_video();
    printf("All media probe tests passed.\n");
    return 0;
}
