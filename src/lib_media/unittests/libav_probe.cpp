#include "tests/tests.hpp"
#include "lib_media/probe/libav_probe.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/os.hpp"

using namespace Media;

namespace {

unittest("LibavProbe: missing file gives the default resolution") {
	LibavProbe probe(getNullLog());
	auto const res = probe.resolution("/nonexistent/video.mp4");
	ASSERT_EQUALS(384, res.width);
	ASSERT_EQUALS(288, res.height);
}

unittest("LibavProbe: unknown duration") {
	LibavProbe probe(getNullLog());
	double duration = -1;
	ASSERT(!probe.duration("/nonexistent/video.mp4", duration));
	ASSERT_EQUALS(-1.0, duration);
}

unittest("LibavProbe: not a media file") {
	auto const path = format("/tmp/captioner_probe_%s.txt", getPid());
	writeFile(path, "this is not a video");

	LibavProbe probe(getNullLog());
	auto const res = probe.resolution(path);
	double duration = 0;
	auto const hasDuration = probe.duration(path, duration);
	removeFile(path);

	ASSERT_EQUALS(384, res.width);
	ASSERT(!hasDuration);
}

}
