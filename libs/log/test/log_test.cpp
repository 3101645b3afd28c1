#include "slippymap/log.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

// Redirects std::cerr for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }

    [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // namespace

TEST(Log, InfoFollowsVerbosity) {
    CerrCapture capture;
    slippymap::log::set_verbosity(0);
    LOGI("hidden");
    slippymap::log::set_verbosity(1);
    LOGI("tile", 5);
    slippymap::log::set_verbosity(0);

    EXPECT_EQ(capture.text(), "[INFO] tile 5 \n");
}

TEST(Log, WarningsIgnoreVerbosity) {
    CerrCapture capture;
    slippymap::log::set_verbosity(0);
    LOGW("missing");
    LOGE("broken");

    EXPECT_EQ(capture.text(), "[WARN] missing \n[ERROR] broken \n");
}

TEST(Log, VerbosityIsClamped) {
    slippymap::log::set_verbosity(7);
    EXPECT_EQ(slippymap::log::current_level, slippymap::log::VerbosityLevel::Debug);
    slippymap::log::set_verbosity(-3);
    EXPECT_EQ(slippymap::log::current_level, slippymap::log::VerbosityLevel::Quiet);
}

TEST(Log, WarnOncePerKey) {
    CerrCapture capture;
    const uint64_t key = slippymap::log::detail::fnv1a_hash("/tiles/3/1/2.png");
    ASSERT_NE(key, slippymap::log::detail::fnv1a_hash("/tiles/3/1/3.png"));

    for (int i = 0; i < 3; ++i) LOGW_ONCE(key, "cannot draw tile");
    LOGW_ONCE(slippymap::log::detail::fnv1a_hash("/tiles/3/1/3.png"), "cannot draw tile");

    EXPECT_EQ(capture.text(), "[WARN] cannot draw tile \n[WARN] cannot draw tile \n");
}
