#include <gtest/gtest.h>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <hyperbox/anomaly_log.hpp>
#include <hyperbox/math_utils.hpp>

using namespace hyperbox;

TEST(test_math_utils, test_nanmin_nanmax){
    using namespace hyperbox::math;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    ASSERT_EQ(nanmin(1.0, 2.0), 1.0);
    ASSERT_EQ(nanmin(2.0, 1.0), 1.0);
    ASSERT_EQ(nanmax(1.0, 2.0), 2.0);
    ASSERT_EQ(nanmax(2.0, 1.0), 2.0);

    // NaN is discarded on either side
    ASSERT_EQ(nanmin(nan, -3.0), -3.0);
    ASSERT_EQ(nanmin(-3.0, nan), -3.0);
    ASSERT_EQ(nanmax(nan, 4.0), 4.0);
    ASSERT_EQ(nanmax(4.0, nan), 4.0);
    ASSERT_TRUE(std::isnan(nanmin(nan, nan)));
    ASSERT_TRUE(std::isnan(nanmax(nan, nan)));

    // infinities are real bounds
    const float inf = std::numeric_limits<float>::infinity();
    ASSERT_EQ(nanmin(inf, 1.0f), 1.0f);
    ASSERT_EQ(nanmax(-inf, 1.0f), 1.0f);

    // non floating point types
    ASSERT_FALSE(is_nan(3));
    ASSERT_EQ(nanmin(3, -4), -4);
    ASSERT_EQ(nanmax(3, -4), 3);

    static_assert(nanmin(std::numeric_limits<double>::quiet_NaN(), 1.0) == 1.0);
    static_assert(is_nan(std::numeric_limits<float>::quiet_NaN()));
}

TEST(test_anomaly_log, test_log_and_handle){
    using namespace hyperbox::util;
    std::ostringstream discard;
    AnomalyLog::handle_anomalies(discard);
    ASSERT_EQ(AnomalyLog::size(), 0u);

    AnomalyLog::log_anomaly("something went wrong");
    AnomalyLog::log_anomaly(Anomaly{"careful", warning_anomaly_tag{}});
    AnomalyLog::check(true, Anomaly{"never logged", general_anomaly_tag{}});
    AnomalyLog::check(false, Anomaly{"logged", general_anomaly_tag{}});
    expect(1 + 1 == 2, "arithmetic");
    expect(false, "expected failure");
    ASSERT_EQ(AnomalyLog::size(), 4u);

    std::ostringstream out;
    AnomalyLog::handle_anomalies(out);
    ASSERT_EQ(AnomalyLog::size(), 0u);

    std::string text = out.str();
    ASSERT_NE(text.find("Error: something went wrong"), std::string::npos);
    ASSERT_NE(text.find("Warning: careful"), std::string::npos);
    ASSERT_NE(text.find("Error: logged"), std::string::npos);
    ASSERT_NE(text.find("Error: expected failure"), std::string::npos);
    ASSERT_EQ(text.find("never logged"), std::string::npos);
    ASSERT_EQ(text.find("arithmetic"), std::string::npos);
    ASSERT_NE(text.find("test_utils.cpp"), std::string::npos);
}

TEST(test_anomaly_log, test_inverted_axis_message){
    using namespace hyperbox::util;
    std::ostringstream discard;
    AnomalyLog::handle_anomalies(discard);

    Anomaly anomaly{"bad box", inverted_axis_tag<double>{1, 2.5, -0.5}};
    ASSERT_EQ(anomaly.what(), "bad box");
    ASSERT_EQ(anomaly.data().axis, 1);

    std::ostringstream out;
    handle_anomaly(anomaly, out);
    ASSERT_NE(out.str().find("axis 1: lower = 2.5 is not <= upper = -0.5"), std::string::npos);
}

TEST(test_anomaly_log_DeathTest, test_pending_flushed_at_exit){
    using namespace hyperbox::util;
    // anomalies nobody handled are written to std::cerr when the program ends
    EXPECT_EXIT({
        std::ostringstream discard;
        AnomalyLog::handle_anomalies(discard);
        AnomalyLog::log_anomaly("left pending at exit");
        std::exit(0);
    }, ::testing::ExitedWithCode(0), "Error: left pending at exit");
}
