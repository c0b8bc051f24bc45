#include "gtest/gtest.h"
#include <sstream>
#include "common/exceptions.hpp"

using namespace std;
using namespace sandbox;

TEST(ExceptionsTest, KindsAndStatus) {
    EXPECT_EQ(validation_error("Invalid file path.").kind(), error_kind::VALIDATION);
    EXPECT_EQ(runner_unavailable("Python runner disabled.").kind(), error_kind::UNAVAILABLE);
    EXPECT_EQ(runner_error("Output archive too large.").kind(), error_kind::EXECUTION_FAILURE);
    EXPECT_EQ(engine_error(500, "boom").kind(), error_kind::EXECUTION_FAILURE);
    EXPECT_EQ(engine_error(404, "no such image").status, 404);

    EXPECT_EQ(http_status(error_kind::VALIDATION), 400);
    EXPECT_EQ(http_status(error_kind::UNAVAILABLE), 503);
    EXPECT_EQ(http_status(error_kind::EXECUTION_FAILURE), 500);
    EXPECT_STREQ(to_string(error_kind::EXECUTION_FAILURE), "execution_failure");
}

TEST(ExceptionsTest, NetworkErrorIsUnavailable) {
    EXPECT_EQ(network_error("Couldn't connect to server").kind(), error_kind::UNAVAILABLE);
}

TEST(ExceptionsTest, KindSurvivesBaseReference) {
    try {
        throw validation_error("Too many files.");
    } catch (sandbox_exception &ex) {
        EXPECT_EQ(ex.kind(), error_kind::VALIDATION);
        EXPECT_STREQ(ex.what(), "Too many files.");
    }
}

TEST(ExceptionsTest, StreamIncludesMessage) {
    ostringstream os;
    os << runner_error("Failed to upload code to runner.");
    EXPECT_NE(os.str().find("Failed to upload code to runner."), string::npos);
}
