#include <sstream>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace std;
using namespace runbox;
using ::testing::HasSubstr;

TEST(ExceptionsTest, StreamIncludesMessage) {
    ostringstream os;
    os << spawn_error("unable to fork: Resource temporarily unavailable");
    EXPECT_THAT(os.str(), HasSubstr("unable to fork"));
}

TEST(ExceptionsTest, MessageIsKept) {
    EXPECT_STREQ(validation_error("source code is empty").what(), "source code is empty");
    EXPECT_STREQ(unsupported_language("cobol").what(), "Unsupported language: cobol");
    EXPECT_EQ(unsupported_language("cobol").language, "cobol");
    EXPECT_STREQ(internal_error().what(), "");
}
