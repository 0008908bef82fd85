#include <oplog-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace oplog_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::transient_network),  "transient_network");
    EXPECT_EQ(to_string_view(ErrorKind::rejected_operation), "rejected_operation");
    EXPECT_EQ(to_string_view(ErrorKind::missing_referent),   "missing_referent");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation),  "invalid_operation");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::rejected_operation, "bad edge"};
    const auto e2 = Error{ErrorKind::rejected_operation, "bad edge"};
    const auto e3 = Error{ErrorKind::transient_network, "bad edge"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::missing_referent, "b1"};
    const auto e2 = Error{ErrorKind::missing_referent, "b2"};

    EXPECT_NE(e1, e2);
}

TEST(TransportError, is_a_runtime_error_carrying_the_message) {
    try {
        throw TransportError{"socket closed"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "socket closed");
        return;
    }
    FAIL() << "TransportError was not caught as std::runtime_error";
}
