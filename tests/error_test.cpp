#include <mithril-sync/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace mithril_sync;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_argument), "invalid_argument");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_pattern),  "invalid_pattern");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_json),     "invalid_json");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_argument, "empty path"};
    const auto e2 = Error{ErrorKind::invalid_argument, "empty path"};
    const auto e3 = Error{ErrorKind::invalid_pattern, "empty path"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_json, "foo"};
    const auto e2 = Error{ErrorKind::invalid_json, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(SyncError, carries_kind_and_message) {
    const auto e = SyncError{ErrorKind::invalid_pattern, "unbalanced ("};

    EXPECT_EQ(e.kind(), ErrorKind::invalid_pattern);
    EXPECT_EQ(std::string{e.what()}, "unbalanced (");
    EXPECT_EQ(e.error(), (Error{ErrorKind::invalid_pattern, "unbalanced ("}));
}

TEST(SyncError, is_a_runtime_error) {
    EXPECT_THROW(throw SyncError(ErrorKind::invalid_argument, "boom"), std::runtime_error);
}
