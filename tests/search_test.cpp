#include <mithril-sync/search.hpp>
#include <mithril-sync/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

using namespace mithril_sync;

namespace {

auto people() -> std::vector<Entry> {
    return flatten(Value{Object{
        {"owner", Object{{"name", "John"}, {"age", 30}}},
        {"members", Array{
            Object{{"name", "Jane"}, {"email", ""}},
            Object{{"name", "Joe"}, {"nickname", nullptr}},
        }},
    }});
}

auto dot_paths_of(const FindResult& result) -> std::vector<std::string> {
    auto paths = std::vector<std::string>{};
    for (const auto& item : result.results) {
        std::visit(overload{
            [&](const Match& m) { paths.push_back(m.dot_path); },
            [&](const std::string& s) { paths.push_back(s); },
            [&](const Entry& e) { paths.push_back(e.dot_path); },
        }, item);
    }
    return paths;
}

}  // anonymous namespace

// =============================================================================
// Targets and fallbacks
// =============================================================================

TEST(Find, key_match_returns_full_record) {
    auto entries = flatten(Value{Object{{"user", Object{{"name", "John"}}}}});
    auto options = FindOptions{};
    options.target = "name";

    const auto result = find(entries, options);
    ASSERT_TRUE(result.matched);
    ASSERT_EQ(result.results.size(), 1u);

    const auto& match = std::get<Match>(result.results[0]);
    EXPECT_EQ(match.value, Value{"John"});
    EXPECT_EQ(match.key, key_step("name"));
    EXPECT_EQ(match.dot_path, "user.name");
    EXPECT_EQ(match.path, (Path{key_step("user"), key_step("name")}));
}

TEST(Find, falls_back_when_target_misses) {
    auto entries = flatten(Value{Object{{"user", Object{{"name", "John"}}}}});
    auto options = FindOptions{};
    options.target = "nickname";
    options.fallbacks = {"name"};

    const auto result = find(entries, options);
    ASSERT_TRUE(result.matched);
    EXPECT_EQ(std::get<Match>(result.results[0]).value, Value{"John"});
}

TEST(Find, first_matching_target_wins) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "age";
    options.fallbacks = {"name"};
    options.find_all = true;

    EXPECT_EQ(dot_paths_of(find(entries, options)), (std::vector<std::string>{"owner.age"}));
}

TEST(Find, blank_targets_are_skipped) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "   ";
    options.fallbacks = {"", "\t"};

    const auto result = find(entries, options);
    EXPECT_FALSE(result.matched);
    EXPECT_TRUE(result.results.empty());
}

TEST(Find, no_match_is_not_an_error) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "salary";
    EXPECT_FALSE(find(entries, options).matched);
}

// =============================================================================
// Matching modes
// =============================================================================

TEST(Find, stops_after_first_match_unless_find_all) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "name";

    EXPECT_EQ(find(entries, options).results.size(), 1u);

    options.find_all = true;
    EXPECT_EQ(dot_paths_of(find(entries, options)),
              (std::vector<std::string>{"owner.name", "members.0.name", "members.1.name"}));
}

TEST(Find, case_insensitive_value_match) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "JANE";
    options.match_keys = false;

    EXPECT_FALSE(find(entries, options).matched);

    options.case_insensitive = true;
    EXPECT_EQ(dot_paths_of(find(entries, options)),
              (std::vector<std::string>{"members.0.name"}));
}

TEST(Find, numbers_match_their_display_string) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "30";
    EXPECT_EQ(dot_paths_of(find(entries, options)), (std::vector<std::string>{"owner.age"}));
}

TEST(Find, regex_searches_values) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "^Ja?o";
    options.use_regex = true;
    options.find_all = true;
    options.match_keys = false;

    EXPECT_EQ(dot_paths_of(find(entries, options)),
              (std::vector<std::string>{"owner.name", "members.1.name"}));
}

TEST(Find, regex_honours_case_insensitivity) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "^jo";
    options.use_regex = true;
    options.case_insensitive = true;
    options.find_all = true;
    options.match_keys = false;

    EXPECT_EQ(find(entries, options).results.size(), 2u);
}

TEST(Find, invalid_regex_is_reported) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "(unclosed";
    options.use_regex = true;

    try {
        (void)find(entries, options);
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_pattern);
    }
}

TEST(Find, key_only_matching_ignores_values) {
    auto entries = flatten(Value{Object{{"label", "name"}}});
    auto options = FindOptions{};
    options.target = "name";
    options.match_values = false;
    EXPECT_FALSE(find(entries, options).matched);
}

TEST(Find, each_dot_path_reported_once) {
    auto entries = std::vector<Entry>{
        make_entry(Path{key_step("name")}, Value{"name"}),
        make_entry(Path{key_step("name")}, Value{"other"}),
    };
    auto options = FindOptions{};
    options.target = "name";
    options.find_all = true;

    EXPECT_EQ(find(entries, options).results.size(), 1u);
}

// =============================================================================
// Filters
// =============================================================================

TEST(Find, only_types_filters_by_value_kind) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = ".*";
    options.use_regex = true;
    options.find_all = true;
    options.only_types = {"number"};

    EXPECT_EQ(dot_paths_of(find(entries, options)), (std::vector<std::string>{"owner.age"}));
}

TEST(Find, null_filter_looks_at_value_only) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "nickname";

    EXPECT_TRUE(find(entries, options).matched);

    options.include_null = false;
    EXPECT_FALSE(find(entries, options).matched);
}

TEST(Find, empty_string_filter) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "email";

    EXPECT_TRUE(find(entries, options).matched);

    options.include_empty_string = false;
    EXPECT_FALSE(find(entries, options).matched);
}

TEST(Find, undefined_filter) {
    auto entries = std::vector<Entry>{make_entry(Path{key_step("hole")}, Value{})};
    auto options = FindOptions{};
    options.target = "hole";

    EXPECT_TRUE(find(entries, options).matched);

    options.include_undefined = false;
    EXPECT_FALSE(find(entries, options).matched);
}

// =============================================================================
// Output shapes and mutation
// =============================================================================

TEST(Find, dot_paths_format) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "age";
    options.return_format = ReturnFormat::dot_paths;

    const auto result = find(entries, options);
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(std::get<std::string>(result.results[0]), "owner.age");
}

TEST(Find, entries_only_format) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "age";
    options.return_format = ReturnFormat::entries_only;

    const auto result = find(entries, options);
    ASSERT_EQ(result.results.size(), 1u);
    EXPECT_EQ(std::get<Entry>(result.results[0]), entries[1]);
}

TEST(Find, mutate_updates_entry_before_recording) {
    auto entries = people();
    auto options = FindOptions{};
    options.target = "age";
    options.mutate = [](Entry& e) { e.value = "thirty"; };

    const auto result = find(entries, options);
    ASSERT_TRUE(result.matched);
    EXPECT_EQ(std::get<Match>(result.results[0]).value, Value{"thirty"});
    EXPECT_EQ(entries[1].value, Value{"thirty"});
    EXPECT_EQ(entries[1].kind, Kind::string);
}

TEST(ReturnFormat, names_round_trip) {
    EXPECT_EQ(to_string_view(ReturnFormat::dot_paths), "dotPaths");
    EXPECT_EQ(return_format_from_string("entriesOnly"), ReturnFormat::entries_only);
    EXPECT_EQ(return_format_from_string("dot_paths"), ReturnFormat::dot_paths);
    EXPECT_FALSE(return_format_from_string("xml").has_value());
}
