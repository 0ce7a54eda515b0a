#include <mithril-sync/search.hpp>
#include <mithril-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace mithril_sync {

namespace {

auto is_blank(std::string_view s) -> bool {
    return s.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos;
}

auto fold_case(std::string s) -> std::string {
    std::ranges::transform(s, s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

/// Equality (optionally case-folded) or regex search against one target.
class Matcher {
public:
    Matcher(const std::string& target, const FindOptions& options)
        : case_insensitive_{options.case_insensitive} {
        if (options.use_regex) {
            auto flags = std::regex::ECMAScript;
            if (case_insensitive_) flags |= std::regex::icase;
            try {
                regex_.emplace(target, flags);
            } catch (const std::regex_error& e) {
                throw SyncError{ErrorKind::invalid_pattern,
                                "invalid pattern '" + target + "': " + e.what()};
            }
        } else {
            target_ = case_insensitive_ ? fold_case(target) : target;
        }
    }

    auto operator()(const std::string& input) const -> bool {
        if (regex_) return std::regex_search(input, *regex_);
        return (case_insensitive_ ? fold_case(input) : input) == target_;
    }

private:
    std::string target_;
    bool case_insensitive_;
    std::optional<std::regex> regex_;
};

auto passes_filters(const Value& value, const FindOptions& options) -> bool {
    if (!options.only_types.empty()) {
        const auto kind = to_string_view(value.kind());
        const auto& types = options.only_types;
        if (std::find(types.begin(), types.end(), kind) == types.end()) return false;
    }
    if (!options.include_null && value.is_null()) return false;
    if (!options.include_undefined && value.is_undefined()) return false;
    if (!options.include_empty_string) {
        if (const auto* s = value.get_if<std::string>(); s && s->empty()) return false;
    }
    return true;
}

auto record(const Entry& entry, ReturnFormat format) -> FindItem {
    switch (format) {
        case ReturnFormat::dot_paths:    return entry.dot_path;
        case ReturnFormat::entries_only: return entry;
        case ReturnFormat::full:         break;
    }
    return Match{entry.key, entry.value, entry.path, entry.dot_path};
}

}  // anonymous namespace

auto return_format_from_string(std::string_view name) -> std::optional<ReturnFormat> {
    if (name == "full") return ReturnFormat::full;
    if (name == "dotPaths" || name == "dot_paths") return ReturnFormat::dot_paths;
    if (name == "entriesOnly" || name == "entries_only") return ReturnFormat::entries_only;
    return std::nullopt;
}

auto find(std::vector<Entry>& entries, const FindOptions& options) -> FindResult {
    auto targets = std::vector<std::string>{};
    if (!is_blank(options.target)) targets.push_back(options.target);
    for (const auto& fallback : options.fallbacks) {
        if (!is_blank(fallback)) targets.push_back(fallback);
    }

    auto result = FindResult{};
    if (targets.empty()) return result;

    auto seen = std::unordered_set<std::string>{};
    for (const auto& target : targets) {
        const auto matches = Matcher{target, options};
        for (auto& entry : entries) {
            if (!passes_filters(entry.value, options)) continue;

            auto hit = (options.match_keys && matches(to_string(entry.key))) ||
                       (options.match_values && matches(to_display_string(entry.value)));
            if (!hit || !seen.insert(entry.dot_path).second) continue;

            if (options.mutate) {
                options.mutate(entry);
                entry.kind = entry.value.kind();
            }
            result.results.push_back(record(entry, options.return_format));
            if (!options.find_all) {
                result.matched = true;
                return result;
            }
        }
        if (!result.results.empty()) {
            SPDLOG_DEBUG("find: target '{}' matched {} entries", target, result.results.size());
            break;
        }
    }
    result.matched = !result.results.empty();
    return result;
}

}  // namespace mithril_sync
