// mithril-sync benchmarks: measures throughput of core operations.

#include <mithril-sync/mithril_sync.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace mithril_sync;

// A config-like tree: n sections of four fields and a short list each.
static auto make_tree(std::int64_t n) -> Value {
    auto root = Object{};
    for (std::int64_t i = 0; i < n; ++i) {
        root.insert_or_assign("section" + std::to_string(i), Object{
            {"name", "section " + std::to_string(i)},
            {"enabled", i % 2 == 0},
            {"weight", static_cast<double>(i) / 3.0},
            {"limits", Object{{"min", i}, {"max", i * 10}}},
            {"tags", Array{"alpha", "beta", "gamma"}},
        });
    }
    return root;
}

// =============================================================================
// Flatten / rebuild
// =============================================================================

static void bm_flatten(benchmark::State& state) {
    const auto tree = make_tree(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(flatten(tree));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_flatten)->Range(8, 1024);

static void bm_flatten_with_containers(benchmark::State& state) {
    const auto tree = make_tree(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(flatten(tree, FlattenMode::with_containers));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_flatten_with_containers)->Range(8, 1024);

static void bm_rebuild(benchmark::State& state) {
    const auto entries = flatten(make_tree(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(rebuild(entries));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_rebuild)->Range(8, 1024);

// =============================================================================
// Diff / apply
// =============================================================================

static void bm_diff_one_edit(benchmark::State& state) {
    const auto tree = make_tree(state.range(0));
    auto edited = tree;
    set(edited, "section0.name", "renamed");
    const auto before = flatten(tree);
    const auto after = flatten(edited);

    for (auto _ : state) {
        benchmark::DoNotOptimize(diff(before, after));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(before.size()));
}
BENCHMARK(bm_diff_one_edit)->Range(8, 1024);

static void bm_diff_deep_compare(benchmark::State& state) {
    const auto tree = make_tree(state.range(0));
    const auto before = flatten(tree, FlattenMode::with_containers);
    const auto after = before;

    for (auto _ : state) {
        benchmark::DoNotOptimize(diff(before, after, DiffOptions{.deep_compare = true}));
    }
}
BENCHMARK(bm_diff_deep_compare)->Range(8, 256);

static void bm_apply_and_revert(benchmark::State& state) {
    const auto tree = make_tree(state.range(0));
    auto edited = tree;
    for (std::int64_t i = 0; i < state.range(0); i += 2) {
        set(edited, "section" + std::to_string(i) + ".enabled", false);
    }
    const auto changes = diff(flatten(tree), flatten(edited));
    const auto inverse = invert_changes(changes);

    for (auto _ : state) {
        auto copy = tree;
        apply_changes(copy, changes);
        apply_changes(copy, inverse);
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(bm_apply_and_revert)->Range(8, 512);

// =============================================================================
// Search
// =============================================================================

static void bm_find_exact(benchmark::State& state) {
    auto entries = flatten(make_tree(state.range(0)));
    auto options = FindOptions{};
    options.target = "gamma";
    options.find_all = true;

    for (auto _ : state) {
        benchmark::DoNotOptimize(find(entries, options));
    }
}
BENCHMARK(bm_find_exact)->Range(8, 1024);

static void bm_find_regex(benchmark::State& state) {
    auto entries = flatten(make_tree(state.range(0)));
    auto options = FindOptions{};
    options.target = "^sec.*7$";
    options.use_regex = true;
    options.find_all = true;

    for (auto _ : state) {
        benchmark::DoNotOptimize(find(entries, options));
    }
}
BENCHMARK(bm_find_regex)->Range(8, 512);

// =============================================================================
// SyncTool
// =============================================================================

static void bm_tool_update_and_get_changes(benchmark::State& state) {
    auto tool = SyncTool{make_tree(state.range(0))};
    std::int64_t i = 0;
    for (auto _ : state) {
        tool.update_entry("section0.limits.max", i++);
        benchmark::DoNotOptimize(tool.get_changes());
    }
}
BENCHMARK(bm_tool_update_and_get_changes)->Range(8, 512);

static void bm_json_dump(benchmark::State& state) {
    const auto tree = make_tree(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(json::dump(tree));
    }
}
BENCHMARK(bm_json_dump)->Range(8, 512);
