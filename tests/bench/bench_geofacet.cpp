#include <benchmark/benchmark.h>
#include <cmath>
#include <geofacet/geofacet.hpp>
#include <vector>

using namespace geofacet;

// Yearly series for every region of the US state grid.
static DataTable make_state_table(int years)
{
    std::vector<std::string> state;
    std::vector<double>      year, value;
    for (const auto& e : builtin_grid("us_state_grid1"))
    {
        for (int y = 0; y < years; ++y)
        {
            state.push_back(e.entity());
            year.push_back(2000.0 + y);
            value.push_back(std::sin(0.1 * y + e.row()) * e.col());
        }
    }
    DataTable t;
    t.add_text_column("state", std::move(state));
    t.add_number_column("year", std::move(year));
    t.add_number_column("value", std::move(value));
    return t;
}

static void BM_NeighborQueries(benchmark::State& state)
{
    const GeoGrid& grid = builtin_grid("us_state_grid1");
    for (auto _ : state)
    {
        int hits = 0;
        for (const auto& e : grid)
        {
            hits += has_neighbor_below(grid, e.entity());
            hits += has_neighbor_left(grid, e.entity());
        }
        benchmark::DoNotOptimize(hits);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(grid.size()) * 2);
}
BENCHMARK(BM_NeighborQueries);

static void BM_ComputeAxisConfigs(benchmark::State& state)
{
    const GeoGrid&           grid = builtin_grid("us_state_grid1");
    AxisOptions              common{{"grid", false}, {"xlabel", std::string("year")}};
    std::vector<AxisOptions> per{AxisOptions{}, AxisOptions{{"yaxisposition", std::string("right")}}};

    for (auto _ : state)
    {
        for (const auto& e : grid)
        {
            auto configs = compute_axis_configs(grid, e.entity(), LinkMode::Both, true, common, per);
            benchmark::DoNotOptimize(configs);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(grid.size()));
}
BENCHMARK(BM_ComputeAxisConfigs);

static void BM_GeofacetUsStates(benchmark::State& state)
{
    Logger::instance().set_level(LogLevel::Error);
    auto table = make_state_table(static_cast<int>(state.range(0)));
    auto plot  = [](FacetCell& cell, const RegionData& d, const FacetContext&, const AxisOptions& opts)
    {
        auto& ax = cell.add_axes();
        ax.apply(opts);
        ax.line(d.floats("year"), d.floats("value")).label("value");
    };

    for (auto _ : state)
    {
        auto fig = geofacet::geofacet(table, "state", plot, {.link_mode = LinkMode::Both, .legend = LegendOptions{}});
        benchmark::DoNotOptimize(fig);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(table.num_rows()));
}
BENCHMARK(BM_GeofacetUsStates)->Arg(10)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
