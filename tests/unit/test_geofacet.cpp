#include <algorithm>
#include <functional>
#include <geofacet/geofacet.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace geofacet;

// ─── Fixtures ────────────────────────────────────────────────────────────────

class GeofacetTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        log_ = std::make_shared<std::vector<Logger::LogEntry>>();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::memory_sink(log_));
        Logger::instance().set_level(LogLevel::Warning);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::console_sink());
    }

    size_t warnings() const
    {
        return static_cast<size_t>(std::count_if(log_->begin(),
                                                 log_->end(),
                                                 [](const auto& e) { return e.level == LogLevel::Warning; }));
    }

    std::shared_ptr<std::vector<Logger::LogEntry>> log_;
};

static DataTable region_table(std::vector<std::string> regions, std::vector<double> x, std::vector<double> y)
{
    DataTable t;
    t.add_text_column("region", std::move(regions));
    t.add_number_column("x", std::move(x));
    t.add_number_column("y", std::move(y));
    return t;
}

static GeoGrid ab_grid()
{
    return GeoGrid::from_positions({{"A", {1, 1}}, {"B", {1, 2}}});
}

static GeoGrid square_grid()
{
    return GeoGrid::from_positions({{"A", {1, 1}}, {"B", {1, 2}}, {"C", {2, 1}}, {"D", {2, 2}}});
}

// Draws one line of y over x on a single axes.
static void line_plot(FacetCell& cell, const RegionData& data, const FacetContext&, const AxisOptions& opts)
{
    Axes& ax = cell.add_axes();
    ax.apply(opts);
    ax.line(data.floats("x"), data.floats("y"));
}

// ─── Validation ──────────────────────────────────────────────────────────────

static ErrorKind kind_of(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const GeofacetError& e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "expected GeofacetError";
    return ErrorKind::RenderFailure;
}

TEST_F(GeofacetTest, EmptyInput)
{
    DataTable empty;
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(empty, "region", line_plot, {.grid = ab_grid()}); }), ErrorKind::EmptyInput);
}

TEST_F(GeofacetTest, ColumnNotFound)
{
    auto t = region_table({"A"}, {1}, {1});
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "state", line_plot, {.grid = ab_grid()}); }), ErrorKind::ColumnNotFound);
}

TEST_F(GeofacetTest, InvalidEnumValue)
{
    auto t = region_table({"A"}, {1}, {1});
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .link_mode = LinkMode(7)}); }),
              ErrorKind::InvalidOption);
}

TEST_F(GeofacetTest, SingleAxisRendererWithSeveralAxisMaps)
{
    auto t = region_table({"A"}, {1}, {1});
    GeofacetOptions o{.grid = ab_grid(), .missing_regions = MissingRegionPolicy::Skip};
    o.per_axis_options = {AxisOptions{}, AxisOptions{}};
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "region", line_plot, o); }), ErrorKind::InvalidOption);
}

TEST_F(GeofacetTest, BadOptionTypeFailsBeforeRendering)
{
    auto t     = region_table({"A", "B"}, {1, 1}, {1, 1});
    int  calls = 0;
    auto count = [&](FacetCell&, const RegionData&, const FacetContext&, const AxisOptions&) { ++calls; };

    GeofacetOptions o{.grid = ab_grid()};
    o.common_axis_options.set("grid", "yes");
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "region", count, o); }), ErrorKind::InvalidOption);
    EXPECT_EQ(calls, 0);
}

TEST_F(GeofacetTest, EmptyRendererRejected)
{
    auto t = region_table({"A", "B"}, {1, 1}, {1, 1});
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "region", FacetRenderFn{}, {.grid = ab_grid()}); }),
              ErrorKind::InvalidOption);
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "region", SingleAxisRenderFn{}, {.grid = ab_grid()}); }),
              ErrorKind::InvalidOption);
    EXPECT_FALSE(FacetRenderer(line_plot).empty());
}

TEST_F(GeofacetTest, BadLegendSpan)
{
    auto            t = region_table({"A", "B"}, {1, 1}, {1, 1});
    GeofacetOptions o{.grid = ab_grid(), .legend = LegendOptions{.rows = GridSpan{2, 1}}};
    EXPECT_EQ(kind_of([&] { geofacet::geofacet(t, "region", line_plot, o); }), ErrorKind::InvalidOption);
}

TEST_F(GeofacetTest, ParseOptions)
{
    EXPECT_EQ(parse_link_mode("Both"), LinkMode::Both);
    EXPECT_EQ(parse_link_mode("primary"), LinkMode::X);
    EXPECT_EQ(parse_link_mode("secondary"), LinkMode::Y);
    EXPECT_EQ(parse_missing_region_policy("empty"), MissingRegionPolicy::Placeholder);
    EXPECT_EQ(parse_extra_region_policy("WARN"), ExtraRegionPolicy::Warn);
    EXPECT_EQ(kind_of([] { parse_link_mode("z"); }), ErrorKind::InvalidOption);
    EXPECT_EQ(kind_of([] { parse_missing_region_policy("ignore"); }), ErrorKind::InvalidOption);
    EXPECT_STREQ(to_string(MissingRegionPolicy::Placeholder), "placeholder");
}

// ─── Missing-region policies ─────────────────────────────────────────────────

TEST_F(GeofacetTest, SkipLeavesPositionEmpty)
{
    auto t   = region_table({"A", "A"}, {1, 2}, {3, 4});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .missing_regions = MissingRegionPolicy::Skip});

    ASSERT_EQ(fig->facet_count(), 1u);
    EXPECT_NE(fig->find_facet("A"), nullptr);
    EXPECT_EQ(fig->find_facet("B"), nullptr);
    EXPECT_EQ(fig->grid_cols(), 2);
}

TEST_F(GeofacetTest, PlaceholderTitledWithEntity)
{
    auto t   = region_table({"A"}, {1}, {3});
    auto fig = geofacet::geofacet(t,
                                  "region",
                                  line_plot,
                                  {.grid = ab_grid(), .missing_regions = MissingRegionPolicy::Placeholder});

    ASSERT_EQ(fig->facet_count(), 2u);
    const FacetCell* b = fig->find_facet("B");
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(b->is_placeholder());
    ASSERT_EQ(b->axes_count(), 1u);
    EXPECT_EQ(b->axes(0).title(), "B");
    EXPECT_TRUE(b->axes(0).series().empty());
    EXPECT_FALSE(fig->find_facet("A")->is_placeholder());
}

TEST_F(GeofacetTest, PlaceholderGetsOneAxesPerOptionMap)
{
    auto            t = region_table({"A"}, {1}, {3});
    GeofacetOptions o{.grid = ab_grid(), .missing_regions = MissingRegionPolicy::Placeholder};
    o.per_axis_options = {AxisOptions{}, AxisOptions{{"yaxisposition", std::string("right")}}};

    auto two_axes = [](FacetCell& cell, const RegionData&, const FacetContext&, std::span<const AxisOptions> opts)
    {
        for (const auto& opt : opts)
            cell.add_axes().apply(opt);
    };
    auto fig = geofacet::geofacet(t, "region", two_axes, o);
    ASSERT_EQ(fig->find_facet("B")->axes_count(), 2u);
    EXPECT_EQ(fig->find_facet("B")->axes(1).y_axis_side(), YAxisSide::Right);
}

TEST_F(GeofacetTest, ErrorPolicyNamesMissingRegions)
{
    auto t = region_table({"A"}, {1}, {3});
    try
    {
        geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .missing_regions = MissingRegionPolicy::Error});
        FAIL() << "expected MissingRegions";
    }
    catch (const GeofacetError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::MissingRegions);
        EXPECT_EQ(e.regions(), (std::vector<std::string>{"B"}));
    }
}

// ─── Extra regions ───────────────────────────────────────────────────────────

TEST_F(GeofacetTest, ExtraRegionsErrorByDefault)
{
    auto t = region_table({"A", "B", "Z"}, {1, 1, 1}, {1, 1, 1});
    try
    {
        geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid()});
        FAIL() << "expected ExtraRegions";
    }
    catch (const GeofacetError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::ExtraRegions);
        EXPECT_EQ(e.regions(), (std::vector<std::string>{"Z"}));
    }
}

TEST_F(GeofacetTest, ExtraRegionsWarnRendersKnownOnes)
{
    auto t   = region_table({"A", "B", "Z"}, {1, 1, 1}, {1, 1, 1});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .extra_regions = ExtraRegionPolicy::Warn});

    EXPECT_EQ(fig->facet_count(), 2u);
    EXPECT_EQ(warnings(), 1u);
    ASSERT_EQ(fig->diagnostics().size(), 1u);
    EXPECT_EQ(fig->diagnostics()[0].kind, ErrorKind::ExtraRegions);
    EXPECT_NE(fig->diagnostics()[0].message.find("Z"), std::string::npos);
}

// ─── Matching ────────────────────────────────────────────────────────────────

TEST_F(GeofacetTest, CaseInsensitiveMatching)
{
    auto t   = region_table({"a", "B", "A"}, {1, 2, 3}, {1, 2, 3});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid()});

    ASSERT_EQ(fig->facet_count(), 2u);
    const FacetCell* a = fig->find_facet("A");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->axes(0).series()[0]->point_count(), 2u);
}

TEST_F(GeofacetTest, ContextCarriesEntryAndUserArgs)
{
    auto            t = region_table({"A", "B"}, {1, 1}, {1, 1});
    GeofacetOptions o{.grid = GeoGrid::from_columns({"A", "B"}, {1, 1}, {1, 2}, {"Alpha", "Beta"})};
    o.user_args.set("color_by", "x");

    std::vector<std::string> seen;
    auto record = [&](FacetCell& cell, const RegionData& data, const FacetContext& ctx, const AxisOptions&)
    {
        EXPECT_EQ(ctx.user_args.get_string("color_by"), std::optional<std::string>("x"));
        EXPECT_EQ(ctx.entry.entity(), cell.entity());
        EXPECT_EQ(ctx.entry.position(), cell.position());
        EXPECT_EQ(data.size(), 1u);
        seen.push_back(ctx.entry.display_name());
    };
    geofacet::geofacet(t, "region", record, o);
    EXPECT_EQ(seen, (std::vector<std::string>{"Alpha", "Beta"}));
}

TEST_F(GeofacetTest, DefaultGridIsUsStates)
{
    auto t   = region_table({"CA", "ny"}, {1, 2}, {1, 2});
    auto fig = geofacet::geofacet(t, "region", line_plot);
    EXPECT_EQ(fig->facet_count(), 2u);
    EXPECT_EQ(fig->grid_rows(), 8);
    EXPECT_EQ(fig->grid_cols(), 11);
    EXPECT_EQ(fig->find_facet("NY")->position(), (GridPosition{3, 9}));
}

// ─── Render failures ─────────────────────────────────────────────────────────

TEST_F(GeofacetTest, RenderFailureIsolated)
{
    auto t    = region_table({"A", "B"}, {1, 2}, {1, 2});
    auto flaky = [](FacetCell& cell, const RegionData&, const FacetContext& ctx, const AxisOptions&)
    {
        cell.add_axes();
        if (ctx.entry.entity() == "A")
            throw std::runtime_error("no ink");
    };
    auto fig = geofacet::geofacet(t, "region", flaky, {.grid = ab_grid(), .link_mode = LinkMode::Both});

    EXPECT_EQ(fig->find_facet("A"), nullptr);
    EXPECT_NE(fig->find_facet("B"), nullptr);
    ASSERT_EQ(fig->diagnostics().size(), 1u);
    EXPECT_EQ(fig->diagnostics()[0].kind, ErrorKind::RenderFailure);
    EXPECT_EQ(fig->diagnostics()[0].entity, "A");
    EXPECT_NE(fig->diagnostics()[0].message.find("no ink"), std::string::npos);
    EXPECT_EQ(warnings(), 1u);
}

// ─── Decorations ─────────────────────────────────────────────────────────────

TEST_F(GeofacetTest, InnerDecorationsHiddenOnSquareGrid)
{
    auto t   = region_table({"A", "B", "C", "D"}, {1, 1, 1, 1}, {1, 1, 1, 1});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = square_grid(), .link_mode = LinkMode::Both});

    auto& a = fig->find_facet("A")->axes(0);
    auto& b = fig->find_facet("B")->axes(0);
    auto& c = fig->find_facet("C")->axes(0);
    auto& d = fig->find_facet("D")->axes(0);

    EXPECT_TRUE(a.x_decorations().none_visible());
    EXPECT_TRUE(a.y_decorations().all_visible());
    EXPECT_TRUE(b.x_decorations().none_visible());
    EXPECT_TRUE(b.y_decorations().none_visible());
    EXPECT_TRUE(c.x_decorations().all_visible());
    EXPECT_TRUE(c.y_decorations().all_visible());
    EXPECT_TRUE(d.x_decorations().all_visible());
    EXPECT_TRUE(d.y_decorations().none_visible());
}

TEST_F(GeofacetTest, SkippedNeighborDoesNotHide)
{
    // C has no data and is skipped, so A keeps its x axis.
    auto t   = region_table({"A", "B", "D"}, {1, 1, 1}, {1, 1, 1});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = square_grid(), .link_mode = LinkMode::Both});
    EXPECT_TRUE(fig->find_facet("A")->axes(0).x_decorations().all_visible());
}

TEST_F(GeofacetTest, PlaceholderNeighborHides)
{
    auto t   = region_table({"A", "B", "D"}, {1, 1, 1}, {1, 1, 1});
    auto fig = geofacet::geofacet(t,
                                  "region",
                                  line_plot,
                                  {.grid            = square_grid(),
                                   .link_mode       = LinkMode::Both,
                                   .missing_regions = MissingRegionPolicy::Placeholder});
    EXPECT_TRUE(fig->find_facet("A")->axes(0).x_decorations().none_visible());
}

// ─── Linking ─────────────────────────────────────────────────────────────────

TEST_F(GeofacetTest, LinkedAxesShareRange)
{
    auto t   = region_table({"A", "A", "B", "B"}, {0, 10, 20, 30}, {0, 1, 5, 6});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .link_mode = LinkMode::X});

    auto& a = fig->find_facet("A")->axes(0);
    auto& b = fig->find_facet("B")->axes(0);
    EXPECT_EQ(a.x_limits(), b.x_limits());
    EXPECT_NE(a.y_limits(), b.y_limits());
    EXPECT_TRUE(fig->links().is_linked(&a));
    EXPECT_EQ(fig->links().group_count(), 1u);
}

TEST_F(GeofacetTest, PlaceholdersDoNotDistortLinkedRange)
{
    auto t   = region_table({"A", "A"}, {100, 200}, {50, 60});
    auto fig = geofacet::geofacet(t,
                                  "region",
                                  line_plot,
                                  {.grid            = ab_grid(),
                                   .link_mode       = LinkMode::Both,
                                   .missing_regions = MissingRegionPolicy::Placeholder});

    auto& a = fig->find_facet("A")->axes(0);
    auto& b = fig->find_facet("B")->axes(0);
    ASSERT_TRUE(fig->find_facet("B")->is_placeholder());
    EXPECT_TRUE(fig->links().is_linked(&b));

    auto xl = a.x_limits();
    EXPECT_FLOAT_EQ(xl.min, 95.0f);
    EXPECT_FLOAT_EQ(xl.max, 205.0f);
    EXPECT_GT(a.y_limits().min, 40.0f);
    EXPECT_EQ(b.x_limits(), xl);
    EXPECT_EQ(b.y_limits(), a.y_limits());
}

TEST_F(GeofacetTest, NoLinkingByDefault)
{
    auto t   = region_table({"A", "B"}, {0, 20}, {0, 5});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid()});
    EXPECT_EQ(fig->links().group_count(), 0u);
}

TEST_F(GeofacetTest, DualAxisLinkedByPosition)
{
    auto t = region_table({"A", "B"}, {1, 2}, {1, 2});
    auto dual = [](FacetCell& cell, const RegionData&, const FacetContext&, std::span<const AxisOptions> opts)
    {
        for (const auto& opt : opts)
            cell.add_axes().apply(opt);
    };
    GeofacetOptions o{.grid = ab_grid(), .link_mode = LinkMode::Y};
    o.per_axis_options = {AxisOptions{}, AxisOptions{{"yaxisposition", std::string("right")}}};

    auto fig     = geofacet::geofacet(t, "region", dual, o);
    auto a_axes  = fig->find_facet("A")->all_axes();
    auto b_axes  = fig->find_facet("B")->all_axes();
    auto by_slot = axes_by_position(*fig);

    ASSERT_EQ(by_slot.size(), 2u);
    EXPECT_EQ(by_slot[0], (std::vector<Axes*>{a_axes[0], b_axes[0]}));
    EXPECT_EQ(by_slot[1], (std::vector<Axes*>{a_axes[1], b_axes[1]}));
    EXPECT_EQ(fig->links().linked_peers(a_axes[0]), (std::vector<Axes*>{b_axes[0]}));
    EXPECT_EQ(fig->links().linked_peers(a_axes[1]), (std::vector<Axes*>{b_axes[1]}));

    // Left axis of B and right axis of A face a neighbor and lose their chrome.
    EXPECT_TRUE(a_axes[0]->y_decorations().all_visible());
    EXPECT_TRUE(a_axes[1]->y_decorations().none_visible());
    EXPECT_TRUE(b_axes[0]->y_decorations().none_visible());
    EXPECT_TRUE(b_axes[1]->y_decorations().all_visible());
}

// ─── Legend ──────────────────────────────────────────────────────────────────

static void labeled_plot(FacetCell& cell, const RegionData& data, const FacetContext&, const AxisOptions& opts)
{
    Axes& ax = cell.add_axes();
    ax.apply(opts);
    ax.line(data.floats("x"), data.floats("y")).label("observed");
    ax.scatter(data.floats("x"), data.floats("y")).label("points");
}

TEST_F(GeofacetTest, LegendDefaultPlacement)
{
    auto t   = region_table({"A", "B"}, {1, 2}, {1, 2});
    auto fig = geofacet::geofacet(t, "region", labeled_plot, {.grid = square_grid(), .missing_regions = MissingRegionPolicy::Skip});

    ASSERT_TRUE(fig->has_legend());
    const Legend* legend = fig->legend();
    EXPECT_EQ(legend->rows, (GridSpan{1, 2}));
    EXPECT_EQ(legend->cols, (GridSpan{3, 3}));
    ASSERT_EQ(legend->entries.size(), 2u);
    EXPECT_EQ(legend->entries[0].label, "observed");
    EXPECT_EQ(legend->entries[1].label, "points");
    EXPECT_EQ(fig->width(), 600u);
}

TEST_F(GeofacetTest, LegendOverrides)
{
    auto            t = region_table({"A", "B"}, {1, 2}, {1, 2});
    GeofacetOptions o{.grid   = ab_grid(),
                      .legend = LegendOptions{.title = "Series", .rows = GridSpan{2, 2}, .cols = GridSpan{1, 2}}};
    auto            fig = geofacet::geofacet(t, "region", labeled_plot, o);

    ASSERT_TRUE(fig->has_legend());
    EXPECT_EQ(fig->legend()->title, "Series");
    EXPECT_EQ(fig->legend()->rows, (GridSpan{2, 2}));
    EXPECT_EQ(fig->legend()->cols, (GridSpan{1, 2}));
    EXPECT_EQ(fig->height(), 300u);
}

TEST_F(GeofacetTest, RequestedLegendWithoutLabelsWarns)
{
    auto t   = region_table({"A", "B"}, {1, 2}, {1, 2});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .legend = LegendOptions{}});

    EXPECT_FALSE(fig->has_legend());
    ASSERT_EQ(fig->diagnostics().size(), 1u);
    EXPECT_EQ(fig->diagnostics()[0].kind, ErrorKind::NoLabeledPlots);
    EXPECT_EQ(warnings(), 1u);
}

TEST_F(GeofacetTest, NoLegendAndNoWarningWithoutLabels)
{
    auto t   = region_table({"A", "B"}, {1, 2}, {1, 2});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid()});
    EXPECT_FALSE(fig->has_legend());
    EXPECT_TRUE(fig->diagnostics().empty());
    EXPECT_EQ(warnings(), 0u);
}

// ─── Figure ──────────────────────────────────────────────────────────────────

TEST_F(GeofacetTest, TitleAndLayout)
{
    auto t   = region_table({"A", "B"}, {1, 2}, {1, 2});
    auto fig = geofacet::geofacet(t, "region", line_plot, {.grid = ab_grid(), .title = "Demo", .figure = {.width = 800}});

    EXPECT_EQ(fig->title(), "Demo");
    EXPECT_EQ(fig->width(), 800u);
    EXPECT_EQ(fig->height(), 150u);
    EXPECT_FLOAT_EQ(fig->find_facet("B")->viewport().x, 400.0f + fig->style().margin_left);
}
