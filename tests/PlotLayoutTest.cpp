#include <gtest/gtest.h>

#include "PlotRenderer.hpp"

TEST(PlotLayoutTest, NiceAxisMaxRoundsUp) {
    EXPECT_DOUBLE_EQ(niceAxisMax(0.0), 1.0);
    EXPECT_DOUBLE_EQ(niceAxisMax(1.0), 1.0);
    EXPECT_DOUBLE_EQ(niceAxisMax(1.3), 2.0);
    EXPECT_DOUBLE_EQ(niceAxisMax(4000.0), 5000.0);
    EXPECT_DOUBLE_EQ(niceAxisMax(6324.6), 10000.0);
    EXPECT_DOUBLE_EQ(niceAxisMax(200.0), 200.0);
}

TEST(PlotLayoutTest, CoversAllSeries) {
    BreakCalculator calculator;
    std::vector<PlotSeries> series;
    series.push_back({"unpegged", calculator.evaluateMatrix("pine", 1, 10, Unpegged{}), sf::Color::Blue});
    series.push_back({"pegged", calculator.evaluateMatrix("pine", 1, 10, Pegged{}), sf::Color::Red});

    PlotLayout layout = computePlotLayout(series, {960u, 600u}, 70.0f);
    EXPECT_EQ(layout.minLayer, 1);
    EXPECT_EQ(layout.maxLayer, 10);
    EXPECT_DOUBLE_EQ(layout.maxForce, 10000.0);  // 200 * 10^1.5 ~ 6324.6
    EXPECT_FLOAT_EQ(layout.area.position.x, 70.0f);
    EXPECT_FLOAT_EQ(layout.area.size.x, 820.0f);
    EXPECT_FLOAT_EQ(layout.area.size.y, 460.0f);
}

TEST(PlotLayoutTest, MapsCornersOfPlotArea) {
    PlotLayout layout;
    layout.minLayer = 1;
    layout.maxLayer = 10;
    layout.maxForce = 1000.0;
    layout.area = sf::FloatRect({50.0f, 50.0f}, {900.0f, 500.0f});

    sf::Vector2f origin = layout.toPixel(1, 0.0);
    EXPECT_FLOAT_EQ(origin.x, 50.0f);
    EXPECT_FLOAT_EQ(origin.y, 550.0f);

    sf::Vector2f top = layout.toPixel(10, 1000.0);
    EXPECT_FLOAT_EQ(top.x, 950.0f);
    EXPECT_FLOAT_EQ(top.y, 50.0f);

    sf::Vector2f middle = layout.toPixel(1, 500.0);
    EXPECT_FLOAT_EQ(middle.y, 300.0f);
}

TEST(PlotLayoutTest, SingleLayerSeriesIsCentred) {
    PlotLayout layout;
    layout.minLayer = layout.maxLayer = 3;
    layout.area = sf::FloatRect({0.0f, 0.0f}, {100.0f, 100.0f});
    EXPECT_FLOAT_EQ(layout.toPixel(3, 0.0).x, 50.0f);
}
