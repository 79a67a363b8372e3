// Off-screen force vs. layers chart rendered with SFML.
#pragma once

#include <SFML/Graphics.hpp>
#include <string>
#include <vector>

#include "BreakCalculator.hpp"

struct PlotSeries {
    std::string label;
    std::vector<BreakResult> results;
    sf::Color color{sf::Color::Blue};
};

// Maps (layers, force) to pixel coordinates inside the plot area.
struct PlotLayout {
    int minLayer{1};
    int maxLayer{1};
    double maxForce{1.0};
    sf::FloatRect area;

    sf::Vector2f toPixel(int layers, double force) const;
};

// Smallest 1/2/5 x 10^k that is >= value.
double niceAxisMax(double value);

PlotLayout computePlotLayout(const std::vector<PlotSeries>& series, sf::Vector2u size, float margin);

// Returns false if nothing could be drawn or saved; details go to the log.
bool renderForcePlot(const std::string& path, const std::vector<PlotSeries>& series, const std::string& title);
