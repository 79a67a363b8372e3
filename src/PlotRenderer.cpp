// Plot rendering into an SFML render texture, saved as an image.
#include "PlotRenderer.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include "Config.hpp"
#include "Logger.hpp"
#include "Report.hpp"

namespace {
constexpr int kForceTicks = 5;
constexpr float kMarkerRadius = 4.0f;

std::optional<sf::Font> loadPlotFont() {
    sf::Font font;
    for (const char* path : {config::kFontPathPrimary, config::kFontPathSecondary, config::kFontPathFallback}) {
        if (font.openFromFile(path)) {
            Logger::getInstance().info(std::string("Plot font: ") + path);
            return font;
        }
    }
    Logger::getInstance().warning("No plot font found; drawing the chart without labels");
    return std::nullopt;
}

void drawText(sf::RenderTarget& target, const sf::Font& font, const std::string& str,
              sf::Vector2f position, bool centered = false) {
    sf::Text text(font, str, config::kPlotFontSize);
    text.setFillColor(sf::Color::Black);
    if (centered) {
        sf::FloatRect bounds = text.getLocalBounds();
        position.x -= bounds.size.x * 0.5f;
    }
    text.setPosition(position);
    target.draw(text);
}

void drawAxes(sf::RenderTarget& target, const PlotLayout& layout, const sf::Font* font) {
    const sf::FloatRect& area = layout.area;
    sf::Vector2f origin{area.position.x, area.position.y + area.size.y};

    sf::VertexArray axes(sf::PrimitiveType::Lines);
    axes.append(sf::Vertex{origin, sf::Color::Black});
    axes.append(sf::Vertex{{area.position.x + area.size.x, origin.y}, sf::Color::Black});
    axes.append(sf::Vertex{origin, sf::Color::Black});
    axes.append(sf::Vertex{area.position, sf::Color::Black});

    // Horizontal grid and force ticks
    for (int i = 1; i <= kForceTicks; ++i) {
        double force = layout.maxForce * i / kForceTicks;
        sf::Vector2f p = layout.toPixel(layout.minLayer, force);
        axes.append(sf::Vertex{{area.position.x, p.y}, sf::Color(220, 220, 220)});
        axes.append(sf::Vertex{{area.position.x + area.size.x, p.y}, sf::Color(220, 220, 220)});
        if (font) {
            drawText(target, *font, formatOneDecimal(force), {4.0f, p.y - config::kPlotFontSize * 0.6f});
        }
    }
    target.draw(axes);

    if (!font) return;
    for (int n = layout.minLayer; n <= layout.maxLayer; ++n) {
        sf::Vector2f p = layout.toPixel(n, 0.0);
        drawText(target, *font, std::to_string(n), {p.x, p.y + 6.0f}, true);
    }
    drawText(target, *font, "Layers", {area.position.x + area.size.x * 0.5f, origin.y + 30.0f}, true);
    drawText(target, *font, "Force (lbf)", {4.0f, area.position.y - 40.0f});
}

void drawSeries(sf::RenderTarget& target, const PlotLayout& layout, const PlotSeries& series) {
    sf::VertexArray line(sf::PrimitiveType::LineStrip);
    for (const auto& result : series.results) {
        sf::Vector2f p = layout.toPixel(result.layers, result.force);
        line.append(sf::Vertex{p, series.color});

        sf::CircleShape marker(kMarkerRadius);
        marker.setOrigin({kMarkerRadius, kMarkerRadius});
        marker.setPosition(p);
        marker.setFillColor(series.color);
        target.draw(marker);
    }
    target.draw(line);
}

void drawLegend(sf::RenderTarget& target, const PlotLayout& layout, const std::vector<PlotSeries>& series,
                const sf::Font& font) {
    float x = layout.area.position.x + 16.0f;
    float y = layout.area.position.y + 8.0f;
    for (const auto& s : series) {
        sf::RectangleShape swatch({18.0f, 4.0f});
        swatch.setPosition({x, y + config::kPlotFontSize * 0.6f});
        swatch.setFillColor(s.color);
        target.draw(swatch);
        drawText(target, font, s.label, {x + 26.0f, y});
        y += config::kPlotFontSize + 8.0f;
    }
}
}  // namespace

sf::Vector2f PlotLayout::toPixel(int layers, double force) const {
    float fx = 0.5f;
    if (maxLayer > minLayer) {
        fx = static_cast<float>(layers - minLayer) / static_cast<float>(maxLayer - minLayer);
    }
    float fy = maxForce > 0.0 ? static_cast<float>(force / maxForce) : 0.0f;
    return {area.position.x + fx * area.size.x, area.position.y + area.size.y - fy * area.size.y};
}

double niceAxisMax(double value) {
    if (value <= 0.0) return 1.0;
    double magnitude = std::pow(10.0, std::floor(std::log10(value)));
    for (double step : {1.0, 2.0, 5.0, 10.0}) {
        if (step * magnitude >= value) {
            return step * magnitude;
        }
    }
    return 10.0 * magnitude;
}

PlotLayout computePlotLayout(const std::vector<PlotSeries>& series, sf::Vector2u size, float margin) {
    PlotLayout layout;
    bool first = true;
    double peak = 0.0;
    for (const auto& s : series) {
        for (const auto& result : s.results) {
            if (first) {
                layout.minLayer = layout.maxLayer = result.layers;
                first = false;
            }
            layout.minLayer = std::min(layout.minLayer, result.layers);
            layout.maxLayer = std::max(layout.maxLayer, result.layers);
            peak = std::max(peak, result.force);
        }
    }
    layout.maxForce = niceAxisMax(peak);
    layout.area = sf::FloatRect({margin, margin},
                                {static_cast<float>(size.x) - 2.0f * margin,
                                 static_cast<float>(size.y) - 2.0f * margin});
    return layout;
}

bool renderForcePlot(const std::string& path, const std::vector<PlotSeries>& series, const std::string& title) {
    sf::Vector2u size{config::kPlotWidth, config::kPlotHeight};
    sf::RenderTexture target;
    if (!target.resize(size)) {
        Logger::getInstance().error("Cannot create a render texture for the plot");
        return false;
    }

    PlotLayout layout = computePlotLayout(series, size, config::kPlotMargin);
    std::optional<sf::Font> font = loadPlotFont();

    target.clear(sf::Color::White);
    drawAxes(target, layout, font ? &*font : nullptr);
    for (const auto& s : series) {
        drawSeries(target, layout, s);
    }
    if (font) {
        drawLegend(target, layout, series, *font);
        drawText(target, *font, title, {static_cast<float>(size.x) * 0.5f, 12.0f}, true);
    }
    target.display();

    sf::Image image = target.getTexture().copyToImage();
    if (!image.saveToFile(path)) {
        Logger::getInstance().error("Cannot save plot image: " + path);
        return false;
    }
    Logger::getInstance().info("Plot written to " + path);
    return true;
}
