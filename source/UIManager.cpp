#include "UIManager.h"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <algorithm>

UIManager::UIManager(sf::Font &font, bool fontLoaded) : font_(font), fontLoaded_(fontLoaded) {}

void UIManager::handleInput(const sf::Event::KeyPressed* keyEvent, VisualizerSettings &settings)
{
    if (keyEvent)
    {
        handleKeyboardInput(keyEvent->code, settings);
    }
}

void UIManager::fire(const std::function<void()> &callback)
{
    if (callback)
        callback();
}

std::string UIManager::buildStatusText(const VisualizerSettings &settings, const HudStatus &status)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "Algorithm [1/2/3]: " << VisualizerSettings::algoNames(settings.algorithm)
        << " | Grid: " << settings.rows << "x" << settings.cols
        << " | Step delay: " << settings.stepDelayMs << "ms";
    if (status.searching)
        oss << " | searching...";
    oss << "\n";

    oss << status.message << "\n";

    if (status.hasResult)
    {
        oss << "Last run: " << status.outcome
            << " | Expanded: " << status.nodesExpanded
            << " | Path: " << status.pathLength
            << " | Time: " << status.computeTimeMs << "ms" << "\n";
    }

    return oss.str();
}

std::string UIManager::buildHelpText()
{
    std::ostringstream oss;
    oss << "[Space] Run | [R] Clear search | [C] Clear grid | [M] Compare\n";
    oss << "[Up/Down] Speed | [G] Grid lines | [S] Save | [L] Load | [H] Hide help | [Esc] Quit";
    return oss.str();
}

void UIManager::drawHUD(sf::RenderWindow &window, const VisualizerSettings &settings, const HudStatus &status)
{
    if (!settings.showHud || settings.hudHeight <= 0)
        return;

    sf::Vector2f windowSize = static_cast<sf::Vector2f>(window.getSize());
    float top = static_cast<float>(settings.rows * settings.cellSize);
    drawBackground(window, sf::FloatRect({0.0f, top}, {windowSize.x, windowSize.y - top}));

    // no font, no text. the grid itself still works
    if (!fontLoaded_)
        return;

    sf::Vector2f pos(8.0f, top + 6.0f);
    drawText(window, buildStatusText(settings, status), pos, 13, hudTextColor_);

    if (showHelp_)
    {
        sf::Vector2f helpPos(8.0f, windowSize.y - 38.0f);
        drawText(window, buildHelpText(), helpPos, 12, hudAccentColor_);
    }

    // comparison table overlays the grid top left
    if (!status.comparisonReport.empty())
    {
        sf::Text report(font_, status.comparisonReport, 12);
        report.setFillColor(hudTextColor_);
        report.setPosition({14.0f, 14.0f});
        sf::FloatRect bounds = report.getLocalBounds();
        sf::RectangleShape background(sf::Vector2f(bounds.size.x + 16, bounds.size.y + 16));
        background.setPosition({6.0f, 6.0f});
        background.setFillColor(sf::Color(0, 0, 0, 180));
        window.draw(background);
        window.draw(report);
    }
}

void UIManager::drawText(sf::RenderWindow &window, const std::string &text, sf::Vector2f position,
                         unsigned int size, sf::Color color)
{
    sf::Text label(font_, text, size);
    label.setFillColor(color);
    label.setPosition(position);
    window.draw(label);
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(bounds.size);
    background.setPosition(bounds.position);
    background.setFillColor(hudBackgroundColor_);
    window.draw(background);
}

void UIManager::handleKeyboardInput(sf::Keyboard::Key key, VisualizerSettings &settings)
{
    switch (key)
    {
    // algorithm selection
    case sf::Keyboard::Key::Num1:
        settings.algorithm = VisualizerSettings::Algos::BFS;
        std::cout << "Algorithm: " << VisualizerSettings::algoNames(settings.algorithm) << std::endl;
        break;
    case sf::Keyboard::Key::Num2:
        settings.algorithm = VisualizerSettings::Algos::DFS;
        std::cout << "Algorithm: " << VisualizerSettings::algoNames(settings.algorithm) << std::endl;
        break;
    case sf::Keyboard::Key::Num3:
        settings.algorithm = VisualizerSettings::Algos::AStar;
        std::cout << "Algorithm: " << VisualizerSettings::algoNames(settings.algorithm) << std::endl;
        break;

    // animation speed
    case sf::Keyboard::Key::Up:
        settings.stepDelayMs = std::max(0, settings.stepDelayMs - 5);
        break;
    case sf::Keyboard::Key::Down:
        settings.stepDelayMs = std::min(1000, settings.stepDelayMs + 5);
        break;

    // actions
    case sf::Keyboard::Key::Space:
        fire(onRunSearch);
        break;
    case sf::Keyboard::Key::C:
        fire(onClearGrid);
        break;
    case sf::Keyboard::Key::R:
        fire(onClearSearch);
        break;
    case sf::Keyboard::Key::M:
        fire(onCompare);
        break;
    case sf::Keyboard::Key::S:
        fire(onSaveSettings);
        break;
    case sf::Keyboard::Key::L:
        fire(onLoadSettings);
        break;

    // display
    case sf::Keyboard::Key::H:
        toggleHelp();
        break;
    case sf::Keyboard::Key::G:
        settings.showGridLines = !settings.showGridLines;
        break;
    case sf::Keyboard::Key::Escape:
        fire(onQuit);
        break;

    default:
        break;
    }
}
