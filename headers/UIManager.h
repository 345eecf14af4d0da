#pragma once
#include <SFML/Graphics.hpp>
#include "VisualizerSettings.h"
#include <functional>
#include <string>

// what the HUD reports about the last action
struct HudStatus
{
    std::string message = "Left click: start, end, then walls";
    bool searching = false;
    bool hasResult = false;
    std::string outcome;
    int nodesExpanded = 0;
    int pathLength = 0;
    double computeTimeMs = 0.0;
    std::string comparisonReport;   // empty unless a comparison ran
};

class UIManager
{
public:
    UIManager(sf::Font &font, bool fontLoaded);

    // event handling
    void handleInput(const sf::Event::KeyPressed* keyEvent, VisualizerSettings &settings);

    // rendering
    void drawHUD(sf::RenderWindow &window, const VisualizerSettings &settings, const HudStatus &status);

    // ui state
    bool isHelpVisible() const { return showHelp_; }
    void toggleHelp() { showHelp_ = !showHelp_; }

    // callbacks for visualizer control
    std::function<void()> onRunSearch;
    std::function<void()> onClearGrid;
    std::function<void()> onClearSearch;
    std::function<void()> onCompare;
    std::function<void()> onSaveSettings;
    std::function<void()> onLoadSettings;
    std::function<void()> onQuit;

    // text builders, kept separate from drawing
    static std::string buildStatusText(const VisualizerSettings &settings, const HudStatus &status);
    static std::string buildHelpText();

private:
    sf::Font &font_;
    bool fontLoaded_;
    bool showHelp_ = true;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(30, 30, 30);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color hudAccentColor_ = sf::Color::Yellow;

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawText(sf::RenderWindow &window, const std::string &text, sf::Vector2f position,
                  unsigned int size, sf::Color color);

    // input handling helpers
    void handleKeyboardInput(sf::Keyboard::Key key, VisualizerSettings &settings);
    static void fire(const std::function<void()> &callback);
};
