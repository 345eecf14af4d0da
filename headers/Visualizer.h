#pragma once
#include <SFML/Graphics.hpp>
#include <string>
#include <vector>
#include "VisualizerSettings.h"
#include "Grid.h"
#include "GridRenderer.h"
#include "UIManager.h"
#include "Pathfinder.h"
#include "BenchmarkManager.h"
#include "SearchObserver.h"

// owns the window and the grid, turns mouse/keyboard input into grid edits
// and drives the search engine with a window backed observer
class Visualizer
{
public:
    Visualizer(const VisualizerSettings &settings, const std::string &settingsFile);

    // blocks until the window is closed
    void run();

    const Grid &getGrid() const { return grid_; }

private:
    class WindowObserver;

    VisualizerSettings settings_;
    std::string settingsFile_;

    sf::RenderWindow window_;
    sf::Font font_;
    bool fontLoaded_ = false;

    Grid grid_;
    GridRenderer renderer_;
    UIManager ui_;
    Pathfinder pathfinder_;
    BenchmarkManager benchmark_;

    CancellationToken cancel_;
    bool searching_ = false;
    bool closeRequested_ = false;   // window closed while a search was running
    HudStatus status_;

    // mouse painting state
    bool leftButtonDown_ = false;
    bool rightButtonDown_ = false;

    void createWindow();
    bool loadFont();
    void bindCallbacks();
    void applyLayout();   // grid/window size follow settings_

    // event handling
    void processEvents();
    void pumpEventsDuringSearch();
    void handleLeftClick(const GridCell &cell, bool dragging);
    void handleRightClick(const GridCell &cell);
    std::optional<GridCell> cellUnderPixel(sf::Vector2i pixel) const;

    // rendering
    void drawScene();
    void render();
    void animatePath(const std::vector<GridCell> &path);

    // actions
    void runSearch();
    void runComparison();
    void clearGrid();
    void clearSearch();
    void saveSettings();
    void loadSettings();
};
