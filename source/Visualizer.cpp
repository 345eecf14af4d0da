#include "Visualizer.h"
#include <iostream>
#include <iomanip>
#include <algorithm>

// forwards engine rounds to the window: keep events flowing, redraw, pause
class Visualizer::WindowObserver : public SearchObserver
{
public:
    explicit WindowObserver(Visualizer &owner) : owner_(owner) {}

    void onStep() override
    {
        owner_.pumpEventsDuringSearch();
        owner_.render();
        if (owner_.settings_.stepDelayMs > 0)
        {
            sf::sleep(sf::milliseconds(owner_.settings_.stepDelayMs));
        }
    }

    void onSuccess(const std::vector<GridCell> &path) override
    {
        owner_.animatePath(path);
    }

private:
    Visualizer &owner_;
};

Visualizer::Visualizer(const VisualizerSettings &settings, const std::string &settingsFile)
    : settings_(settings),
      settingsFile_(settingsFile),
      fontLoaded_(loadFont()),
      renderer_(settings.cellSize),
      ui_(font_, fontLoaded_),
      benchmark_(3)
{
    settings_.validateAndClamp();
    applyLayout();
    createWindow();
    bindCallbacks();
}

bool Visualizer::loadFont()
{
    // settings path first, then the usual spots next to the binary and on the system
    if (font_.openFromFile(settings_.fontPath) ||
        font_.openFromFile("DejaVuSans.ttf") ||
        font_.openFromFile("bin/DejaVuSans.ttf") ||
        font_.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        return true;
    }
    std::cout << "Warning: Could not load font file, HUD text will not be displayed" << std::endl;
    return false;
}

void Visualizer::applyLayout()
{
    grid_.initialize(settings_.rows, settings_.cols);
    renderer_.setCellSize(settings_.cellSize);
    status_ = HudStatus();
}

void Visualizer::createWindow()
{
    sf::Vector2u size(static_cast<unsigned int>(settings_.windowWidth()),
                      static_cast<unsigned int>(settings_.windowHeight()));
    window_.create(sf::VideoMode(size), "Grid Path Visualizer", sf::Style::Titlebar | sf::Style::Close);
    window_.setFramerateLimit(static_cast<unsigned int>(settings_.frameRateLimit));
}

void Visualizer::bindCallbacks()
{
    ui_.onRunSearch = [this]() { runSearch(); };
    ui_.onClearGrid = [this]() { clearGrid(); };
    ui_.onClearSearch = [this]() { clearSearch(); };
    ui_.onCompare = [this]() { runComparison(); };
    ui_.onSaveSettings = [this]() { saveSettings(); };
    ui_.onLoadSettings = [this]() { loadSettings(); };
    ui_.onQuit = [this]() { window_.close(); };
}

void Visualizer::run()
{
    std::cout << "Grid " << grid_.getRows() << "x" << grid_.getCols()
              << ", algorithm " << VisualizerSettings::algoNames(settings_.algorithm) << std::endl;

    while (window_.isOpen())
    {
        processEvents();
        if (!window_.isOpen())
            break;
        render();
    }
}

std::optional<GridCell> Visualizer::cellUnderPixel(sf::Vector2i pixel) const
{
    sf::Vector2f world = window_.mapPixelToCoords(pixel);
    return renderer_.pixelToCell(grid_, static_cast<int>(world.x), static_cast<int>(world.y));
}

void Visualizer::processEvents()
{
    while (const std::optional event = window_.pollEvent())
    {
        if (event->is<sf::Event::Closed>())
        {
            window_.close();
            return;
        }

        if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
        {
            ui_.handleInput(keyPressed, settings_);
        }
        else if (const auto *pressed = event->getIf<sf::Event::MouseButtonPressed>())
        {
            auto cell = cellUnderPixel(pressed->position);
            if (pressed->button == sf::Mouse::Button::Left)
            {
                leftButtonDown_ = true;
                if (cell)
                    handleLeftClick(*cell, false);
            }
            else if (pressed->button == sf::Mouse::Button::Right)
            {
                rightButtonDown_ = true;
                if (cell)
                    handleRightClick(*cell);
            }
        }
        else if (const auto *released = event->getIf<sf::Event::MouseButtonReleased>())
        {
            if (released->button == sf::Mouse::Button::Left)
                leftButtonDown_ = false;
            else if (released->button == sf::Mouse::Button::Right)
                rightButtonDown_ = false;
        }
        else if (const auto *moved = event->getIf<sf::Event::MouseMoved>())
        {
            // dragging paints walls (left) or erases (right)
            auto cell = cellUnderPixel(moved->position);
            if (!cell)
                continue;
            if (leftButtonDown_)
                handleLeftClick(*cell, true);
            else if (rightButtonDown_)
                handleRightClick(*cell);
        }
    }
}

void Visualizer::pumpEventsDuringSearch()
{
    // only close and escape matter while the engine owns the grid
    while (const std::optional event = window_.pollEvent())
    {
        if (event->is<sf::Event::Closed>())
        {
            closeRequested_ = true;
            cancel_.requestCancel();
        }
        else if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
        {
            if (keyPressed->code == sf::Keyboard::Key::Escape)
                cancel_.requestCancel();
        }
        else if (event->is<sf::Event::MouseButtonReleased>())
        {
            leftButtonDown_ = false;
            rightButtonDown_ = false;
        }
    }
}

void Visualizer::handleLeftClick(const GridCell &cell, bool dragging)
{
    // an edit invalidates whatever the last search left behind
    if (status_.hasResult)
    {
        grid_.clearSearchState();
        status_.hasResult = false;
        status_.comparisonReport.clear();
    }

    bool isStart = grid_.isStart(cell);
    bool isEnd = grid_.isEnd(cell);

    if (!grid_.startCell())
    {
        if (!dragging && !isEnd)
            grid_.markStart(cell);
    }
    else if (!grid_.endCell())
    {
        if (!dragging && !isStart)
            grid_.markEnd(cell);
    }
    else if (!isStart && !isEnd)
    {
        grid_.markObstacle(cell);
    }
}

void Visualizer::handleRightClick(const GridCell &cell)
{
    if (status_.hasResult)
    {
        grid_.clearSearchState();
        status_.hasResult = false;
        status_.comparisonReport.clear();
    }
    grid_.reset(cell);
}

void Visualizer::drawScene()
{
    window_.clear(sf::Color::White);
    renderer_.draw(window_, grid_, settings_.showGridLines);
    ui_.drawHUD(window_, settings_, status_);
}

void Visualizer::render()
{
    drawScene();
    window_.display();
}

void Visualizer::animatePath(const std::vector<GridCell> &path)
{
    // path is end first. reveal from the start side, the end keeps its own color
    std::vector<GridCell> reveal;
    for (auto it = path.rbegin(); it != path.rend(); ++it)
    {
        if (*it != path.front())
            reveal.push_back(*it);
    }

    const sf::Color hiddenColor = GridRenderer::stateColor(CellState::Visited);
    const float duration = static_cast<float>(settings_.pathAnimationMs);

    for (size_t i = 0; i < reveal.size(); i++)
    {
        sf::Clock clock;
        float progress = 0.0f;
        while (progress < 1.0f)
        {
            pumpEventsDuringSearch();
            if (cancel_.isCancelled() || !window_.isOpen())
                return;

            progress = duration <= 0.0f ? 1.0f : clock.getElapsedTime().asMilliseconds() / duration;

            drawScene();
            for (size_t j = i; j < reveal.size(); j++)
            {
                renderer_.fillCell(window_, reveal[j], hiddenColor);
            }
            renderer_.drawPathMarker(window_, reveal[i], progress);
            window_.display();
        }
    }
}

void Visualizer::runSearch()
{
    if (searching_)
        return;

    grid_.clearSearchState();
    cancel_.reset();
    closeRequested_ = false;
    leftButtonDown_ = false;
    rightButtonDown_ = false;

    const char *algoName = VisualizerSettings::algoNames(settings_.algorithm);
    status_.comparisonReport.clear();
    status_.searching = true;
    status_.message = std::string("Running ") + algoName + " ([Esc] to stop)";

    searching_ = true;
    WindowObserver observer(*this);
    SearchResult result = pathfinder_.findPath(settings_.algorithm, grid_, observer, &cancel_);
    searching_ = false;

    status_.searching = false;
    status_.hasResult = result.outcome != SearchOutcome::InvalidInput;
    status_.outcome = searchOutcomeName(result.outcome);
    status_.nodesExpanded = result.nodesExpanded;
    status_.pathLength = static_cast<int>(result.path.size());
    status_.computeTimeMs = result.computeTimeMs;

    switch (result.outcome)
    {
    case SearchOutcome::Found:
        status_.message = std::string(algoName) + " found a path of " + std::to_string(result.path.size()) + " cells";
        break;
    case SearchOutcome::NotFound:
        status_.message = std::string(algoName) + " explored everything reachable, no path";
        break;
    case SearchOutcome::Cancelled:
        status_.message = std::string(algoName) + " stopped";
        break;
    case SearchOutcome::InvalidInput:
        status_.message = "Place a start and an end cell first";
        std::cerr << "Search not started: start and end must be two different cells on the grid" << std::endl;
        break;
    }

    if (result.outcome != SearchOutcome::InvalidInput)
    {
        std::cout << std::fixed << std::setprecision(3)
                  << algoName << ": " << searchOutcomeName(result.outcome)
                  << " | expanded " << result.nodesExpanded
                  << " | rounds " << result.steps
                  << " | path " << result.path.size()
                  << " | " << result.computeTimeMs << "ms" << std::endl;
    }

    // the host decides what a cancel means: closing the window exits
    if (closeRequested_)
    {
        window_.close();
    }
}

void Visualizer::runComparison()
{
    if (searching_)
        return;

    benchmark_.runComparison(grid_);
    status_.comparisonReport = benchmark_.formatReport();
    status_.message = "Comparison on a copy of the grid ([R] to hide)";

    std::cout << "Algorithm comparison (" << benchmark_.getTrials() << " trials each):" << std::endl;
    std::cout << status_.comparisonReport << std::flush;
}

void Visualizer::clearGrid()
{
    grid_.clear();
    status_ = HudStatus();
    std::cout << "Grid cleared" << std::endl;
}

void Visualizer::clearSearch()
{
    grid_.clearSearchState();
    status_.hasResult = false;
    status_.comparisonReport.clear();
    status_.message = "Search state cleared";
}

void Visualizer::saveSettings()
{
    if (settings_.saveToFile(settingsFile_))
    {
        status_.message = "Settings saved to " + settingsFile_;
        std::cout << "Settings saved to " << settingsFile_ << std::endl;
    }
    else
    {
        status_.message = "Could not save " + settingsFile_;
    }
}

void Visualizer::loadSettings()
{
    VisualizerSettings loaded = settings_;
    if (!loaded.loadFromFile(settingsFile_))
    {
        status_.message = "Could not load " + settingsFile_;
        return;
    }

    bool layoutChanged = loaded.rows != settings_.rows || loaded.cols != settings_.cols ||
                         loaded.cellSize != settings_.cellSize || loaded.hudHeight != settings_.hudHeight;
    settings_ = loaded;

    if (layoutChanged)
    {
        // the grid is not persisted, a new layout starts empty
        applyLayout();
        createWindow();
    }
    else
    {
        window_.setFramerateLimit(static_cast<unsigned int>(settings_.frameRateLimit));
    }

    status_.message = "Settings loaded from " + settingsFile_;
    std::cout << "Settings loaded from " << settingsFile_ << std::endl;
}
