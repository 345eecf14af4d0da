#pragma once
#include <SFML/Graphics.hpp>
#include <optional>
#include "Grid.h"

// draws a Grid into any SFML render target, one rectangle per cell.
// cell (row, col) covers pixels [col*size, (col+1)*size) x [row*size, (row+1)*size)
class GridRenderer
{
public:
    explicit GridRenderer(int cellSize = 24);

    void setCellSize(int size);
    int getCellSize() const { return cellSize_; }

    static sf::Color stateColor(CellState state);

    void draw(sf::RenderTarget &target, const Grid &grid, bool gridLines = true) const;
    void fillCell(sf::RenderTarget &target, const GridCell &cell, sf::Color color) const;

    // circle that grows from the cell centre, progress in [0, 1]
    void drawPathMarker(sf::RenderTarget &target, const GridCell &cell, float progress) const;

    // coordinate conversion
    std::optional<GridCell> pixelToCell(const Grid &grid, int pixelX, int pixelY) const;
    sf::Vector2f cellToPixel(const GridCell &cell) const;   // cell centre

private:
    int cellSize_;

    sf::Color gridLineColor_ = sf::Color(128, 128, 128);

    void drawGridLines(sf::RenderTarget &target, const Grid &grid) const;
};
