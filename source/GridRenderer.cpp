#include "GridRenderer.h"
#include <algorithm>

GridRenderer::GridRenderer(int cellSize) : cellSize_(std::max(1, cellSize)) {}

void GridRenderer::setCellSize(int size)
{
    cellSize_ = std::max(1, size);
}

sf::Color GridRenderer::stateColor(CellState state)
{
    switch (state)
    {
    case CellState::Free:
        return sf::Color::White;
    case CellState::Obstacle:
        return sf::Color::Black;
    case CellState::Start:
        return sf::Color(102, 204, 255);   // light blue
    case CellState::End:
        return sf::Color(102, 102, 255);   // light purple
    case CellState::Frontier:
        return sf::Color::Green;
    case CellState::Visited:
        return sf::Color::Red;
    case CellState::Path:
        return sf::Color(255, 192, 203);   // pink
    default:
        return sf::Color::Magenta;
    }
}

void GridRenderer::fillCell(sf::RenderTarget &target, const GridCell &cell, sf::Color color) const
{
    const float size = static_cast<float>(cellSize_);
    sf::RectangleShape rect({size, size});
    rect.setPosition({cell.col * size, cell.row * size});
    rect.setFillColor(color);
    target.draw(rect);
}

void GridRenderer::draw(sf::RenderTarget &target, const Grid &grid, bool gridLines) const
{
    // a single reusable shape, only position and color change per cell
    const float size = static_cast<float>(cellSize_);
    sf::RectangleShape rect({size, size});

    for (int r = 0; r < grid.getRows(); r++)
    {
        for (int c = 0; c < grid.getCols(); c++)
        {
            rect.setPosition({c * size, r * size});
            rect.setFillColor(stateColor(grid.stateAt({r, c})));
            target.draw(rect);
        }
    }

    if (gridLines)
    {
        drawGridLines(target, grid);
    }
}

void GridRenderer::drawGridLines(sf::RenderTarget &target, const Grid &grid) const
{
    const float size = static_cast<float>(cellSize_);
    const float width = grid.getCols() * size;
    const float height = grid.getRows() * size;

    sf::VertexArray lines(sf::PrimitiveType::Lines);
    for (int r = 0; r <= grid.getRows(); r++)
    {
        lines.append(sf::Vertex{{0.0f, r * size}, gridLineColor_});
        lines.append(sf::Vertex{{width, r * size}, gridLineColor_});
    }
    for (int c = 0; c <= grid.getCols(); c++)
    {
        lines.append(sf::Vertex{{c * size, 0.0f}, gridLineColor_});
        lines.append(sf::Vertex{{c * size, height}, gridLineColor_});
    }
    target.draw(lines);
}

void GridRenderer::drawPathMarker(sf::RenderTarget &target, const GridCell &cell, float progress) const
{
    float radius = std::clamp(progress, 0.0f, 1.0f) * cellSize_ * 0.5f;
    sf::CircleShape circle(radius);
    circle.setOrigin({radius, radius});
    circle.setPosition(cellToPixel(cell));
    circle.setFillColor(stateColor(CellState::Path));
    target.draw(circle);
}

std::optional<GridCell> GridRenderer::pixelToCell(const Grid &grid, int pixelX, int pixelY) const
{
    // negative pixels must not truncate toward cell 0
    if (pixelX < 0 || pixelY < 0)
        return std::nullopt;

    GridCell cell{pixelY / cellSize_, pixelX / cellSize_};
    if (!grid.contains(cell))
        return std::nullopt;
    return cell;
}

sf::Vector2f GridRenderer::cellToPixel(const GridCell &cell) const
{
    return {(cell.col + 0.5f) * cellSize_, (cell.row + 0.5f) * cellSize_};
}
