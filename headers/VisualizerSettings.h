#pragma once
#include <vector>
#include <string>

class VisualizerSettings
{
public:
    enum class Algos {
        BFS,           // breadth first search: ring wavefront, shortest path
        DFS,           // depth first search: dives along one branch, backtracks at dead ends
        AStar,         // A*: manhattan heuristic toward the end cell, shortest path
    };

    static const std::vector<Algos> &allAlgos();

    static const char *algoNames(Algos a){
        switch(a){
            case Algos::BFS:
                return "BFS";
            case Algos::DFS:
                return "DFS";
            case Algos::AStar:
                return "A*";
            default:
                return "Unknown";
        }
    }

    // returns true if algorithm guarantees a shortest path on unit cost grids
    static bool isOptimal(Algos a) {
        return a != Algos::DFS;
    }

    // grid layout
    int rows = 30;
    int cols = 30;
    int cellSize = 24;              // pixels per cell side

    // animation
    int frameRateLimit = 60;
    int stepDelayMs = 10;           // pause after every search round
    int pathAnimationMs = 120;      // growing circle duration per path cell

    Algos algorithm = Algos::AStar;

    // display
    bool showGridLines = true;
    bool showHud = true;
    std::string fontPath = "DejaVuSans.ttf";

    // window size follows the grid, with a strip under it for the HUD
    int windowWidth() const { return cols * cellSize; }
    int windowHeight() const { return rows * cellSize + hudHeight; }
    int hudHeight = 120;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();
};
