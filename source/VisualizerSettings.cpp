#include "VisualizerSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>

const std::vector<VisualizerSettings::Algos> &VisualizerSettings::allAlgos()
{
    static const std::vector<Algos> algos = {Algos::BFS, Algos::DFS, Algos::AStar};
    return algos;
}

bool VisualizerSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Grid Path Visualizer Settings\n";
    file << "rows=" << rows << "\n";
    file << "cols=" << cols << "\n";
    file << "cellSize=" << cellSize << "\n";
    file << "hudHeight=" << hudHeight << "\n";
    file << "frameRateLimit=" << frameRateLimit << "\n";
    file << "stepDelayMs=" << stepDelayMs << "\n";
    file << "pathAnimationMs=" << pathAnimationMs << "\n";
    file << "algorithm=" << static_cast<int>(algorithm) << "\n";
    file << "showGridLines=" << (showGridLines ? 1 : 0) << "\n";
    file << "showHud=" << (showHud ? 1 : 0) << "\n";
    file << "fontPath=" << fontPath << "\n";

    return true;
}

bool VisualizerSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        // strings first, everything else is an integer
        if (key == "fontPath")
        {
            fontPath = value;
            continue;
        }

        int number = 0;
        std::istringstream iss(value);
        if (!(iss >> number))
        {
            std::cerr << "Warning: " << filename << ":" << lineNumber
                      << " ignoring non numeric value for " << key << ": " << value << std::endl;
            continue;
        }

        if (key == "rows")
            rows = number;
        else if (key == "cols")
            cols = number;
        else if (key == "cellSize")
            cellSize = number;
        else if (key == "hudHeight")
            hudHeight = number;
        else if (key == "frameRateLimit")
            frameRateLimit = number;
        else if (key == "stepDelayMs")
            stepDelayMs = number;
        else if (key == "pathAnimationMs")
            pathAnimationMs = number;
        else if (key == "algorithm")
        {
            int maxIndex = static_cast<int>(allAlgos().size()) - 1;
            algorithm = static_cast<Algos>(std::clamp(number, 0, maxIndex));
        }
        else if (key == "showGridLines")
            showGridLines = (number != 0);
        else if (key == "showHud")
            showHud = (number != 0);
    }

    validateAndClamp();
    return true;
}

void VisualizerSettings::validateAndClamp()
{
    rows = std::clamp(rows, 2, 300);
    cols = std::clamp(cols, 2, 300);
    cellSize = std::clamp(cellSize, 2, 100);
    hudHeight = std::clamp(hudHeight, 0, 400);
    frameRateLimit = std::clamp(frameRateLimit, 1, 240);
    stepDelayMs = std::clamp(stepDelayMs, 0, 1000);
    pathAnimationMs = std::clamp(pathAnimationMs, 0, 2000);
}
