/********************************************************
 *  description:    grid path visualizer. draw walls, pick a start and
 *  :               an end, watch BFS / DFS / A* explore the grid
 *  build/run:      cmake -S . -B build && cmake --build build
 *  :               ./build/gridviz [settings file]
 ***********************************************************/

#include <SFML/Graphics.hpp>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <string>

#include "VisualizerSettings.h"
#include "Visualizer.h"

static const char *DEFAULT_SETTINGS_FILE = "gridviz_settings.txt";

int main(int argc, char *argv[])
{
    std::string settingsFile = argc > 1 ? argv[1] : DEFAULT_SETTINGS_FILE;

    VisualizerSettings settings;
    if (argc > 1 || std::ifstream(settingsFile).good())
    {
        if (settings.loadFromFile(settingsFile))
        {
            std::cout << "Loaded settings from " << settingsFile << std::endl;
        }
        else
        {
            std::cout << "Using default settings" << std::endl;
        }
    }
    settings.validateAndClamp();

    std::cout << "Left click: start, end, then walls | Right click: erase" << std::endl;
    std::cout << "[1/2/3] BFS/DFS/A* | [Space] run | [M] compare | [Esc] quit" << std::endl;

    try
    {
        Visualizer visualizer(settings, settingsFile);
        visualizer.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
