#ifndef FOUNTAIN_CONSTANTS_HPP
#define FOUNTAIN_CONSTANTS_HPP

#include <string>
#include <vector>

namespace FountainConstants {

    /**
     * @brief The configuration presets the viewer can switch between.
     */
    enum class ScenarioType {
        CLASSIC_FOUNTAIN,
        BOUNCING_FOUNTAIN
    };

    // Display constants
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int StepsPerSecond;
    extern const double PixelsPerMeter;

    std::vector<ScenarioType> getAllScenarios();
    std::string getScenarioName(ScenarioType scenario);
}

#endif // FOUNTAIN_CONSTANTS_HPP
