#include "fountain/core/constants.hpp"

namespace FountainConstants {

    // Display
    const unsigned int ScreenWidth    = 800;
    const unsigned int ScreenHeight   = 600;
    const unsigned int StepsPerSecond = 60;
    const double PixelsPerMeter       = 30.0;

    std::vector<ScenarioType> getAllScenarios() {
        return {
            ScenarioType::CLASSIC_FOUNTAIN,
            ScenarioType::BOUNCING_FOUNTAIN
        };
    }

    std::string getScenarioName(ScenarioType scenario) {
        switch (scenario) {
            case ScenarioType::CLASSIC_FOUNTAIN:  return "CLASSIC_FOUNTAIN";
            case ScenarioType::BOUNCING_FOUNTAIN: return "BOUNCING_FOUNTAIN";
            default: return "UNKNOWN";
        }
    }

} // namespace FountainConstants
