#ifndef FOUNTAIN_I_SCENARIO_HPP
#define FOUNTAIN_I_SCENARIO_HPP

#include <string>
#include "fountain/core/config.hpp"

/**
 * @brief Abstract base class for any fountain preset
 *
 * Each scenario must provide:
 *  - getConfig() returning the parameters the simulator is built with
 *  - getName() for window titles and logs
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual FountainConfig getConfig() const = 0;

    virtual std::string getName() const = 0;
};

#endif // FOUNTAIN_I_SCENARIO_HPP
