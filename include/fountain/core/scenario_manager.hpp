/**
 * @fileoverview scenario_manager.hpp
 * @brief Maintains the list of available scenarios and creates scenario objects.
 */

#ifndef FOUNTAIN_SCENARIO_MANAGER_HPP
#define FOUNTAIN_SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fountain/core/constants.hpp"
#include "fountain/scenarios/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Catalog of available scenarios and a factory to create them.
 */
class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  const std::vector<std::pair<FountainConstants::ScenarioType, std::string>>&
  getScenarioList() const;

  void setCurrentScenario(FountainConstants::ScenarioType scenario);
  FountainConstants::ScenarioType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   * @param scenarioType The chosen scenario type.
   * @return A unique_ptr to a newly constructed scenario.
   */
  std::unique_ptr<IScenario> createScenario(
      FountainConstants::ScenarioType scenarioType) const;

 private:
  std::vector<std::pair<FountainConstants::ScenarioType, std::string>> scenarioList;
  FountainConstants::ScenarioType currentScenario =
      FountainConstants::ScenarioType::CLASSIC_FOUNTAIN;
};

#endif  // FOUNTAIN_SCENARIO_MANAGER_HPP
