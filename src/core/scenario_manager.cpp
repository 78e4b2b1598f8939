/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include <vector>

#include "fountain/core/scenario_manager.hpp"
#include "fountain/scenarios/bouncing_fountain.hpp"
#include "fountain/scenarios/classic_fountain.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : FountainConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, FountainConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<FountainConstants::ScenarioType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setCurrentScenario(FountainConstants::ScenarioType scenario) {
  currentScenario = scenario;
}

FountainConstants::ScenarioType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    FountainConstants::ScenarioType scenarioType) const {
  switch (scenarioType) {
    case FountainConstants::ScenarioType::BOUNCING_FOUNTAIN:
      return std::make_unique<BouncingFountainScenario>();

    case FountainConstants::ScenarioType::CLASSIC_FOUNTAIN:
    default:
      return std::make_unique<ClassicFountainScenario>();
  }
}
