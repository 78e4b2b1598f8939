/**
 * @fileoverview sim_manager.hpp
 * @brief Host loop of the viewer: owns the simulator, feeds it time and draws it.
 */

#pragma once

#include <memory>

#include "fountain/core/scenario_manager.hpp"
#include "fountain/core/simulator.hpp"
#include "fountain/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Orchestrates the main loop, owns subsystems, and manages scenario selection.
 *
 * Time is simulated, not read from the wall clock: every tick advances
 * simTime by the scenario's secondsPerTick and passes it to the simulator.
 */
class SimManager {
 public:
  SimManager();

  /**
   * @brief Creates the window and the initial scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed.
   */
  void run();

  /**
   * @brief Processes window and keyboard events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the simulation (unless paused).
   */
  void tick();

  void render();

  void togglePause();
  void resetSimulator();
  void stepOnce();

  /**
   * @brief Rebuilds the simulator from a new scenario's config.
   */
  void selectScenario(FountainConstants::ScenarioType scenario);

 private:
  void updateTitle();

  Renderer renderer;
  ScenarioManager scenarioManager;
  std::unique_ptr<IScenario> scenario;
  std::unique_ptr<FountainSimulator> simulator;

  double simTime;
  int tickCount;
  bool running;
  bool paused;
  bool stepFrame;
};
