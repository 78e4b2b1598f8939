/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which drives the fountain and the window.
 */

#include <iostream>
#include <sstream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "fountain/core/constants.hpp"
#include "fountain/core/debug.hpp"
#include "fountain/core/profile.hpp"
#include "fountain/core/sim_manager.hpp"

SimManager::SimManager()
    : renderer(static_cast<int>(FountainConstants::ScreenWidth),
               static_cast<int>(FountainConstants::ScreenHeight))
    , scenarioManager()
    , simTime(0.0)
    , tickCount(0)
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
    if (!renderer.init())
    {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    scenarioManager.buildScenarioList();
    selectScenario(FountainConstants::ScenarioType::CLASSIC_FOUNTAIN);

    return true;
}

void SimManager::run()
{
    if (!init())
    {
        return;
    }

    sf::Clock frameClock;
    sf::Time simulationAccumulator = sf::Time::Zero;
    const sf::Time fixedTickDt = sf::seconds(1.f / FountainConstants::StepsPerSecond);

    running = true;
    while (running && renderer.getWindow().isOpen())
    {
        simulationAccumulator += frameClock.restart();

        if (!handleEvents())
        {
            break;
        }

        // Limit ticks to prevent a spiral when frames are slow
        const int MAX_TICKS_PER_FRAME = 5;
        int ticksThisFrame = 0;
        while (simulationAccumulator >= fixedTickDt && ticksThisFrame < MAX_TICKS_PER_FRAME)
        {
            tick();
            simulationAccumulator -= fixedTickDt;
            ticksThisFrame++;
        }
        if (ticksThisFrame == MAX_TICKS_PER_FRAME)
        {
            simulationAccumulator = sf::Time::Zero;
        }

        render();
    }

    renderer.getWindow().close();
    Profiling::Profiler::printStats();
}

bool SimManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P:
                    togglePause();
                    break;
                case sf::Keyboard::Space:
                    if (paused)
                    {
                        stepOnce();
                    }
                    break;
                case sf::Keyboard::R:
                    resetSimulator();
                    break;
                case sf::Keyboard::Num1:
                    selectScenario(FountainConstants::ScenarioType::CLASSIC_FOUNTAIN);
                    break;
                case sf::Keyboard::Num2:
                    selectScenario(FountainConstants::ScenarioType::BOUNCING_FOUNTAIN);
                    break;
                default:
                    break;
            }
        }
    }

    return running;
}

void SimManager::tick()
{
    PROFILE_SCOPE("SimManager::tick");

    if (paused && !stepFrame)
    {
        return;
    }
    stepFrame = false;

    const double dt = simulator->getConfig().secondsPerTick;
    simulator->tick(simTime, dt);
    const TickStats& stats = simulator->getLastTick();
    simTime += dt;
    tickCount++;

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "tick " << tickCount << " t=" << simTime
              << " spawned=" << stats.spawned << " expired=" << stats.expired
              << " removedByPhysics=" << stats.removedByPhysics << " live=" << stats.live << "\n");

    if (tickCount % static_cast<int>(FountainConstants::StepsPerSecond) == 0)
    {
        updateTitle();
    }
}

void SimManager::render()
{
    PROFILE_SCOPE("SimManager::render");

    renderer.clear();
    renderer.renderParticles(simulator->getStore());
    renderer.present();
}

void SimManager::togglePause()
{
    paused = !paused;
    updateTitle();
}

void SimManager::resetSimulator()
{
    simulator->reset();
    simTime = 0.0;
    tickCount = 0;
    paused = false;
    updateTitle();
}

void SimManager::stepOnce()
{
    stepFrame = true;
}

void SimManager::selectScenario(FountainConstants::ScenarioType type)
{
    scenarioManager.setCurrentScenario(type);
    scenario = scenarioManager.createScenario(type);

    simulator = std::make_unique<FountainSimulator>(scenario->getConfig());

    renderer.setCamera(simulator->getConfig());
    simTime = 0.0;
    tickCount = 0;
    paused = false;

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "Scenario " << scenario->getName()
              << " using " << simulator->getBackend().name() << " backend\n");
    updateTitle();
}

void SimManager::updateTitle()
{
    std::ostringstream title;
    title << "Particle Fountain - " << scenario->getName()
          << " [" << simulator->getBackend().name() << "]"
          << "  t=" << static_cast<int>(simTime) << "s"
          << "  particles=" << simulator->getStore().size();
    if (paused)
    {
        title << "  (paused)";
    }
    renderer.setTitle(title.str());
}
