/**
 * @file renderer.hpp
 * @brief Side-view rendering of the fountain using SFML
 *
 * This system handles:
 * - Window creation and frame presentation
 * - Drawing the ground line
 * - Drawing every live particle as a circle, shaded by depth (Z)
 *
 * The renderer only reads the particle store.
 */

#ifndef FOUNTAIN_RENDERER_HPP
#define FOUNTAIN_RENDERER_HPP

#include <string>
#include <SFML/Graphics.hpp>

#include "fountain/core/config.hpp"
#include "fountain/core/particle_store.hpp"

class Renderer {
public:
    /**
     * @brief Constructs renderer with given screen dimensions
     * @param screenWidth Width of the window
     * @param screenHeight Height of the window
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the SFML window
     * @return true if the window is open
     */
    bool init();

    /** Clears the screen to black */
    void clear();

    /** Presents the rendered frame to display */
    void present();

    /**
     * @brief Centres the view on the spawn region and places the ground line.
     */
    void setCamera(const FountainConfig& config);

    /**
     * @brief Draws the ground and all particles of the store
     */
    void renderParticles(const ParticleStore& store);

    void setTitle(const std::string& title);

    sf::RenderWindow& getWindow() { return window; }

private:
    float toScreenX(double x) const;
    float toScreenY(double y) const;

    sf::RenderWindow window;
    bool initialized;
    int screenWidth;
    int screenHeight;

    double centerX = 0.0;
    double groundHeight = 0.0;
    double depthRange = 1.0;   // |z| that maps to the darkest shade
};

#endif // FOUNTAIN_RENDERER_HPP
