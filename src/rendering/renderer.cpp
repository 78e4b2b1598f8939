#include "fountain/rendering/renderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "fountain/core/constants.hpp"

namespace {

// Warm gold
const sf::Color ParticleColor(0xff, 0xd8, 0x91);
const sf::Color GroundColor(102, 102, 102);

// Ground line sits this far above the bottom edge
constexpr float GroundMarginPixels = 40.0F;

}  // namespace

Renderer::Renderer(int screenWidth, int screenHeight)
    : initialized(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Particle Fountain");
    window.setFramerateLimit(FountainConstants::StepsPerSecond);
    initialized = window.isOpen();
    return initialized;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

void Renderer::setTitle(const std::string& title) {
    window.setTitle(title);
}

void Renderer::setCamera(const FountainConfig& config) {
    const auto& region = config.spawnRegion;
    centerX = 0.5 * (region.min.x + region.max.x);
    groundHeight = config.groundHeight;
    double const viewHalfWidth = 0.5 * screenWidth / FountainConstants::PixelsPerMeter;
    depthRange = std::max(1.0, viewHalfWidth);
}

float Renderer::toScreenX(double x) const {
    return static_cast<float>(0.5 * screenWidth + (x - centerX) * FountainConstants::PixelsPerMeter);
}

float Renderer::toScreenY(double y) const {
    double const groundY = screenHeight - GroundMarginPixels;
    return static_cast<float>(groundY - (y - groundHeight) * FountainConstants::PixelsPerMeter);
}

void Renderer::renderParticles(const ParticleStore& store) {
    // Ground
    float const gy = toScreenY(groundHeight);
    sf::RectangleShape ground(sf::Vector2f(static_cast<float>(screenWidth),
                                           static_cast<float>(screenHeight) - gy));
    ground.setPosition(0.F, gy);
    ground.setFillColor(GroundColor);
    window.draw(ground);

    auto const radiusPixels = static_cast<float>(
        std::max(1.0, store.getShape().radius * FountainConstants::PixelsPerMeter));

    sf::CircleShape circle(radiusPixels);
    circle.setOrigin(radiusPixels, radiusPixels);

    store.forEach([&](entt::entity, const Components::Position& pos,
                      const Components::Velocity&, const Components::Lifetime&) {
        float const px = toScreenX(pos.x);
        float const py = toScreenY(pos.y);
        if (px < -radiusPixels || px > screenWidth + radiusPixels ||
            py < -radiusPixels || py > screenHeight + radiusPixels) {
            return;
        }

        // Particles further from the viewer are drawn darker
        double const depth = std::clamp(pos.z / depthRange, -1.0, 1.0);
        double const shade = 0.65 + 0.35 * depth;
        circle.setFillColor(sf::Color(static_cast<uint8_t>(ParticleColor.r * shade),
                                      static_cast<uint8_t>(ParticleColor.g * shade),
                                      static_cast<uint8_t>(ParticleColor.b * shade)));
        circle.setPosition(px, py);
        window.draw(circle);
    });
}
