#include "BotRenderer.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace
{
    const float BOT_SCALE = 1.5f; // world units per shape unit
}

BotRenderer::BotRenderer(std::shared_ptr<SnapshotBoard<BotState>> bots, const BotSettings &settings)
    : board_(std::move(bots)), worldSize_(settings.worldSize), vertices_(sf::PrimitiveType::Triangles)
{
    // 1.2 x 0.8 box
    body_.triangles = {{-0.6f, -0.4f}, {-0.6f, 0.4f}, {0.6f, 0.4f},
                       {-0.6f, -0.4f}, {0.6f, 0.4f}, {0.6f, -0.4f}};
    body_.color = sf::Color(220, 40, 40);

    // thin barrel from the centre forwards
    gun_.triangles = {{0.0f, -0.06f}, {0.0f, 0.06f}, {0.8f, 0.06f},
                      {0.0f, -0.06f}, {0.8f, 0.06f}, {0.8f, -0.06f}};
    gun_.color = sf::Color(60, 90, 255);

    // wedge opening along the radar heading
    radar_.triangles = {{0.0f, 0.0f}, {0.3f, 0.3f}, {0.3f, -0.3f}};
    radar_.color = sf::Color(40, 220, 60);

    arena_.setFillColor(sf::Color(20, 20, 20));
    arena_.setOutlineColor(sf::Color(80, 80, 80));
    arena_.setOutlineThickness(1.0f);
}

void BotRenderer::update()
{
    bots_ = board_->read();
}

void BotRenderer::draw(sf::RenderTarget &target)
{
    const sf::Vector2u size = target.getSize();
    const double scaleX = static_cast<double>(size.x) / worldSize_.x;
    const double scaleY = static_cast<double>(size.y) / worldSize_.y;
    scale_ = std::min(scaleX, scaleY);

    // centre the arena in the window
    offset_ = sf::Vector2f(static_cast<float>((size.x - worldSize_.x * scale_) * 0.5),
                           static_cast<float>((size.y - worldSize_.y * scale_) * 0.5));
    screenHeight_ = static_cast<float>(size.y);

    arena_.setSize(sf::Vector2f(static_cast<float>(worldSize_.x * scale_), static_cast<float>(worldSize_.y * scale_)));
    arena_.setPosition(offset_);
    target.draw(arena_);

    vertices_.clear();
    for (const auto &bot : bots_)
    {
        appendShape(body_, bot.position, bot.heading);
        appendShape(gun_, bot.position, bot.gunHeading);
        appendShape(radar_, bot.position, bot.radarHeading);
    }

    target.draw(vertices_);
}

void BotRenderer::appendShape(const Shape &shape, const Vec2 &position, double heading)
{
    const double c = std::cos(heading);
    const double s = std::sin(heading);

    for (const auto &local : shape.triangles)
    {
        const double x = local.x * BOT_SCALE;
        const double y = local.y * BOT_SCALE;

        // rotate anticlockwise in world space, then move to the bot
        Vec2 world(position.x + x * c - y * s, position.y + x * s + y * c);

        sf::Vertex vertex;
        vertex.position = worldToScreen(world);
        vertex.color = shape.color;
        vertices_.append(vertex);
    }
}

sf::Vector2f BotRenderer::worldToScreen(const Vec2 &point) const
{
    // flip y: screen y grows downwards
    return sf::Vector2f(offset_.x + static_cast<float>(point.x * scale_),
                        screenHeight_ - offset_.y - static_cast<float>(point.y * scale_));
}
