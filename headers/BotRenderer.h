#pragma once
#include <SFML/Graphics.hpp>
#include "BotSettings.h"
#include "BotState.h"
#include "SnapshotBoard.h"
#include <memory>
#include <vector>

/**
 * draws every bot from the world's published snapshots
 * body, gun and radar are batched into one triangle array each frame.
 * world coordinates have their origin in the lower left with y pointing up
 */
class BotRenderer
{
public:
    BotRenderer(std::shared_ptr<SnapshotBoard<BotState>> bots, const BotSettings &settings);

    // pulls the latest batch from the board
    void update();
    void draw(sf::RenderTarget &target);

    size_t getBotCount() const { return bots_.size(); }

private:
    struct Shape
    {
        std::vector<sf::Vector2f> triangles; // local coordinates, x along the heading
        sf::Color color;
    };

    void appendShape(const Shape &shape, const Vec2 &position, double heading);
    sf::Vector2f worldToScreen(const Vec2 &point) const;

    std::shared_ptr<SnapshotBoard<BotState>> board_;
    std::vector<BotState> bots_;
    sf::Vector2<double> worldSize_;

    Shape body_;
    Shape gun_;
    Shape radar_;

    sf::VertexArray vertices_;
    sf::RectangleShape arena_;

    // set per frame from the target size
    double scale_ = 1.0;
    sf::Vector2f offset_;
    float screenHeight_ = 0.0f;
};
