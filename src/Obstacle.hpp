#pragma once

// One piece of traffic. Positioned by its centre; y grows toward the player.
struct Obstacle {
    double laneX         = 0.0;
    double y             = 0.0;
    double width         = 0.0;
    double height        = 0.0;
    double verticalSpeed = 0.0;   // units/s, on top of the player's speed
    double hue           = 0.0;   // degrees; drawn as hsl(hue, 80%, 60%)
};
