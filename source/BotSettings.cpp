#include "BotSettings.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace
{
    void writeRange(std::ofstream &file, const char *key, const ValueRange &range)
    {
        file << key << "=" << range.min << "," << range.max << "\n";
    }

    ValueRange parseRange(const std::string &value)
    {
        size_t commaPos = value.find(',');
        if (commaPos == std::string::npos)
            throw std::invalid_argument("expected min,max");

        return ValueRange(std::stod(value.substr(0, commaPos)), std::stod(value.substr(commaPos + 1)));
    }

    void fixRange(ValueRange &range)
    {
        if (range.min > range.max)
            std::swap(range.min, range.max);
    }
}

bool BotSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file.precision(17);
    file << "# Battlebots Settings\n";
    file << "worldWidth=" << worldSize.x << "\n";
    file << "worldHeight=" << worldSize.y << "\n";
    file << "ticksPerSecond=" << ticksPerSecond << "\n";
    file << "ticksPerStep=" << ticksPerStep << "\n";
    file << "numBots=" << numBots << "\n";
    file << "driveFriction=" << driveFriction << "\n";
    file << "maxHitPoints=" << maxHitPoints << "\n";
    file << "maxShootPower=" << maxShootPower << "\n";
    file << "shootPowerRegen=" << shootPowerRegen << "\n";
    writeRange(file, "thrustLimits", thrustLimits);
    writeRange(file, "turnRateLimits", turnRateLimits);
    writeRange(file, "gunTurnRateLimits", gunTurnRateLimits);
    writeRange(file, "radarTurnRateLimits", radarTurnRateLimits);
    writeRange(file, "bulletPowerLimits", bulletPowerLimits);
    file << "botProgram=" << botProgram << "\n";

    return true;
}

bool BotSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            if (key == "worldWidth")
                worldSize.x = std::stod(value);
            else if (key == "worldHeight")
                worldSize.y = std::stod(value);
            else if (key == "ticksPerSecond")
                ticksPerSecond = std::stoi(value);
            else if (key == "ticksPerStep")
                ticksPerStep = std::stoi(value);
            else if (key == "numBots")
                numBots = std::stoi(value);
            else if (key == "driveFriction")
                driveFriction = std::stod(value);
            else if (key == "maxHitPoints")
                maxHitPoints = std::stod(value);
            else if (key == "maxShootPower")
                maxShootPower = std::stod(value);
            else if (key == "shootPowerRegen")
                shootPowerRegen = std::stod(value);
            else if (key == "thrustLimits")
                thrustLimits = parseRange(value);
            else if (key == "turnRateLimits")
                turnRateLimits = parseRange(value);
            else if (key == "gunTurnRateLimits")
                gunTurnRateLimits = parseRange(value);
            else if (key == "radarTurnRateLimits")
                radarTurnRateLimits = parseRange(value);
            else if (key == "bulletPowerLimits")
                bulletPowerLimits = parseRange(value);
            else if (key == "botProgram")
                botProgram = value;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: Bad value for " << key << " on line " << lineNumber
                      << " of " << filename << ": " << e.what() << std::endl;
            return false;
        }
    }

    validateAndClamp();
    return true;
}

void BotSettings::validateAndClamp()
{
    worldSize.x = std::max(1.0, worldSize.x);
    worldSize.y = std::max(1.0, worldSize.y);
    ticksPerSecond = std::clamp(ticksPerSecond, 1, 1000);
    ticksPerStep = std::max(1, ticksPerStep);
    numBots = std::clamp(numBots, 0, 100000);
    driveFriction = std::clamp(driveFriction, 0.0, 1.0);
    maxHitPoints = std::max(0.0, maxHitPoints);
    maxShootPower = std::max(0.0, maxShootPower);
    shootPowerRegen = std::max(0.0, shootPowerRegen);

    fixRange(thrustLimits);
    fixRange(turnRateLimits);
    fixRange(gunTurnRateLimits);
    fixRange(radarTurnRateLimits);
    fixRange(bulletPowerLimits);
}

bool BotSettings::operator==(const BotSettings &other) const
{
    return worldSize == other.worldSize &&
           ticksPerSecond == other.ticksPerSecond &&
           ticksPerStep == other.ticksPerStep &&
           numBots == other.numBots &&
           driveFriction == other.driveFriction &&
           maxHitPoints == other.maxHitPoints &&
           maxShootPower == other.maxShootPower &&
           shootPowerRegen == other.shootPowerRegen &&
           thrustLimits == other.thrustLimits &&
           turnRateLimits == other.turnRateLimits &&
           gunTurnRateLimits == other.gunTurnRateLimits &&
           radarTurnRateLimits == other.radarTurnRateLimits &&
           bulletPowerLimits == other.bulletPowerLimits &&
           botProgram == other.botProgram;
}
