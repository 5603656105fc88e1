#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "BotBrain.h"
#include "BotRenderer.h"
#include "BotSettings.h"
#include "ChildProcess.h"
#include "Coordinator.h"
#include "MailboxRelay.h"
#include "RelayBot.h"
#include "SpinBrain.h"
#include "Supervisor.h"
#include "World.h"

// window constants
const int WINDOW_WIDTH = 900;
const int WINDOW_HEIGHT = 900;

ThreadResult runDrawLoop(std::shared_ptr<SnapshotBoard<BotState>> botsData, const BotSettings &settings)
{
    sf::RenderWindow window(sf::VideoMode({WINDOW_WIDTH, WINDOW_HEIGHT}), "Battlebots");
    window.setFramerateLimit(60);

    BotRenderer renderer(botsData, settings);

    while (window.isOpen())
    {
        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }
            else if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
            {
                if (keyPressed->code == sf::Keyboard::Key::Escape)
                    window.close();
            }
        }

        renderer.update();

        window.clear(sf::Color::Black);
        renderer.draw(window);
        window.display();
    }

    return std::nullopt;
}

int main(int argc, char *argv[])
{
    // a bot process dying mid write must show up as a write error, not kill the simulator
    std::signal(SIGPIPE, SIG_IGN);

    BotSettings settings;
    if (argc > 1 && !settings.loadFromFile(argv[1]))
        return 1;

    std::string program = settings.botProgram;
    if (program.empty())
    {
        if (const char *env = std::getenv("BOTPRG"))
            program = env;
    }

    static std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_real_distribution<double> xDist(0.0, settings.worldSize.x);
    std::uniform_real_distribution<double> yDist(0.0, settings.worldSize.y);

    // every process has to be forked before any relay thread exists
    std::vector<std::unique_ptr<ChildProcess>> children;
    if (!program.empty())
    {
        std::cout << "Starting robot processes..." << std::endl;
        for (int id = 0; id < settings.numBots; ++id)
        {
            auto child = ChildProcess::spawn(program);
            if (!child)
                return 1;
            children.push_back(std::move(child));
        }
    }
    else
    {
        std::cout << "No bot program configured (botProgram or BOTPRG), using the built in brain" << std::endl;
    }

    std::vector<RelayBot> bots;
    bots.reserve(settings.numBots);
    for (int id = 0; id < settings.numBots; ++id)
    {
        std::unique_ptr<RelayEndpoint> endpoint;
        if (children.empty())
            endpoint = std::make_unique<BrainEndpoint>(std::make_unique<SpinBrain>(gen()));
        else
            endpoint = std::make_unique<StreamEndpoint>(children[id]->takeStdin(), children[id]->takeStdout());

        Vec2 position(xDist(gen), yDist(gen));
        bots.emplace_back(static_cast<uint64_t>(id), position, settings, std::move(endpoint));
    }

    std::cout << "Starting the simulation..." << std::endl;

    auto world = std::make_shared<World<RelayBot>>(settings, std::move(bots));
    auto tickLock = world->getTickLock();
    StopSignal stopWorld = world->getStopSignal();
    auto botsData = world->getSnapshots();

    // the coordinator for the individual robots
    Coordinator<World<RelayBot>::Runner::Status> robotCoordinator;
    for (const auto &agent : world->getAgents())
    {
        robotCoordinator.spawn([agent, tickLock]
                               { return agent->run(*tickLock); });
    }

    // the coordinator for drawing, world running, and robots
    Coordinator<ThreadResult> mainCoordinator;

    mainCoordinator.spawn([world]() -> ThreadResult
                          {
        if (auto error = world->run())
            return "World returned error: " + error->describe();
        return std::nullopt; });

    mainCoordinator.spawn([botsData, settings]
                          { return runDrawLoop(botsData, settings); });

    // keeps going until every robot has stopped, the first failure ends it
    mainCoordinator.spawn([robots = std::move(robotCoordinator)]() mutable
                          { return superviseRobots(robots); });

    // without errors the drawing thread always finishes first, when the window is closed
    if (auto failure = superviseShutdown(mainCoordinator, stopWorld))
    {
        std::cerr << "Error: " << *failure << std::endl;
        return 1;
    }

    std::cout << "Simulation ran for " << world->getTicksDone() << " ticks" << std::endl;
    std::cout << "Goodbye!" << std::endl;
    return 0;
}
