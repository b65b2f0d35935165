#include "simulation_engine.hpp"
#include <chrono>
#include <iostream>
#include <utility>

SimulationEngine::SimulationEngine(std::shared_ptr<GridSession> grid_session, const SimulationParams& params)
    : session(std::move(grid_session)), update_interval_ms(params.update_interval_ms), running(false), ticks(0) {}

SimulationEngine::~SimulationEngine() {
    stop();
}

void SimulationEngine::start() {
    if (running) return;
    running = true;
    simulation_thread = std::thread(&SimulationEngine::run, this);
}

void SimulationEngine::stop() {
    running = false;
    if (simulation_thread.joinable()) {
        simulation_thread.join();
    }
}

void SimulationEngine::tick() {
    session->tick();
    ++ticks;
}

void SimulationEngine::run() {
    std::cout << "Simulation thread started (interval " << update_interval_ms << " ms)." << std::endl;
    while (running) {
        auto start_time = std::chrono::steady_clock::now();

        tick();

        auto end_time = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        auto sleep_duration = std::chrono::milliseconds(update_interval_ms) - elapsed;

        if (sleep_duration.count() > 0) {
            std::this_thread::sleep_for(sleep_duration);
        }
    }
    std::cout << "Simulation thread stopped." << std::endl;
}
