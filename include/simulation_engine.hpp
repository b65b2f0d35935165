#ifndef SIMULATION_ENGINE_H
#define SIMULATION_ENGINE_H

#include "grid_session.hpp"
#include "grid_types.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

/**
 * @class SimulationEngine
 * @brief Drives GridSession::tick() at a fixed cadence on a background thread.
 *
 * Callers that own their own loop can call tick() directly instead of start().
 */
class SimulationEngine {
public:
    /**
     * @param session The grid to step.
     * @param params Supplies update_interval_ms.
     */
    SimulationEngine(std::shared_ptr<GridSession> session, const SimulationParams& params);
    ~SimulationEngine();

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running; }

    /// @brief Performs one recompute immediately, on the calling thread.
    void tick();

    /// @brief Number of ticks performed so far, by either thread.
    std::uint64_t tickCount() const { return ticks; }

private:
    void run();

    std::shared_ptr<GridSession> session;
    int update_interval_ms;
    std::thread simulation_thread;
    std::atomic<bool> running;
    std::atomic<std::uint64_t> ticks;
};

#endif // SIMULATION_ENGINE_H
