#include "config_loader.hpp"
#include "grid_session.hpp"
#include "simulation_engine.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested(false);

/**
 * @brief Signal handler for graceful shutdown (e.g., on Ctrl+C).
 * @param signum The signal number received.
 */
void signal_handler(int signum) {
    (void)signum;
    g_shutdown_requested = true;
}

void print_status(const GridSession& session) {
    for (const auto& row : session.statusReport()) {
        std::cout << "  " << std::left << std::setw(20) << row.bus << " " << row.label
                  << " (" << row.grid_x << "," << row.grid_y << ") "
                  << std::setw(8) << toString(row.status) << std::fixed << std::setprecision(3)
                  << " V=" << (row.voltage_pu ? std::to_string(*row.voltage_pu) : std::string("-"))
                  << " P=" << row.active_power << " Q=" << row.reactive_power << std::endl;
    }
}

// A small demonstration grid: one station, one consumer of each kind.
bool build_demo_grid(GridSession& session) {
    EntityId station = kInvalidEntityId;
    if (!session.placeSource(0, 0, station).success) {
        return false;
    }

    const EntityKind kinds[] = {EntityKind::InductiveLoad, EntityKind::CapacitiveLoad, EntityKind::ResistiveLoad};
    int x = 2;
    for (EntityKind kind : kinds) {
        EntityId load = kInvalidEntityId;
        if (!session.placeLoad(kind, x, 1, load).success) {
            return false;
        }
        if (!session.connect(load, station).success) {
            return false;
        }
        x += 2;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string config_file = "grid_profile.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }
    std::cout << "Loading configuration from: " << config_file << std::endl;

    Config config;
    try {
        config = ConfigLoader::loadConfig(config_file);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Configuration loaded successfully." << std::endl;

    // --- 2. Open the grid session ---
    std::shared_ptr<GridSession> session;
    try {
        session = std::make_shared<GridSession>(config);
    } catch (const PersistenceError& e) {
        std::cerr << "Error opening database '" << config.persistence.database_path << "': " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Parameter store ready at " << config.persistence.database_path << "." << std::endl;

    if (!build_demo_grid(*session)) {
        std::cerr << "Failed to build the demonstration grid." << std::endl;
        return 1;
    }

    // --- 3. Start the simulation engine ---
    SimulationEngine engine(session, config.sim_params);
    engine.start();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "\nGrid simulator is running. Press Ctrl+C to exit." << std::endl;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config.sim_params.update_interval_ms));
        std::cout << "Tick " << engine.tickCount() << ":" << std::endl;
        print_status(*session);
    }

    std::cout << "\nShutting down gracefully..." << std::endl;
    engine.stop();
    return 0;
}
