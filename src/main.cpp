#include "TrackerConfig.hpp"
#include "Utilities.hpp"
#include "PoolTagSource.hpp"
#include "SamplingLoop.hpp"
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

namespace {

std::atomic<bool> g_should_stop{false};

void onStopSignal(int /*signum*/) {
    g_should_stop.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    ptt::TrackerConfig config;
    
    // Parse command line arguments
    if (!config.parseArgs(argc, argv)) {
        ptt::TrackerConfig().printUsage(argv[0]);
        return 1;
    }
    
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    
    ptt::Timer total_timer;
    auto source = ptt::createSystemPoolTagSource();
    ptt::SamplingLoop loop(config, *source, std::cout, g_should_stop);
    
    try {
        loop.run();
    } catch (const std::exception& e) {
        // Report, but keep the always-zero exit status
        std::cerr << "Monitoring stopped: " << e.what() << std::endl;
        return 0;
    }
    
    std::cout << "\nMonitoring finished after " << total_timer.elapsedMillis() / 1000 << "s"
              << (loop.interrupted() ? " (interrupted)" : "") << "\n";
    
    return 0;
}
