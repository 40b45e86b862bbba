#include "demo_bundle.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

// Usage: fraudfusion_demo_bundle <dir> [seed]
// Also writes sample_fraud.json and sample_normal.json beside the manifest.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <bundle-dir> [seed]" << std::endl;
        return 2;
    }
    
    try {
        std::string dir = argv[1];
        uint32_t seed = argc > 2 ? static_cast<uint32_t>(std::stoul(argv[2])) : 20240611u;
        
        DemoBundle demo = build_demo_bundle(seed);
        write_demo_bundle(demo, dir);
        
        std::ofstream(dir + "/sample_fraud.json") << demo_transaction(demo, true, seed + 1).dump(2);
        std::ofstream(dir + "/sample_normal.json") << demo_transaction(demo, false, seed + 2).dump(2);
        
        spdlog::info("Sample transactions written; run with BUNDLE_DIR={}", dir);
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to write demo bundle: {}", e.what());
        return 1;
    }
}
