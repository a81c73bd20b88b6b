#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "ShingleScan.hpp"
#include <nlohmann/json.hpp>

class ShingleScanHttpServer {
public:
    ShingleScanHttpServer(std::string host, int port, shinglescan::Config config);
    void run();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    shinglescan::Config config_;
    std::chrono::steady_clock::time_point startTime_;
};
