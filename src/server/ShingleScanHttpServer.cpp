#include "ShingleScanHttpServer.hpp"

#include <iostream>
#include <stdexcept>
#include "shinglescan/Errors.hpp"
#include "shinglescan/ReportFormatter.hpp"

using json = nlohmann::json;
using shinglescan::ReportFormatter;

ShingleScanHttpServer::ShingleScanHttpServer(std::string host, int port, shinglescan::Config config)
    : host_(std::move(host)), port_(port), config_(std::move(config)), startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void ShingleScanHttpServer::run() {
    std::cout << "ShingleScan HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

void ShingleScanHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count();
        res.set_content(ReportFormatter::dump(ok(json{{"uptime_seconds", uptime}})), "application/json");
        addCors(res);
    });

    // --- CONFIG ---
    server_.Get("/v1/config", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        res.set_content(ReportFormatter::dump(ok(config_.toJson())), "application/json");
        addCors(res);
    });

    // --- COMPARE ---
    // Body: {"documents":[{"id":"a","text":"..."}], "n":4, "threshold":0.1, "max_results":10}
    server_.Post("/v1/compare", [this, ok, err, isJsonContent, addCors](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(ReportFormatter::dump(err(415, "Content-Type must be application/json")), "application/json");
            addCors(res);
            return;
        }

        json body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            res.status = 400;
            res.set_content(ReportFormatter::dump(err(400, "Invalid JSON body")), "application/json");
            addCors(res);
            return;
        }
        if (!body.contains("documents") || !body["documents"].is_array()) {
            res.status = 400;
            res.set_content(ReportFormatter::dump(err(400, "Missing 'documents' array")), "application/json");
            addCors(res);
            return;
        }

        shinglescan::Config cfg = config_;
        std::vector<shinglescan::TextSource> sources;
        try {
            cfg.params = shinglescan::Parameters::fromJson(body, cfg.params);

            for (const auto& d : body["documents"]) {
                auto id = d.at("id").get<std::string>();
                auto text = d.at("text").get<std::string>();
                sources.push_back({id, [text]() { return text; }});
            }
        } catch (const shinglescan::InvalidParameterError& e) {
            res.status = 400;
            res.set_content(ReportFormatter::dump(err(400, e.what())), "application/json");
            addCors(res);
            return;
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(ReportFormatter::dump(err(400, std::string("Malformed request: ") + e.what())), "application/json");
            addCors(res);
            return;
        }

        try {
            shinglescan::ShingleScan engine(cfg);
            auto report = engine.scan(sources);
            res.set_content(ReportFormatter::dump(ok(ReportFormatter::toJson(report))), "application/json");
        } catch (const shinglescan::InvalidParameterError& e) {
            res.status = 400;
            res.set_content(ReportFormatter::dump(err(400, e.what())), "application/json");
        } catch (const std::exception& e) {
            res.status = 500;
            res.set_content(ReportFormatter::dump(err(500, std::string("compare failed: ") + e.what())), "application/json");
        }
        addCors(res);
    });
}
