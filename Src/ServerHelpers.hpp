#pragma once
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include "Helpers/Result.hpp"
#include "HuffpackCompressor/HuffpackCompressor.hpp"

using json = nlohmann::json;

struct ServerConfig
{
    std::string host = "0.0.0.0";
    int port = 8000;
    bool verbose = false;
};

huffpack::Result<ServerConfig> loadServerConfig(const std::string &configPath);

void parseRequestParams(
    const httplib::Params &params,
    std::string &inputPath,
    std::string &outputPath,
    bool &verbose
);

json reportToJson(const huffpack::compressor::CompressionReport &report);
json reportToJson(const huffpack::compressor::DecompressionReport &report);

template<typename T>
void handleResponse(
    httplib::Response &res,
    huffpack::Result<T> &result,
    const std::chrono::high_resolution_clock::time_point &start,
    const std::chrono::high_resolution_clock::time_point &end
) {
    json body;
    if (!result.success())
    {
        std::string errorMessage = "Error: " + result.getError();
        std::cerr << errorMessage << std::endl;
        body["error"] = result.getError();
        body["kind"] = huffpack::errorKindToString(result.getErrorKind());
        res.status = httplib::BadRequest_400;
        res.set_content(body.dump(), "application/json");
        return;
    }

    auto timeDiff = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    body = reportToJson(result.value.value());
    body["seconds"] = timeDiff * 0.000000001;
    if (!result.warnings.empty())
    {
        body["warnings"] = result.warnings;
    }

    std::cout << "Success in " << std::to_string(timeDiff * 0.000000001) << " s." << std::endl;
    res.set_content(body.dump(), "application/json");
};
