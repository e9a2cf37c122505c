#include "ServerHelpers.hpp"
#include <cstdlib>
#include <fstream>
#include <string>

huffpack::Result<ServerConfig> loadServerConfig(const std::string &configPath)
{
    ServerConfig config;
    if (configPath.empty())
    {
        return huffpack::makeResult<ServerConfig>(config);
    }

    std::ifstream ifs(configPath);
    if (!ifs.good())
    {
        return huffpack::makeError<ServerConfig>("failed to read: " + configPath, huffpack::ErrorKind::IO_ERROR);
    }

    json configuration;
    try {
        configuration = json::parse(ifs);
        config.host = configuration.value("host", config.host);
        config.port = configuration.value("port", config.port);
        config.verbose = configuration.value("verbose", config.verbose);
    }
    catch (const json::exception &e) {
        std::string errorMessage = "Error parsing configuration " + configPath + ": " + std::string(e.what());
        return huffpack::makeError<ServerConfig>(errorMessage, huffpack::ErrorKind::INVALID_FORMAT);
    }

    if (config.port <= 0 || config.port > 65535)
    {
        return huffpack::makeError<ServerConfig>(
            "Invalid port " + std::to_string(config.port), huffpack::ErrorKind::INVALID_FORMAT
        );
    }
    return huffpack::makeResult<ServerConfig>(config);
}

void parseRequestParams(
    const httplib::Params &params,
    std::string &inputPath,
    std::string &outputPath,
    bool &verbose
) {
    inputPath = params.find("path") != params.end() ? params.find("path")->second : "";
    outputPath = params.find("output") != params.end() ? params.find("output")->second : "";

    if (params.find("verbose") != params.end())
    {
        auto const &str = params.find("verbose")->second;
        verbose = (str.empty() || str == "True" || str == "true" || atoi(str.c_str()) > 0);
    }
}

json reportToJson(const huffpack::compressor::CompressionReport &report)
{
    return json{
        {"inputPath", report.inputPath},
        {"outputPath", report.outputPath},
        {"originalSize", report.statistics.originalSize},
        {"compressedSize", report.statistics.compressedSize},
        {"compressionRatio", report.statistics.compressionRatio},
        {"spaceSaved", report.statistics.spaceSaved}
    };
}

json reportToJson(const huffpack::compressor::DecompressionReport &report)
{
    return json{
        {"inputPath", report.inputPath},
        {"outputPath", report.outputPath},
        {"extension", report.extension},
        {"originalSize", report.originalSize},
        {"decompressedSize", report.decompressedSize}
    };
}
