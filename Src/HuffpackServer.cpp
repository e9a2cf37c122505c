#include "HuffpackCompressor/HuffpackCompressor.hpp"
#include "ServerHelpers.hpp"
#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char **argv)
{
    huffpack::Result<ServerConfig> configResult = loadServerConfig(argc > 1 ? argv[1] : "");
    if (!configResult.success())
    {
        std::cerr << "Error: " << configResult.getError() << std::endl;
        return 1;
    }
    const ServerConfig config = configResult.getValue();

    httplib::Server svr;
    svr.Get("/compress", [&](const httplib::Request &req, httplib::Response &res)
    {
        std::string inputPath;
        std::string outputPath;
        bool verbose = config.verbose;
        parseRequestParams(
            req.params,
            inputPath,
            outputPath,
            verbose
        );

        const std::chrono::high_resolution_clock::time_point start = std::chrono::high_resolution_clock::now();
        huffpack::Result<huffpack::compressor::CompressionReport> compressResult = huffpack::compressor::compressFile(
            inputPath,
            outputPath,
            verbose
        );
        const std::chrono::high_resolution_clock::time_point end = std::chrono::high_resolution_clock::now();

        handleResponse(
            res,
            compressResult,
            start,
            end
        );
    });

    svr.Get("/decompress", [&](const httplib::Request &req, httplib::Response &res)
    {
        std::string inputPath;
        std::string outputPath;
        bool verbose = config.verbose;
        parseRequestParams(
            req.params,
            inputPath,
            outputPath,
            verbose
        );

        const std::chrono::high_resolution_clock::time_point start = std::chrono::high_resolution_clock::now();
        huffpack::Result<huffpack::compressor::DecompressionReport> decompressResult = huffpack::compressor::decompressFile(
            inputPath,
            outputPath,
            verbose
        );
        const std::chrono::high_resolution_clock::time_point end = std::chrono::high_resolution_clock::now();

        handleResponse(
            res,
            decompressResult,
            start,
            end
        );
    });

    svr.Get("/stop", [&](const httplib::Request & /*req*/, httplib::Response & /*res*/)
    {
        svr.stop();
    });

    std::cout << "Server running on " << config.host << ":" << config.port << "..." << std::endl;

    if (!svr.listen(config.host, config.port))
    {
        std::cerr << "Error: failed to listen on " << config.host << ":" << config.port << std::endl;
        return 1;
    }
    return 0;
}
