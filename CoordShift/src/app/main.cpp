#include "../geo/ChinaBounds.hpp"
#include "../geo/CoordFormat.hpp"
#include "../geo/Datum.hpp"
#include "../geo/Normalizer.hpp"
#include "../tile/TileConverter.hpp"
#include "../tile/TileSource.hpp"
#include <iostream>
#include <optional>
#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace coordshift;
using json = nlohmann::json;

// 命令行选项结构
struct CommandLineOptions {
    // 坐标转换
    std::string lat;
    std::string lon;
    geo::Datum from{geo::Datum::Wgs84};
    geo::Datum to{geo::Datum::Gcj02};
    geo::Precision precision{geo::Precision::Fast};
    bool checkChina{true};
    int decimals{geo::kDefaultPrecision};
    std::optional<int> zoom;

    // 瓦片换算
    std::optional<tile::TileAddress> tile;
    std::optional<tile::Provider> provider;  // 未指定时取 MAP_TILE_SOURCE

    bool verbose{false};
    bool quiet{false};
    std::string logFile;
};

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("coordshift", "Convert coordinates and map tiles between WGS-84, GCJ-02 and BD-09");

        options.add_options()
            ("lat", "Latitude (decimal degrees)", cxxopts::value<std::string>())
            ("lon", "Longitude (decimal degrees)", cxxopts::value<std::string>())
            ("from", "Source datum (wgs84,gcj02,bd09)", cxxopts::value<std::string>()->default_value("wgs84"))
            ("to", "Target datum (wgs84,gcj02,bd09)", cxxopts::value<std::string>()->default_value("gcj02"))
            ("precise", "Use iterative inverse transforms", cxxopts::value<bool>()->default_value("false"))
            ("no-china-check", "Shift coordinates outside China as well", cxxopts::value<bool>()->default_value("false"))
            ("precision", "Decimal places in output", cxxopts::value<int>()->default_value("6"))
            ("zoom", "Also report the tile containing the result at this zoom", cxxopts::value<int>())
            ("tile", "Standard tile address z/x/y to resolve for a provider", cxxopts::value<std::string>())
            ("provider", "Tile provider (OpenStreetMap,Amap,Baidu,Google,Tencent)", cxxopts::value<std::string>())
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("tile")) {
            const auto text = result["tile"].as<std::string>();
            auto tileResult = tile::parseTileAddress(text);
            if (!tileResult) {
                return std::unexpected(tileResult.error() == tile::TileParseError::InvalidZoom
                                           ? "Tile zoom out of range: " + text
                                           : "Invalid tile address (expected z/x/y): " + text);
            }
            opts.tile = *tileResult;

            if (result.count("provider")) {
                const auto name = result["provider"].as<std::string>();
                auto providerResult = tile::parseProvider(name);
                if (!providerResult) {
                    return std::unexpected("Unknown provider: " + name);
                }
                opts.provider = *providerResult;
            }
        } else {
            if (!result.count("lat") || !result.count("lon")) {
                return std::unexpected("Either --tile or both --lat and --lon are required");
            }
            opts.lat = result["lat"].as<std::string>();
            opts.lon = result["lon"].as<std::string>();

            const auto fromName = result["from"].as<std::string>();
            auto from = geo::parseDatum(fromName);
            if (!from) {
                return std::unexpected("Unknown datum: " + fromName);
            }
            opts.from = *from;

            const auto toName = result["to"].as<std::string>();
            auto to = geo::parseDatum(toName);
            if (!to) {
                return std::unexpected("Unknown datum: " + toName);
            }
            opts.to = *to;

            opts.precision = result["precise"].as<bool>() ? geo::Precision::Precise : geo::Precision::Fast;
            opts.checkChina = !result["no-china-check"].as<bool>();

            opts.decimals = result["precision"].as<int>();
            if (opts.decimals < 0 || opts.decimals > 15) {
                return std::unexpected("Precision must be between 0 and 15");
            }

            if (result.count("zoom")) {
                opts.zoom = result["zoom"].as<int>();
                if (*opts.zoom < 0 || *opts.zoom > 30) {
                    return std::unexpected("Zoom must be between 0 and 30");
                }
            }
        }

        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();

        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 设置日志系统，控制台日志写到 stderr，stdout 只留给 JSON 结果
void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("coordshift", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

json toJson(const tile::TileAddress& tile) {
    return json{{"z", tile.zoom}, {"x", tile.x}, {"y", tile.y}};
}

json toJson(const geo::GeoBBox& bbox) {
    return json{
        {"minLon", bbox.minLon}, {"minLat", bbox.minLat},
        {"maxLon", bbox.maxLon}, {"maxLat", bbox.maxLat}
    };
}

json toJson(const geo::LatLon& coord, int decimals) {
    return json{{"lat", geo::roundTo(coord.lat, decimals)}, {"lon", geo::roundTo(coord.lon, decimals)}};
}

// 目标坐标系下包含该点的瓦片，百度使用自己的瓦片网格
tile::TileAddress tileForDatum(geo::Datum datum, int zoom, const geo::LatLon& coord) {
    if (datum == geo::Datum::Bd09) {
        return tile::baiduCoordToTile(zoom, geo::BdCoord{coord.lat, coord.lon});
    }
    return tile::coordToTile(zoom, coord.lat, coord.lon);
}

// 坐标转换
std::expected<json, std::string> runConvert(const CommandLineOptions& opts) {
    const auto input = geo::normalizeValues(geo::RawValue{std::in_place_type<std::string>, opts.lat},
                                           geo::RawValue{std::in_place_type<std::string>, opts.lon});
    if (!input) {
        return std::unexpected("Invalid coordinate: lat=" + opts.lat + " lon=" + opts.lon);
    }

    spdlog::debug("Converting {} from {} to {} ({})", geo::toString(input->lat, input->lon),
                  geo::datumName(opts.from), geo::datumName(opts.to),
                  opts.precision == geo::Precision::Precise ? "precise" : "fast");

    const bool inChina = geo::kChinaBounds.contains(input->lon, input->lat);
    const bool touchesWgs = opts.from == geo::Datum::Wgs84 || opts.to == geo::Datum::Wgs84;
    if (!inChina && opts.checkChina && touchesWgs && opts.from != opts.to) {
        spdlog::info("Coordinate is outside China, GCJ-02 offset not applied");
    }

    const auto output = geo::convertCoordinate(opts.from, opts.to, *input, opts.precision, opts.checkChina);

    json doc{
        {"from", geo::datumName(opts.from)},
        {"to", geo::datumName(opts.to)},
        {"precise", opts.precision == geo::Precision::Precise},
        {"inChina", inChina},
        {"input", toJson(*input, opts.decimals)},
        {"output", toJson(output, opts.decimals)},
        {"text", geo::toString(output.lat, output.lon, opts.decimals)},
        {"hash", geo::hashLatLon(output.lat, output.lon)},
        {"shiftMeters", geo::distanceMeters(input->lat, input->lon, output.lat, output.lon)}
    };

    if (opts.zoom) {
        doc["tile"] = toJson(tileForDatum(opts.to, *opts.zoom, output));
    }

    return doc;
}

// 瓦片换算：标准瓦片 -> 提供商瓦片与 URL
json runTile(const CommandLineOptions& opts) {
    const auto& wgsTile = *opts.tile;
    const auto provider = opts.provider ? *opts.provider
                                        : tile::TileSourceConfig::fromEnvironment().defaultProvider;
    const auto& info = tile::tileSourceInfo(provider);

    const auto nativeTile = tile::resolveProviderTile(provider, wgsTile);
    spdlog::debug("Tile {} -> {} tile {}", tile::toString(wgsTile), info.name, tile::toString(nativeTile));

    if (!wgsTile.inPyramid()) {
        spdlog::warn("Tile {} is outside the standard tile pyramid", tile::toString(wgsTile));
    }

    return json{
        {"tile", toJson(wgsTile)},
        {"tmsY", tile::tmsConvertY(wgsTile.zoom, wgsTile.y)},
        {"bbox", toJson(tile::tileToBbox(wgsTile.zoom, wgsTile.x, wgsTile.y))},
        {"provider", info.name},
        {"datum", geo::datumName(info.datum)},
        {"providerTile", toJson(nativeTile)},
        {"url", tile::buildTileUrl(provider, nativeTile)}
    };
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        setupLogging(opts);

        json doc;
        if (opts.tile) {
            doc = runTile(opts);
        } else {
            auto result = runConvert(opts);
            if (!result) {
                spdlog::error("{}", result.error());
                return 1;
            }
            doc = std::move(*result);
        }

        std::cout << doc.dump(2) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
