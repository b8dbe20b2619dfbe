#include <string>
#include <iostream>
#include <vector>
#include <optional>
#include <exception>
#include <stdexcept>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <date/tz.h>
#include "ConfigurationManager.hpp"
#include "AmtrakClient.hpp"
#include "BitmapFont.hpp"
#include "PngEncoder.hpp"
#include "SegmentExtractor.hpp"
#include "TimelineDocument.hpp"
#include "TimelineRenderer.hpp"
#include "TimelineServer.hpp"
#include "TrainFinder.hpp"
#include "TripListing.hpp"
#include "VirtualClock.hpp"

struct CommandLine
{
    std::string mode;
    std::vector<std::string> positional;
    int bufferBefore = 0;
    int bufferAfter = 0;
    std::optional<std::string> now;
};

void printUsage()
{
    std::cout << "Usage: train_timeline fetch <station1> <station2> [station3] ...\n"
              << "       train_timeline render <trains.json> [output.png] [--buffer-before N] [--buffer-after N] [--now ISO]\n"
              << "       train_timeline serve\n"
              << "Example: train_timeline fetch NYP NWK PHL\n";
}

int parseMinutesArg(std::string const& flag, std::string const& value)
{
    try
    {
        int minutes = std::stoi(value);
        if (minutes < 0)
            throw std::invalid_argument("negative");
        return minutes;
    }
    catch (std::exception const&)
    {
        throw std::runtime_error(flag + " expects a non-negative number of minutes");
    }
}

CommandLine parseCommandLineArgs(int argc, char* argv[])
{
    CommandLine cmd;
    if (argc > 1)
        cmd.mode = argv[1];

    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--buffer-before" && i + 1 < argc)
        {
            cmd.bufferBefore = parseMinutesArg(arg, argv[++i]);
        }
        else if (arg == "--buffer-after" && i + 1 < argc)
        {
            cmd.bufferAfter = parseMinutesArg(arg, argv[++i]);
        }
        else if (arg == "--now" && i + 1 < argc)
        {
            cmd.now = argv[++i];
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
        else
        {
            cmd.positional.push_back(arg);
        }
    }

    return cmd;
}

int runFetch(CommandLine const& cmd)
{
    std::vector<std::string> stations;
    for (const auto& code : cmd.positional)
        stations.push_back(SegmentExtractor::normalizeCode(code));

    std::string route;
    for (const auto& code : stations)
        route += (route.empty() ? "" : " -> ") + code;
    std::cout << "Searching for trains: " << route << "..." << std::endl;

    boost::asio::io_context io;
    AmtrakClient client(io);

    std::vector<Train> trains;
    std::exception_ptr failure;
    boost::asio::co_spawn(io, TrainFinder::find(client, stations),
        [&](std::exception_ptr e, std::vector<Train> found)
        {
            failure = e;
            trains = std::move(found);
        });
    io.run();

    if (failure)
        std::rethrow_exception(failure);

    std::cout << TripListing::format(trains, stations);

    TimelineDocument doc{stations, trains};
    std::string filename = "trains_";
    for (std::size_t i = 0; i < stations.size(); ++i)
        filename += (i ? "_" : "") + stations[i];
    filename += ".json";

    doc.save(filename);
    std::cout << "Saved results to " << filename << std::endl;
    return 0;
}

int runRender(CommandLine const& cmd, ConfigurationManager const& config)
{
    std::string input = cmd.positional[0];
    std::string output = cmd.positional.size() > 1 ? cmd.positional[1] : input;
    if (cmd.positional.size() < 2)
    {
        auto dot = output.rfind(".json");
        output = (dot == std::string::npos ? output : output.substr(0, dot)) + ".png";
    }

    if (cmd.now)
    {
        auto pinned = OffsetTime::parse(*cmd.now);
        if (!pinned)
            throw std::runtime_error("--now must be an ISO 8601 time with offset, e.g. 2026-10-17T05:40:00-04:00");
        VirtualClock::set(pinned->utc);
    }

    TimelineDocument doc = TimelineDocument::load(input);

    BitmapFont::initialize(config.getFontPath());
    TimelineRenderer renderer(BitmapFont::instance(), date::locate_zone(config.getTimeZone()));

    RenderRequest request{doc.trains, doc.stations, VirtualClock::now(),
                          std::chrono::minutes(cmd.bufferBefore), std::chrono::minutes(cmd.bufferAfter), std::nullopt};
    PngEncoder::writeFile(renderer.render(request), output);

    std::cout << "Generated " << output << std::endl;
    return 0;
}

int runServe(ConfigurationManager const& config)
{
    BitmapFont::initialize(config.getFontPath());
    TimelineRenderer renderer(BitmapFont::instance(), date::locate_zone(config.getTimeZone()));

    boost::asio::io_context io;
    AmtrakClient client(io);
    TimelineServer server(io, client, renderer, config);

    std::cout << "[System] Initialized. Font " << config.getFontPath()
              << ", zone " << config.getTimeZone() << "\n";
    server.run();
    return 0;
}

int main(int argc, char* argv[])
{
    try
    {
        CommandLine cmd = parseCommandLineArgs(argc, argv);
        ConfigurationManager config;

        if (cmd.mode == "fetch" && cmd.positional.size() >= 2)
            return runFetch(cmd);
        if (cmd.mode == "render" && !cmd.positional.empty())
            return runRender(cmd, config);
        if (cmd.mode == "serve")
            return runServe(config);

        printUsage();
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
