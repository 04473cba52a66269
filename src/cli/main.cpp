#include "core/BinaryImage.h"
#include "core/GridDiagramGenerator.h"
#include "core/LoggingChannels.h"
#include "core/PresentationLayer.h"
#include "core/Simulation.h"
#include "core/SimulationConfig.h"
#include <args.hxx>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <vector>

using namespace CarveSim;

namespace {

constexpr int EXIT_COMPLETE = 0;
constexpr int EXIT_INPUT_ERROR = 1;
constexpr int EXIT_FRAME_CAP = 2;

std::vector<std::string> splitRows(const std::string& text)
{
    std::vector<std::string> rows;
    std::stringstream stream(text);
    std::string row;
    while (std::getline(stream, row, '|')) {
        rows.push_back(row);
    }
    return rows;
}

std::string getExamplesHelp()
{
    std::string examples = "Examples:\n\n";
    examples += "  carve-sim --image hello.pbm --diagram\n";
    examples += "  carve-sim --text-rows '.###.|#...#|#...#|.###.' -p 2 -b 10 --seed 7\n";
    examples += "  carve-sim --image logo.pgm --skip --snapshot final.json\n";
    examples += "  carve-sim --image hello.pbm -C 'collision:trace,*:warn' --print-stats\n";
    return examples;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Carve Sim", "Carve a text bitmap out of its background with bouncing balls.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });

    args::Group source(parser, "Input (one required):", args::Group::Validators::Xor);
    args::ValueFlag<std::string> imagePath(
        source, "image", "Netpbm bitmap or graymap (P1/P2/P4/P5)", { "image" });
    args::ValueFlag<std::string> textRows(
        source,
        "rows",
        "Inline bitmap rows separated by '|'; '#', 'X', 'x' and '1' are text",
        { "text-rows" });

    args::ValueFlag<int> padding(
        parser, "padding", "Edge boundary rings (default: 3)", { 'p', "padding" });
    args::ValueFlag<int> ballCount(
        parser, "balls", "Target ball population, 1-100 (default: 30)", { 'b', "balls" });
    args::ValueFlag<double> deviation(
        parser, "degrees", "Bounce search half-width, 1-45 (default: 15)", { 'd', "deviation" });
    args::ValueFlag<double> speed(
        parser, "multiplier", "Speed multiplier, 0.1-5.0 (default: 1.0)", { 's', "speed" });
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "Random seed, 0 for nondeterministic (default: 0)", { "seed" });
    args::ValueFlag<int> maxFrames(
        parser,
        "frames",
        "Stop after this many frames (default: 100000)",
        { "max-frames" },
        100000);
    args::ValueFlag<std::string> configPath(
        parser, "config", "Simulation config JSON; flags override its values", { "config" });

    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., collision:trace,island:debug,*:off)",
        { 'C', "channels" });

    args::Flag diagram(
        parser, "diagram", "Print an ASCII diagram of the final grid", { "diagram" });
    args::Flag emoji(parser, "emoji", "Print an emoji diagram of the final grid", { "emoji" });
    args::ValueFlag<std::string> snapshotPath(
        parser, "file", "Write the final render snapshot as JSON", { "snapshot" });
    args::Flag skip(parser, "skip", "Skip straight to the finished state", { "skip" });
    args::Flag printStats(
        parser, "print-stats", "Print timer statistics on exit", { "print-stats" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return EXIT_COMPLETE;
    }
    catch (const args::Error& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return EXIT_INPUT_ERROR;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig));
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        LoggingChannels::cli()->info("Applied channel overrides: {}", args::get(logChannels));
    }

    // Simulation config: defaults, then file, then flags.
    SimulationConfig config = getDefaultSimulationConfig();
    if (configPath) {
        auto loaded = loadSimulationConfig(args::get(configPath));
        if (loaded.isError()) {
            LoggingChannels::cli()->error("{}", loaded.errorValue().message);
            return EXIT_INPUT_ERROR;
        }
        config = loaded.value();
    }
    if (padding) config.padding = args::get(padding);
    if (ballCount) config.ball_count = args::get(ballCount);
    if (deviation) config.deviation_angle_degrees = args::get(deviation);
    if (speed) config.movement_speed_multiplier = args::get(speed);
    if (seed) config.seed = args::get(seed);

    auto valid = validateSimulationConfig(config);
    if (valid.isError()) {
        LoggingChannels::cli()->error("Invalid config: {}", valid.errorValue().message);
        return EXIT_INPUT_ERROR;
    }

    BinaryImage image;
    if (imagePath) {
        auto loaded = loadBinaryImage(args::get(imagePath));
        if (loaded.isError()) {
            LoggingChannels::cli()->error("{}", loaded.errorValue().message);
            return EXIT_INPUT_ERROR;
        }
        image = loaded.value();
    }
    else {
        image = BinaryImage::fromRows(splitRows(args::get(textRows)));
    }

    std::unique_ptr<Simulation> sim;
    try {
        sim = std::make_unique<Simulation>(image, config);
    }
    catch (const GridError& e) {
        LoggingChannels::cli()->error("Cannot build grid: {}", e.what());
        return EXIT_INPUT_ERROR;
    }
    catch (const std::invalid_argument& e) {
        LoggingChannels::cli()->error("{}", e.what());
        return EXIT_INPUT_ERROR;
    }

    PresentationLayer presentation;
    sim->setEventSink(&presentation);

    const int frameCap = args::get(maxFrames);
    LoggingChannels::cli()->info(
        "Carving {}x{} bitmap ({} text pixels), frame cap {}",
        image.width,
        image.height,
        image.countSet(),
        frameCap);

    if (skip) {
        sim->skipToEnd();
    }
    else {
        sim->spawnInitialBalls();
        while (!sim->isComplete() && static_cast<int>(sim->getFrame()) < frameCap) {
            const FrameStats stats = sim->advanceFrame();
            if (stats.frame % 1000 == 0) {
                LoggingChannels::cli()->info(
                    "Frame {}: {} carveable left, {} balls",
                    stats.frame,
                    stats.carveableRemaining,
                    stats.activeBalls);
            }
        }
    }

    const bool complete = sim->isComplete();
    if (complete) {
        LoggingChannels::cli()->info("Complete after {} frames", sim->getFrame());
    }
    else {
        LoggingChannels::cli()->warn(
            "Frame cap {} reached with {} carveable cells left",
            frameCap,
            sim->getGrid().countByState(CellState::CarveableBackground));
    }

    if (diagram) {
        std::cout << GridDiagramGenerator::generateAsciiDiagram(sim->getGrid(), sim->getBalls());
    }
    if (emoji) {
        std::cout << GridDiagramGenerator::generateEmojiDiagram(
            sim->getGrid(), sim->getBalls(), &presentation);
    }

    if (snapshotPath) {
        std::ofstream out(args::get(snapshotPath));
        if (!out.is_open()) {
            LoggingChannels::cli()->error("Cannot write snapshot: {}", args::get(snapshotPath));
            return EXIT_INPUT_ERROR;
        }
        nlohmann::json j = sim->snapshot(&presentation);
        out << j.dump(2) << std::endl;
        LoggingChannels::cli()->info("Wrote snapshot to {}", args::get(snapshotPath));
    }

    if (printStats) {
        sim->getTimers().dumpTimerStats();
    }

    return complete ? EXIT_COMPLETE : EXIT_FRAME_CAP;
}
