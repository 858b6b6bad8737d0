#include "EvolveRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/agents/evolution/EvolutionConfig.h"

#include <args.hxx>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using namespace AgentEvo;

namespace {

constexpr const char* kDefaultEvolutionConfigFile = "evolution.json";

std::string getExamplesHelp()
{
    std::string help = "Examples:\n";
    help += "  agentevo-cli --generations 50 --seed 7\n";
    help += "  agentevo-cli --fitness success-focused --population 40 --elitism 2\n";
    help += "  agentevo-cli --config experiments/innovation.json --top 3\n";
    help += "  agentevo-cli --log-channels evolution:debug\n\n";
    help += "Fitness functions: balanced, success-focused, innovation-focused\n";
    help += "Config search: --config-dir, ./config, ~/.config/agentevo, /etc/agentevo\n";
    return help;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "AgentEvo CLI",
        "Evolve a population of agent genomes and report statistics as JSON.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> configFile(
        parser,
        "file",
        "Evolution config JSON (default: evolution.json when found)",
        { 'c', "config" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for config files", { "config-dir" });
    args::ValueFlag<int> populationSize(
        parser, "n", "Population size (overrides config)", { 'p', "population" });
    args::ValueFlag<int> generations(
        parser, "n", "Generations to run (default: 10)", { 'g', "generations" }, 10);
    args::ValueFlag<double> mutationRate(
        parser, "rate", "Per-trait mutation probability", { "mutation-rate" });
    args::ValueFlag<double> crossoverRate(
        parser, "rate", "Crossover probability", { "crossover-rate" });
    args::ValueFlag<int> elitismCount(
        parser, "n", "Elite agents carried over each generation", { 'e', "elitism" });
    args::ValueFlag<std::string> fitnessFunction(
        parser, "name", "Fitness function (see below)", { 'f', "fitness" });
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "Random seed for a reproducible run", { 's', "seed" });
    args::ValueFlag<size_t> topCount(
        parser, "n", "Top agents included in the summary (default: 5)", { 't', "top" }, 5);
    args::ValueFlag<std::string> logConfig(
        parser, "file", "Logging config JSON (created with defaults if missing)", { "log-config" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Channel levels, e.g. 'evolution:debug,*:warn'",
        { "log-channels" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Logging goes to stderr so stdout stays machine-readable.
    if (logConfig) {
        LoggingChannels::initializeFromConfig(args::get(logConfig), "agentevo-cli");
    }
    else {
        LoggingChannels::initialize(
            verbose ? spdlog::level::debug : spdlog::level::warn,
            spdlog::level::debug,
            "agentevo-cli");
    }
    if (verbose) {
        LoggingChannels::configureFromString("*:debug");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    Client::EvolveOptions options;

    const std::string configName = configFile ? args::get(configFile) : kDefaultEvolutionConfigFile;
    const auto configResult = ConfigLoader::load<EvolutionConfig>(configName);
    if (configResult.isValue()) {
        options.evolution = configResult.value();
    }
    else if (configFile || ConfigLoader::findConfigFile(configName).has_value()) {
        // Explicitly requested, or present but broken.
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }
    else {
        LOG_DEBUG(Cli, "No {} found, using built-in evolution defaults", configName);
    }

    if (populationSize) {
        options.evolution.populationSize = args::get(populationSize);
    }
    if (mutationRate) {
        options.evolution.mutationRate = args::get(mutationRate);
    }
    if (crossoverRate) {
        options.evolution.crossoverRate = args::get(crossoverRate);
    }
    if (elitismCount) {
        options.evolution.elitismCount = args::get(elitismCount);
    }
    if (fitnessFunction) {
        const auto parsed = fitnessFunctionFromString(args::get(fitnessFunction));
        if (!parsed.has_value()) {
            std::cerr << "Error: unknown fitness function '" << args::get(fitnessFunction)
                      << "'" << std::endl;
            return 1;
        }
        options.evolution.fitnessFunction = parsed.value();
    }

    const auto validation = validateEvolutionConfig(options.evolution);
    if (validation.isError()) {
        std::cerr << "Error: " << validation.errorValue() << std::endl;
        return 1;
    }

    options.generations = args::get(generations);
    if (options.generations < 0) {
        std::cerr << "Error: --generations must not be negative" << std::endl;
        return 1;
    }
    options.topCount = args::get(topCount);
    if (seed) {
        options.seed = args::get(seed);
    }

    Client::EvolveRunner runner(std::cout);
    const Client::EvolveResults results = runner.run(options);

    nlohmann::json summary = results;
    summary["config"] = options.evolution;
    std::cout << summary.dump(2) << std::endl;

    spdlog::shutdown();
    return 0;
}
