#include "cliffkp/core/runner.hpp"
#include "cliffkp/core/errors.hpp"
#include "cliffkp/core/method.hpp"
#include "cliffkp/core/tracker.hpp"
#include "cliffkp/stats/entropy.hpp"
#include "cliffkp/utils/io.hpp"

// CLI11 and OpenMP
#include <CLI/CLI.hpp>
#include <omp.h>

namespace cliffkp {

    int Runner::init(int argc, char* argv[]) {
        CLI::App app{"cliffkp - cliff-scored 0/1 knapsack evaluation"};

        app.add_option("-i,--instance", config.instancePath, "Path to instance file")->required()->check(CLI::ExistingFile);
        app.add_option("-c,--config", config.configPath, "Path to YAML run configuration")->check(CLI::ExistingFile);
        app.add_option("-p,--population", config.populationPath, "Recorded population file to replay")->check(CLI::ExistingFile);
        app.add_option("-x,--choices", config.choices, "Choice strings to score (e.g. 0110)");
        app.add_flag("-s,--strict", config.strict, "Reject candidates whose length differs from the number of items");
        app.add_flag("-d,--debug", config.debug, "Verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError &e) {
            // help and version exit with 0
            return (app.exit(e) == 0) ? 1 : -1;
        }

        try {
            loadConfiguration();
            loadProblemData();
            return 0;
        } catch (const core::FormatError &e) {
            std::cerr << "Initialization Error [" << core::toString(e.kind()) << "]: " << e.what() << std::endl;
            return -1;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return -1;
        }
    }

    void Runner::loadConfiguration() {
        if (!config.configPath.empty()) {
            core::ReadRunConfigYaml(config.configPath, config.runData);
        }

        // command line wins over the file
        if (config.strict) config.runData.strictLength = true;
        if (config.debug)  config.runData.debug = 1;
    }

    void Runner::loadProblemData() {
        scorer_ = std::make_unique<core::CliffScorer>(core::Knapsack::fromFile(config.instancePath));

        // every candidate is parsed before the first evaluation
        for (const auto& text : config.choices) {
            candidates_.emplace_back(checkedChoices(text));
        }

        if (!config.populationPath.empty()) {
            generations_ = utils::ReadPopulations(config.populationPath);

            if (config.runData.strictLength) {
                for (std::size_t g = 0; g < generations_.size(); g++) {
                    for (const auto& ind : generations_[g]) {
                        if (ind.choices.size() != scorer_->getDimension()) {
                            throw core::FormatError(core::FormatError::Kind::LengthMismatch,
                                "Generation " + std::to_string(g) + ": candidate '"
                                + core::FormatChoices(ind.choices) + "' has "
                                + std::to_string(ind.choices.size()) + " bits, expected "
                                + std::to_string(scorer_->getDimension()));
                        }
                    }
                }
            }
        }
    }

    core::Choices Runner::checkedChoices(const std::string& text) const {
        core::Choices choices = core::ParseChoices(text);

        if (config.runData.strictLength && choices.size() != scorer_->getDimension()) {
            throw core::FormatError(core::FormatError::Kind::LengthMismatch,
                "Choice string '" + text + "' has " + std::to_string(choices.size())
                + " bits, expected " + std::to_string(scorer_->getDimension()));
        }
        return choices;
    }

    int Runner::run() {
        if (!scorer_) {
            std::cerr << "Error: no instance loaded.\n";
            return 1;
        }

        if (config.runData.threads > 0) {
            omp_set_num_threads(config.runData.threads);
        }

        utils::WriteKnapsackScreen(std::cout, config.instancePath, scorer_->knapsack());

        if (config.runData.debug) {
            std::cout << "Parallel evaluation: " << (config.runData.parallelEvaluation ? "on" : "off")
                      << " (" << omp_get_max_threads() << " threads)\n";
            std::cout << "Strict length: " << (config.runData.strictLength ? "on" : "off") << "\n";
        }

        if (candidates_.empty() && generations_.empty()) {
            std::cout << "Nothing to evaluate (use --choices or --population).\n";
            return 0;
        }

        try {
            scoreChoices();
            replayPopulations();
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    void Runner::scoreChoices() {
        for (const auto& choices : candidates_) {
            core::TIndividual ind(choices, scorer_->evaluate(choices));
            std::cout << "\n";
            utils::WriteCandidateScreen(std::cout, scorer_->knapsack(), ind);
        }
    }

    void Runner::replayPopulations() {
        if (generations_.empty()) return;

        stats::GenomeEntropy entropy;
        core::GenerationTracker tracker(entropy, std::cout);

        std::cout << "\n";
        for (std::size_t g = 0; g < generations_.size(); g++) {
            core::EvaluatePopulation(generations_[g], *scorer_, config.runData.parallelEvaluation);

            if (config.runData.debug) {
                std::cout << "[generation " << g << "] " << generations_[g].size() << " candidates\n";
            }

            // the whole generation is scored here; the record only moves between generations
            tracker.reportOnGeneration(g, generations_[g], bestInRun_);
        }

        const auto& finalPopulation = generations_.back();
        tracker.reportSummary(finalPopulation, bestInRun_);

        if (!config.runData.resultsFile.empty()) {
            const core::TIndividual* bestFinal = core::SelectBest(finalPopulation);
            utils::WriteResults(config.runData.resultsFile, config.instancePath, generations_.size(),
                                bestFinal->score, bestInRun_);
        }
    }

} // namespace cliffkp
