#include "cliffkp/core/method.hpp"
#include "cliffkp/core/errors.hpp"
#include "cliffkp/core/item.hpp" // trim

#include <yaml-cpp/yaml.h>

namespace cliffkp::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    Choices ParseChoices(std::string_view text)
    {
        const std::string_view bits = trim(text);

        Choices choices;
        choices.reserve(bits.size());
        for (std::size_t j = 0; j < bits.size(); j++) {
            if (bits[j] == '1') choices.push_back(true);
            else if (bits[j] == '0') choices.push_back(false);
            else {
                throw FormatError(FormatError::Kind::BadChoices,
                    "Invalid character '" + std::string(1, bits[j]) + "' at position "
                    + std::to_string(j) + " of choice string '" + std::string(bits) + "'");
            }
        }
        return choices;
    }

    std::string FormatChoices(const Choices &choices)
    {
        std::string text;
        text.reserve(choices.size());
        for (bool bit : choices) text.push_back(bit ? '1' : '0');
        return text;
    }

    // -----------------------------------------------------------------------------
    // Population Management
    // -----------------------------------------------------------------------------

    void EvaluatePopulation(std::vector<TIndividual> &population, const IScorer &scorer, bool parallel)
    {
        const long long size = static_cast<long long>(population.size());

        #pragma omp parallel for schedule(static) if(parallel)
        for (long long i = 0; i < size; i++) {
            population[i].score = scorer.evaluate(population[i].choices);
        }
    }

    const TIndividual* SelectBest(const std::vector<TIndividual> &population)
    {
        if (population.empty()) return nullptr;

        // max_element keeps the first of equal maxima
        auto best = std::max_element(population.begin(), population.end(),
            [](const TIndividual &lhs, const TIndividual &rhs) { return lhs.score < rhs.score; });
        return &(*best);
    }

    bool UpdateBestInRun(std::optional<TIndividual> &bestInRun, const TIndividual &candidate)
    {
        if (!bestInRun.has_value() || candidate.score > bestInRun->score) {
            bestInRun = candidate;
            return true;
        }
        return false;
    }

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    namespace {

        template <typename T>
        void ReadKey(const YAML::Node &config, const char* key, T &target)
        {
            if (!config[key] || config[key].IsNull()) return;

            try {
                target = config[key].as<T>();
            } catch (const YAML::BadConversion &e) {
                throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
            }
        }

    } // namespace

    void ReadRunConfigYaml(const std::string &configFile, TRunData &runData)
    {
        YAML::Node config;
        try {
            config = YAML::LoadFile(configFile);
        } catch (const YAML::BadFile &) {
            throw IoError("Failed to open YAML file: " + configFile);
        } catch (const YAML::ParserException &e) {
            throw ConfigError("YAML syntax error in " + configFile + ": " + e.what());
        }

        // an empty document is a valid, empty configuration
        if (config.IsNull()) return;

        if (!config.IsMap()) {
            throw ConfigError("Invalid format in " + configFile + " (expected a map of settings)");
        }

        ReadKey(config, "parallel_evaluation", runData.parallelEvaluation);
        ReadKey(config, "threads",             runData.threads);
        ReadKey(config, "strict_length",       runData.strictLength);
        ReadKey(config, "debug",               runData.debug);
        ReadKey(config, "results_file",        runData.resultsFile);

        if (runData.threads < 0) {
            throw ConfigError("Invalid value for 'threads': must be >= 0");
        }
    }

} // namespace cliffkp::core
