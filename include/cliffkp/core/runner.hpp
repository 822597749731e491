/**
 * cliffkp - Evaluation Runner
 * Command-line front end over the cliff scorer and the generation tracker
 */

#pragma once

#include "cliffkp/core/data.hpp"
#include "cliffkp/core/scorer.hpp"
#include "cliffkp/utils/io.hpp"

namespace cliffkp {

    /**
    * @brief Loads an instance and scores candidates or replays recorded populations
    */
    class Runner {
    public:
        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------
        Runner() = default;

        // 0 - ready to run; > 0 - help/version printed; < 0 - error (already reported)
        int init(int argc, char* argv[]);

        // Returns the process exit status.
        int run();

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const core::TRunData& getRunData() const { return config.runData; }
        const std::optional<core::TIndividual>& getBestInRun() const { return bestInRun_; }

    private:
        struct Settings {
            std::string instancePath;
            std::string configPath;
            std::string populationPath;
            std::vector<std::string> choices;
            bool strict = false;
            bool debug = false;
            core::TRunData runData;
        };

        void loadConfiguration();
        void loadProblemData();
        void scoreChoices();
        void replayPopulations();
        core::Choices checkedChoices(const std::string& text) const;

        Settings config;
        std::unique_ptr<core::CliffScorer> scorer_;
        std::vector<core::Choices> candidates_;
        std::vector<utils::Population> generations_;
        std::optional<core::TIndividual> bestInRun_;
    };

} // namespace cliffkp
