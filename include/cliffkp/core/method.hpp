#pragma once

#include "cliffkp/core/data.hpp"
#include "cliffkp/core/iscorer.hpp"

namespace cliffkp::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    /**
     * Method: ParseChoices
     * Description: "0110" -> {false, true, true, false}. Surrounding whitespace
     * is ignored; any other character throws FormatError (BadChoices).
     */
    Choices ParseChoices(std::string_view text);

    std::string FormatChoices(const Choices &choices);

    // -----------------------------------------------------------------------------
    // Population Management
    // -----------------------------------------------------------------------------
    /**
     * Method: EvaluatePopulation
     * Description: score every individual of one generation. With parallel set
     * the loop is split across OpenMP threads; each iteration only writes its
     * own individual and the loop ends at OpenMP's implicit barrier.
     */
    void EvaluatePopulation(std::vector<TIndividual> &population, const IScorer &scorer, bool parallel);

    /**
     * Method: SelectBest
     * Description: the first individual with the highest score, nullptr for an
     * empty population.
     */
    const TIndividual* SelectBest(const std::vector<TIndividual> &population);

    /**
     * Method: UpdateBestInRun
     * Description: keep the best-ever record. Set when absent, replaced only
     * when candidate is strictly better. Returns true if the record changed.
     */
    bool UpdateBestInRun(std::optional<TIndividual> &bestInRun, const TIndividual &candidate);

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------
    /**
     * Method: ReadRunConfigYaml
     * Description: overlay the keys present in a YAML file on runData.
     * Throws IoError when the file cannot be opened, ConfigError on a syntax
     * error or a value of the wrong type.
     */
    void ReadRunConfigYaml(const std::string &configFile, TRunData &runData);

} // namespace cliffkp::core
