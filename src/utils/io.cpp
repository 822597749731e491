#include "cliffkp/utils/io.hpp"
#include "cliffkp/core/errors.hpp"
#include "cliffkp/core/method.hpp"

namespace cliffkp::utils {

    using namespace cliffkp::core;

    std::vector<Population> ReadPopulations(const std::string& path)
    {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw IoError("File (" + path + ") not found or not readable");
        }
        return ReadPopulations(file, path);
    }

    std::vector<Population> ReadPopulations(std::istream& in, const std::string& sourceName)
    {
        std::vector<Population> generations;
        Population current;
        std::string line;
        std::size_t lineNumber = 0;

        while (std::getline(in, line)) {
            lineNumber++;
            const std::string_view text = trim(line);

            if (!text.empty() && text.front() == '#') continue;

            // blank line closes the current generation
            if (text.empty()) {
                if (!current.empty()) {
                    generations.push_back(std::move(current));
                    current.clear();
                }
                continue;
            }

            try {
                current.emplace_back(ParseChoices(text));
            } catch (const FormatError& e) {
                throw FormatError(e.kind(),
                    sourceName + ", line " + std::to_string(lineNumber) + ": " + e.what());
            }
        }
        if (in.bad()) {
            throw IoError("Failed to read from " + sourceName);
        }

        if (!current.empty()) generations.push_back(std::move(current));
        return generations;
    }

    void WriteKnapsackScreen(std::ostream& out, const std::string& instance, const Knapsack& knapsack)
    {
        out << "Running on knapsack at: " << instance << "\n";
        out << "Items: " << knapsack.numItems() << "\n";
        out << "Capacity: " << knapsack.capacity() << "\n";
    }

    void WriteCandidateScreen(std::ostream& out, const Knapsack& knapsack, const TIndividual& ind)
    {
        out << "sol: " << FormatChoices(ind.choices)
            << "\nweight: " << knapsack.weight(ind.choices)
            << "\nvalue: " << knapsack.value(ind.choices)
            << "\nscore: " << ind.score << "\n";
    }

    void WriteResults(const std::string& resultsFile, const std::string& instance,
                      std::size_t numGenerations, const CliffScore& bestFinal,
                      const std::optional<TIndividual>& bestInRun)
    {
        std::ofstream file(resultsFile, std::ios::app);
        if (!file.is_open()) {
            throw IoError("Failed to open results file " + resultsFile);
        }

        file << instance
             << "\t" << numGenerations
             << "\t" << bestFinal
             << "\t" << (bestInRun.has_value() ? toString(bestInRun->score) : std::string("none"))
             << "\n";

        if (!file) {
            throw IoError("Failed to write results file " + resultsFile);
        }
    }

} // namespace cliffkp::utils
