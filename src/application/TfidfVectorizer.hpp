/**
 * @file TfidfVectorizer.hpp
 * @brief Bag-of-ngrams TF-IDF vectors for short idea descriptions.
 */

#pragma once
#include <string>
#include <vector>

namespace ideasnapshot::application {

/**
 * @class TfidfVectorizer
 * @brief Fits a vocabulary on a small corpus and returns one L2-normalised row per document.
 *
 * Tokens are lowercase runs of two or more word characters with English stop
 * words removed; terms are unigrams plus adjacent-token bigrams. The
 * vocabulary keeps the @c maxFeatures most frequent terms across the corpus
 * (ties broken alphabetically). Weights are raw counts times the smoothed idf
 * ln((1 + n) / (1 + df)) + 1.
 */
class TfidfVectorizer {
public:
    explicit TfidfVectorizer(size_t maxFeatures = 100);

    std::vector<std::vector<double>> fitTransform(const std::vector<std::string>& documents);

    /** @brief Vocabulary of the last fit, in column order. */
    const std::vector<std::string>& vocabulary() const { return m_vocabulary; }

    static std::vector<std::string> Tokenize(const std::string& text);
    static std::vector<std::string> Terms(const std::string& text);
    static bool IsStopWord(const std::string& token);

    /** @brief Cosine similarity; 0 for empty or zero vectors. */
    static double CosineSimilarity(const std::vector<double>& v1, const std::vector<double>& v2);

private:
    size_t m_maxFeatures;
    std::vector<std::string> m_vocabulary;
};

} // namespace ideasnapshot::application
