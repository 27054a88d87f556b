#include <cassert>
#include <cmath>
#include <iostream>

#include "application/TfidfVectorizer.hpp"

using namespace ideasnapshot::application;

int main() {
    std::cout << "[Test] Starting TF-IDF Vectorizer Test..." << std::endl;

    // Tokenizer: lowercase, stop words and single characters removed
    auto tokens = TfidfVectorizer::Tokenize("An Online marketplace for the handmade crafts of X!");
    assert(tokens.size() == 4);
    assert(tokens[0] == "online");
    assert(tokens[1] == "marketplace");
    assert(tokens[2] == "handmade");
    assert(tokens[3] == "crafts");

    auto terms = TfidfVectorizer::Terms("handmade crafts marketplace");
    assert(terms.size() == 5);
    assert(terms[3] == "handmade crafts");
    assert(terms[4] == "crafts marketplace");
    std::cout << "[PASS] Tokenizer and bigrams." << std::endl;

    // Identical wording scores 1, unrelated wording scores 0
    TfidfVectorizer vectorizer;
    auto vectors = vectorizer.fitTransform({
        "Handmade ceramic mugs sold online",
        "handmade ceramic MUGS, sold online!",
        "Drone delivery for rural pharmacies"
    });
    assert(vectors.size() == 3);
    double same = TfidfVectorizer::CosineSimilarity(vectors[0], vectors[1]);
    double unrelated = TfidfVectorizer::CosineSimilarity(vectors[0], vectors[2]);
    assert(std::fabs(same - 1.0) < 1e-9);
    assert(std::fabs(unrelated) < 1e-9);

    // Partial overlap lands strictly between the two
    auto partial = vectorizer.fitTransform({
        "Handmade ceramic mugs sold online",
        "Handmade ceramic plates sold at markets"
    });
    double overlap = TfidfVectorizer::CosineSimilarity(partial[0], partial[1]);
    assert(overlap > 0.0 && overlap < 0.85);
    std::cout << "[PASS] Cosine similarity of TF-IDF vectors." << std::endl;

    // Vocabulary is capped by corpus frequency
    TfidfVectorizer small(3);
    auto capped = small.fitTransform({"alpha beta gamma", "alpha beta", "alpha"});
    assert(small.vocabulary().size() == 3);
    assert(capped[0].size() == 3);
    assert(small.vocabulary()[0] == "alpha");

    assert(TfidfVectorizer::CosineSimilarity({}, {}) == 0.0);
    assert(TfidfVectorizer::CosineSimilarity({0.0, 0.0}, {1.0, 0.0}) == 0.0);
    std::cout << "[PASS] Vocabulary cap and degenerate vectors." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
