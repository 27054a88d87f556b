/**
 * @file TfidfVectorizer.cpp
 * @brief Implementation of TfidfVectorizer.
 */

#include "application/TfidfVectorizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace ideasnapshot::application {

namespace {

const std::unordered_set<std::string>& EnglishStopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "across", "after", "afterwards", "again", "against", "all", "almost",
        "alone", "along", "already", "also", "although", "always", "am", "among", "amongst", "an",
        "and", "another", "any", "anyhow", "anyone", "anything", "anyway", "anywhere", "are", "around",
        "as", "at", "back", "be", "became", "because", "become", "becomes", "becoming", "been",
        "before", "beforehand", "behind", "being", "below", "beside", "besides", "between", "beyond",
        "both", "but", "by", "can", "cannot", "could", "did", "do", "does", "doing", "done", "down",
        "due", "during", "each", "eg", "either", "else", "elsewhere", "enough", "etc", "even", "ever",
        "every", "everyone", "everything", "everywhere", "except", "few", "for", "former", "formerly",
        "from", "further", "get", "give", "go", "had", "has", "have", "he", "hence", "her", "here",
        "hereafter", "hereby", "herein", "hers", "herself", "him", "himself", "his", "how", "however",
        "ie", "if", "in", "indeed", "into", "is", "it", "its", "itself", "just", "keep", "last",
        "latter", "least", "less", "made", "many", "may", "me", "meanwhile", "might", "mine", "more",
        "moreover", "most", "mostly", "much", "must", "my", "myself", "namely", "neither", "never",
        "nevertheless", "next", "no", "nobody", "none", "noone", "nor", "not", "nothing", "now",
        "nowhere", "of", "off", "often", "on", "once", "one", "only", "onto", "or", "other", "others",
        "otherwise", "our", "ours", "ourselves", "out", "over", "own", "part", "per", "perhaps",
        "please", "put", "rather", "re", "same", "see", "seem", "seemed", "seeming", "seems",
        "several", "she", "should", "since", "so", "some", "somehow", "someone", "something",
        "sometime", "sometimes", "somewhere", "still", "such", "than", "that", "the", "their",
        "them", "themselves", "then", "thence", "there", "thereafter", "thereby", "therefore",
        "therein", "thereupon", "these", "they", "this", "those", "though", "through", "throughout",
        "thru", "thus", "to", "together", "too", "toward", "towards", "under", "until", "up", "upon",
        "us", "very", "via", "was", "we", "well", "were", "what", "whatever", "when", "whence",
        "whenever", "where", "whereafter", "whereas", "whereby", "wherein", "whereupon", "wherever",
        "whether", "which", "while", "whither", "who", "whoever", "whole", "whom", "whose", "why",
        "will", "with", "within", "without", "would", "yet", "you", "your", "yours", "yourself",
        "yourselves"
    };
    return words;
}

bool IsWordChar(unsigned char c) {
    // Bytes of multi-byte UTF-8 sequences count as word characters.
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

} // namespace

TfidfVectorizer::TfidfVectorizer(size_t maxFeatures) : m_maxFeatures(maxFeatures) {}

bool TfidfVectorizer::IsStopWord(const std::string& token) {
    return EnglishStopWords().count(token) > 0;
}

std::vector<std::string> TfidfVectorizer::Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 2 && !IsStopWord(current)) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (IsWordChar(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

std::vector<std::string> TfidfVectorizer::Terms(const std::string& text) {
    auto tokens = Tokenize(text);
    std::vector<std::string> terms = tokens;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        terms.push_back(tokens[i] + " " + tokens[i + 1]);
    }
    return terms;
}

std::vector<std::vector<double>> TfidfVectorizer::fitTransform(const std::vector<std::string>& documents) {
    std::vector<std::unordered_map<std::string, int>> counts;
    std::map<std::string, int> corpusFrequency;
    std::unordered_map<std::string, int> documentFrequency;

    for (const auto& doc : documents) {
        std::unordered_map<std::string, int> docCounts;
        for (const auto& term : Terms(doc)) {
            ++docCounts[term];
            ++corpusFrequency[term];
        }
        for (const auto& entry : docCounts) {
            ++documentFrequency[entry.first];
        }
        counts.push_back(std::move(docCounts));
    }

    // Most frequent terms first; std::map iteration already gives alphabetical ties.
    std::vector<std::pair<std::string, int>> ranked(corpusFrequency.begin(), corpusFrequency.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    if (ranked.size() > m_maxFeatures) {
        ranked.resize(m_maxFeatures);
    }

    m_vocabulary.clear();
    for (const auto& entry : ranked) {
        m_vocabulary.push_back(entry.first);
    }
    std::sort(m_vocabulary.begin(), m_vocabulary.end());

    const double n = static_cast<double>(documents.size());
    std::vector<double> idf(m_vocabulary.size());
    for (size_t col = 0; col < m_vocabulary.size(); ++col) {
        double df = static_cast<double>(documentFrequency[m_vocabulary[col]]);
        idf[col] = std::log((1.0 + n) / (1.0 + df)) + 1.0;
    }

    std::vector<std::vector<double>> matrix;
    matrix.reserve(documents.size());
    for (const auto& docCounts : counts) {
        std::vector<double> row(m_vocabulary.size(), 0.0);
        double norm = 0.0;
        for (size_t col = 0; col < m_vocabulary.size(); ++col) {
            auto it = docCounts.find(m_vocabulary[col]);
            if (it == docCounts.end()) continue;
            row[col] = it->second * idf[col];
            norm += row[col] * row[col];
        }
        if (norm > 0.0) {
            norm = std::sqrt(norm);
            for (auto& value : row) value /= norm;
        }
        matrix.push_back(std::move(row));
    }
    return matrix;
}

double TfidfVectorizer::CosineSimilarity(const std::vector<double>& v1, const std::vector<double>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0;
    double dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += v1[i] * v2[i];
        n1 += v1[i] * v1[i];
        n2 += v2[i] * v2[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0;
}

} // namespace ideasnapshot::application
