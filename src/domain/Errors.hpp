/**
 * @file Errors.hpp
 * @brief Error taxonomy of the snapshot pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>
#include "ResearchBundle.hpp"

namespace ideasnapshot::domain {

/**
 * @class ResearchFacetError
 * @brief A single facet query failed. Always recovered with the facet default.
 */
class ResearchFacetError : public std::runtime_error {
public:
    ResearchFacetError(Facet facet, const std::string& message)
        : std::runtime_error(ToString(facet) + ": " + message), m_facet(facet) {}

    Facet facet() const { return m_facet; }

private:
    Facet m_facet;
};

/**
 * @class SynthesisError
 * @brief The text-generation call failed. Terminates the run.
 */
class SynthesisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class PersistenceError
 * @brief A snapshot or performance record could not be stored. Terminates the run.
 */
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ideasnapshot::domain
