#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>                        // std::size_t
#include <stdexcept>                      // std::runtime_error
#include <string>                         // std::string

// Raised when an MST run collects a number of edges other than |V|-1,
// i.e. the input graph was disconnected. No partial tree is returned.
class MstComputationError : public std::runtime_error {
public:
    MstComputationError(const std::string& algorithm, std::size_t expected, std::size_t actual)
        : std::runtime_error(algorithm + " algorithm failed: MST construction failed. Expected " +
                             std::to_string(expected) + " edges but got " +
                             std::to_string(actual) + ". Graph may be disconnected."),
          m_expected(expected),
          m_actual(actual) {}

    std::size_t expectedEdges() const noexcept { return m_expected; }
    std::size_t actualEdges() const noexcept { return m_actual; }

private:
    std::size_t m_expected;
    std::size_t m_actual;
};
