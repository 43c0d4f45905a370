#ifndef HQA_HQA_HPP
#define HQA_HQA_HPP

/**
 * @file hqa.hpp
 * @brief Main header for the Heuristic Quality Analyzer library.
 *
 * Pulls in the core types and the analysis coordinator. Include specific
 * headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "analysis/coordinator.hpp"

#endif // HQA_HQA_HPP
