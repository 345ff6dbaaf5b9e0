//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_AUA_HPP
#define AUA_AUA_HPP

/**
 * @file aua.hpp
 * @brief Main header for the API Usage Analyzer library.
 *
 * Pulls in the core types and the pipeline entry points. Include specific
 * headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"

#include "api/api_description.hpp"
#include "corpus/corpus_walker.hpp"
#include "engine/usage_engine.hpp"
#include "export/usage_json.hpp"
#include "storage/checkpoint_store.hpp"
#include "usage/improvement_filter.hpp"
#include "usage/usage_aggregate.hpp"

#endif //AUA_AUA_HPP
