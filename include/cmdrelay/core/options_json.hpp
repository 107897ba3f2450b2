/**
 * @file options_json.hpp
 * @brief Loading RelayOptions from a JSON document.
 *
 * Keys are snake_case versions of the RelayOptions fields
 * ("queue_depth", "overflow_policy", "max_attempts", ...). Missing keys keep
 * their defaults; the result is validated before it is returned.
 *
 * @date 2025
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "cmdrelay/core/options.hpp"

namespace cmdrelay {

    /**
     * @brief Build options from @p doc on top of @p base.
     * @throws std::invalid_argument on wrong types, unknown enum names or failed validation
     */
    RelayOptions optionsFromJson(const nlohmann::json& doc, RelayOptions base = {});

    /**
     * @brief Read and parse a JSON file, then call optionsFromJson().
     * @throws std::invalid_argument if the file cannot be read or parsed
     */
    RelayOptions loadOptionsFile(const std::string& path, RelayOptions base = {});

    /**
     * @brief Serialise the scalar fields (custom backoffStrategy is not representable).
     */
    nlohmann::json optionsToJson(const RelayOptions& opts);

}
