// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "training/checkpoint_options.h"

#include <fstream>
#include <stdexcept>
#include <type_traits>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace {

std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_number_unsigned()) return narrow<int>(value.get<std::uint64_t>());
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        std::size_t consumed = 0;
        try {
            int parsed = std::stoi(text, &consumed);
            if (consumed == text.size()) return parsed;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

template<typename T>
void read_opt(const nlohmann::json& obj, const char* key, T& target) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    std::optional<T> parsed;
    if constexpr (std::is_same_v<T, int>) {
        parsed = as_int(*it);
    } else if constexpr (std::is_same_v<T, bool>) {
        parsed = as_bool(*it);
    }
    if (!parsed) {
        throw std::invalid_argument(fmt::format("Invalid value for option `{}`: {}", key, it->dump()));
    }
    target = *parsed;
}

}  // namespace

void CheckpointOptions::validate() const {
    if (NumWorkers < 1) {
        throw std::invalid_argument(fmt::format("num_workers must be at least 1, got {}", NumWorkers));
    }
}

std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>> CheckpointOptions::to_log_options() const {
    return {
        {"async_save", AsyncSave},
        {"use_sharded_format", UseShardedFormat},
        {"num_kept", static_cast<std::int64_t>(NumKept.value_or(-1))},
        {"num_workers", static_cast<std::int64_t>(NumWorkers)},
        {"zero1_optimizer", Zero1Optimizer},
        {"strict", Strict},
    };
}

/**
 * @brief Load checkpoint options from a JSON file.
 *
 * Recognized keys: `async_save`, `use_sharded_format`, `num_kept`, `num_workers`,
 * `zero1_optimizer`, `strict`. Booleans may also be given as 0/1 or "true"/"false".
 *
 * @param file_name Path to the JSON file.
 * @return Parsed and validated options.
 *
 * @throws std::runtime_error If the file cannot be opened.
 * @throws std::invalid_argument On unknown keys or invalid values.
 */
CheckpointOptions load_checkpoint_options(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open options file {}", file_name));
    }

    const auto options_json = nlohmann::json::parse(file);
    if (!options_json.is_object()) {
        throw std::invalid_argument(fmt::format("options file {} must contain a JSON object", file_name));
    }

    static const char* const known_keys[] = {"async_save", "use_sharded_format", "num_kept",
                                             "num_workers", "zero1_optimizer", "strict"};
    for (const auto& item : options_json.items()) {
        bool known = false;
        for (const char* key : known_keys) {
            known = known || item.key() == key;
        }
        if (!known) {
            throw std::invalid_argument(fmt::format("Unknown option `{}` in {}", item.key(), file_name));
        }
    }

    CheckpointOptions options;
    read_opt(options_json, "async_save", options.AsyncSave);
    read_opt(options_json, "use_sharded_format", options.UseShardedFormat);
    read_opt(options_json, "num_workers", options.NumWorkers);
    read_opt(options_json, "zero1_optimizer", options.Zero1Optimizer);
    read_opt(options_json, "strict", options.Strict);

    int num_kept = -1;
    read_opt(options_json, "num_kept", num_kept);
    if (num_kept >= 0) {
        options.NumKept = num_kept;
    }

    options.validate();
    return options;
}
