// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/bin_packing.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "utilities/tensor.h"

std::vector<std::vector<int>> assign_tensors_to_bins(const std::vector<std::size_t>& sizes, int bin_count) {
    if (bin_count < 1) {
        throw std::invalid_argument(fmt::format("bin_count must be at least 1, got {}", bin_count));
    }

    std::vector<std::pair<int, std::size_t>> order;
    order.reserve(sizes.size());
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        order.emplace_back(narrow<int>(i), sizes[i]);
    }
    std::stable_sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });

    std::vector<std::vector<int>> bins(bin_count);
    std::vector<std::size_t> totals(bin_count, 0);
    for (const auto& [index, size] : order) {
        // min_element returns the first of several minima
        auto target = std::distance(totals.begin(), std::min_element(totals.begin(), totals.end()));
        bins[target].push_back(index);
        totals[target] += size;
    }
    return bins;
}

std::vector<std::vector<int>> assign_tensors_to_bins(const std::vector<Tensor>& tensors, int bin_count) {
    std::vector<std::size_t> sizes;
    sizes.reserve(tensors.size());
    for (const auto& t : tensors) {
        sizes.push_back(t.bytes());
    }
    return assign_tensors_to_bins(sizes, bin_count);
}
