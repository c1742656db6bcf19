// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_CHECKPOINT_BIN_PACKING_H
#define SHARDKEEP_SRC_CHECKPOINT_BIN_PACKING_H

#include <cstddef>
#include <vector>

struct Tensor;

/*!
 * \brief Split tensors into `bin_count` bins of similar total byte size.
 * \details Tensors are visited in ascending size (ties keep their original order) and each goes to the
 * bin with the smallest running total, lowest index first. The result only depends on the sizes, so
 * every rank that sees the same tensors computes the same partition.
 * \return For each bin, the indices of its tensors in assignment order.
 * \throws std::invalid_argument If `bin_count < 1`.
 */
std::vector<std::vector<int>> assign_tensors_to_bins(const std::vector<std::size_t>& sizes, int bin_count);

//! Same as above, with sizes taken as `nelem * element size`.
std::vector<std::vector<int>> assign_tensors_to_bins(const std::vector<Tensor>& tensors, int bin_count);

#endif //SHARDKEEP_SRC_CHECKPOINT_BIN_PACKING_H
