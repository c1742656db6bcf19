// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SHARDKEEP_SRC_UTILITIES_COMM_H
#define SHARDKEEP_SRC_UTILITIES_COMM_H

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

struct Tensor;

//! A partition of ranks into groups; each inner vector lists the global ranks of one group.
using RankGroups = std::vector<std::vector<int>>;

class CommunicatorThreadsPack {
public:
    virtual ~CommunicatorThreadsPack() = default;
    virtual void join() = 0;
};

/*!
 * \brief Cross-rank synchronization used by the checkpoint engine.
 * \details All collectives must be entered by the participating ranks in the same program order.
 * A mismatch cannot be detected in general and deadlocks; the threaded implementation at least
 * verifies that all ranks arrive at a barrier with the same name.
 */
class Communicator {
public:
    Communicator(int rank, int world, int local_rank);
    virtual ~Communicator();

    //! Cpu-side barrier across all ranks.
    virtual void barrier(std::string_view name) = 0;

    //! In-place element-wise sum over the ranks in `group` (which must contain the calling rank).
    //! Only the members of `group` participate; other ranks may run other groups concurrently.
    virtual void all_reduce_sum(Tensor& tensor, const std::vector<int>& group) = 0;

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }
    [[nodiscard]] int local_rank() const { return mLocalRank; }
    [[nodiscard]] virtual int local_world_size() const { return mWorld; }

    /**
     * @brief Run `work` once per rank, one thread per rank (blocking).
     *
     * Ranks share a std::barrier for synchronization and exchange tensors through shared memory.
     * Exceptions thrown by any rank are re-thrown from this call after all threads finished.
     *
     * @param nranks Number of ranks to simulate.
     * @param work Callable invoked once per rank with that rank's communicator.
     */
    static void run_communicators(int nranks, std::function<void(Communicator& comm)> work);

    //! Same as run_communicators but returns immediately with a joinable pack.
    static std::unique_ptr<CommunicatorThreadsPack> launch_communicators(int nranks, std::function<void(Communicator& comm)> work);

private:
    int mRank;
    int mWorld;
    int mLocalRank;
};

//! Element-wise `dst += src` for host tensors of equal dtype and shape.
void accumulate_tensor(Tensor& dst, const Tensor& src);

#endif //SHARDKEEP_SRC_UTILITIES_COMM_H
