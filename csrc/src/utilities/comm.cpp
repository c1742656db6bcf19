// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <algorithm>
#include <barrier>
#include <cstdio>
#include <cstring>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "tensor.h"

Communicator::Communicator(int rank, int world, int local_rank) :
    mRank(rank), mWorld(world), mLocalRank(local_rank)
{
    if (world <= 0 || rank < 0 || rank >= world) {
        throw std::invalid_argument(fmt::format("Invalid rank {} for world size {}", rank, world));
    }
}

Communicator::~Communicator() = default;

namespace {
template<typename T>
void accumulate_typed(Tensor& dst, const Tensor& src) {
    auto* d = reinterpret_cast<T*>(dst.Data);
    const auto* s = reinterpret_cast<const T*>(src.Data);
    for (std::size_t i = 0; i < dst.nelem(); ++i) {
        d[i] = static_cast<T>(d[i] + s[i]);
    }
}

template<float (*ToFloat)(std::uint16_t), std::uint16_t (*FromFloat)(float)>
void accumulate_half(Tensor& dst, const Tensor& src) {
    auto* d = reinterpret_cast<std::uint16_t*>(dst.Data);
    const auto* s = reinterpret_cast<const std::uint16_t*>(src.Data);
    for (std::size_t i = 0; i < dst.nelem(); ++i) {
        d[i] = FromFloat(ToFloat(d[i]) + ToFloat(s[i]));
    }
}
} // namespace

/**
 * @brief Add @p src element-wise into @p dst.
 *
 * 16-bit float types are accumulated in fp32 and rounded back. For the zero-padded broadcast
 * emulation used when loading checkpoints, exactly one operand is non-zero, so the result is exact.
 *
 * @throws std::logic_error On dtype or shape mismatch.
 */
void accumulate_tensor(Tensor& dst, const Tensor& src) {
    if (dst.DType != src.DType || dst.shape() != src.shape()) {
        throw std::logic_error(fmt::format("Cannot accumulate {}{} into {}{}",
                                           dtype_to_str(src.DType), shape_to_str(src),
                                           dtype_to_str(dst.DType), shape_to_str(dst)));
    }
    if (dst.nelem() == 0) return;

    switch (dst.DType) {
        case ETensorDType::FP32:  accumulate_typed<float>(dst, src); break;
        case ETensorDType::FP64:  accumulate_typed<double>(dst, src); break;
        case ETensorDType::INT8:  accumulate_typed<std::int8_t>(dst, src); break;
        case ETensorDType::INT32: accumulate_typed<std::int32_t>(dst, src); break;
        case ETensorDType::INT64: accumulate_typed<std::int64_t>(dst, src); break;
        case ETensorDType::BYTE:  accumulate_typed<std::uint8_t>(dst, src); break;
        case ETensorDType::BF16:  accumulate_half<bf16_bits_to_float, float_to_bf16_bits>(dst, src); break;
        case ETensorDType::FP16:  accumulate_half<fp16_bits_to_float, float_to_fp16_bits>(dst, src); break;
        case ETensorDType::BOOL: {
            auto* d = reinterpret_cast<std::uint8_t*>(dst.Data);
            const auto* s = reinterpret_cast<const std::uint8_t*>(src.Data);
            for (std::size_t i = 0; i < dst.nelem(); ++i) {
                d[i] = (d[i] || s[i]) ? 1 : 0;
            }
            break;
        }
    }
}

// ============================================================================
// Threaded Communicator
// ============================================================================

/**
 * @brief Communicator variant where every rank is a thread of the current process.
 *
 * Uses std::barrier for CPU synchronization and shared memory for data exchange.
 * Group-scoped reductions get their own barrier per distinct group, so disjoint
 * groups can reduce independently.
 */
class ThreadedCommunicator : public Communicator {
public:
    struct GroupState {
        explicit GroupState(std::size_t size) : Barrier(std::make_unique<std::barrier<>>(static_cast<std::ptrdiff_t>(size))), Buffers(size) {}
        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<Tensor> Buffers;       // one view per group member
    };

    struct SharedState {
        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<std::string> BarrierNames;  // one slot per rank
        std::vector<std::exception_ptr> Exceptions;
        std::map<std::vector<int>, std::shared_ptr<GroupState>> Groups;
        std::mutex Mutex;

        std::shared_ptr<GroupState> group_state(const std::vector<int>& group) {
            std::lock_guard<std::mutex> lock(Mutex);
            auto& slot = Groups[group];
            if (!slot) {
                slot = std::make_shared<GroupState>(group.size());
            }
            return slot;
        }
    };

    ThreadedCommunicator(int rank, int world, std::shared_ptr<SharedState> state);

    /**
     * @brief Drops out of the shared barrier on destruction (if present).
     */
    ~ThreadedCommunicator() override;

    void barrier(std::string_view name) override;
    void all_reduce_sum(Tensor& tensor, const std::vector<int>& group) override;

private:
    std::shared_ptr<SharedState> mShare;
};

ThreadedCommunicator::ThreadedCommunicator(int rank, int world, std::shared_ptr<SharedState> state) :
    Communicator(rank, world, rank), mShare(std::move(state))
{
}

ThreadedCommunicator::~ThreadedCommunicator() {
    if(mShare && mShare->Barrier) {
        mShare->Barrier->arrive_and_drop();
    }
}

/**
 * @brief Barrier across all ranks that additionally checks that every rank reached the same named point.
 *
 * Two phases: the first publishes the name and waits for everybody, the second keeps the slots stable
 * until every rank has compared them.
 *
 * @throws std::logic_error If the ranks arrived at differently named barriers.
 */
void ThreadedCommunicator::barrier(std::string_view name) {
    mShare->BarrierNames[rank()] = std::string(name);
    mShare->Barrier->arrive_and_wait();
    std::string mismatch;
    for (int r = 0; r < world_size(); ++r) {
        if (mShare->BarrierNames[r] != name) {
            mismatch = fmt::format("rank {} reached `{}`", r, mShare->BarrierNames[r]);
            break;
        }
    }
    mShare->Barrier->arrive_and_wait();
    if (!mismatch.empty()) {
        throw std::logic_error(fmt::format("Barrier mismatch on rank {}: waiting at `{}`, but {}", rank(), name, mismatch));
    }
}

/**
 * @brief Group-scoped in-place sum.
 *
 * Every member publishes a view of its tensor, sums all views into a scratch buffer, and only copies
 * the result back once all members finished reading.
 *
 * @throws std::runtime_error If the calling rank is not part of @p group.
 * @throws std::logic_error If members contribute tensors of differing dtype/shape.
 */
void ThreadedCommunicator::all_reduce_sum(Tensor& tensor, const std::vector<int>& group) {
    auto found = std::find(group.begin(), group.end(), rank());
    if (found == group.end()) {
        throw std::runtime_error(fmt::format("Rank {} is not part of reduction group [{}]", rank(), fmt::join(group, ", ")));
    }
    if (group.size() == 1) {
        return;
    }

    auto index = static_cast<std::size_t>(std::distance(group.begin(), found));
    auto state = mShare->group_state(group);
    state->Buffers[index] = tensor;
    state->Barrier->arrive_and_wait();

    Tensor result = Tensor::zeros(tensor.DType, tensor.shape());
    for (const Tensor& contribution : state->Buffers) {
        accumulate_tensor(result, contribution);
    }

    state->Barrier->arrive_and_wait();
    copy_tensor(tensor, result);
}

// ============================================================================
// Thread Pack for managing worker threads
// ============================================================================

class CommunicatorThreadsPackImpl : public CommunicatorThreadsPack {
public:
    CommunicatorThreadsPackImpl(std::vector<std::jthread> threads,
                                std::shared_ptr<ThreadedCommunicator::SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    // std::jthread joins on destruction; pending exceptions are only reported through join()
    ~CommunicatorThreadsPackImpl() override = default;

    void join() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

private:
    void check_exceptions() {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (size_t t = 0; t < mThreads.size(); ++t) {
            if (auto error = mState->Exceptions[t]; error) {
                fprintf(stderr, "Rank %zu exited with uncaught exception\n", t);
                fflush(stderr);
                mState->Exceptions[t] = nullptr;
                std::rethrow_exception(error);
            }
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<ThreadedCommunicator::SharedState> mState;
};

// ============================================================================
// Main Entry Points
// ============================================================================

std::unique_ptr<CommunicatorThreadsPack> Communicator::launch_communicators(
    int nranks, std::function<void(Communicator& comm)> work) {
    if (nranks <= 0) {
        throw std::invalid_argument(fmt::format("Invalid number of ranks: {}", nranks));
    }

    auto shared_state = std::make_shared<ThreadedCommunicator::SharedState>();
    shared_state->Barrier = std::make_unique<std::barrier<>>(nranks);
    shared_state->BarrierNames.resize(nranks);
    shared_state->Exceptions.resize(nranks);

    auto shared_work = std::make_shared<std::function<void(Communicator&)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(nranks);
    for (int rank = 0; rank < nranks; ++rank) {
        threads.emplace_back([=]() {
            try {
                ThreadedCommunicator comm(rank, nranks, shared_state);
                (*shared_work)(comm);
                shared_state->Barrier->arrive_and_wait();
            } catch (...) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[rank] = std::current_exception();
            }
        });
    }

    return std::make_unique<CommunicatorThreadsPackImpl>(std::move(threads), shared_state);
}

void Communicator::run_communicators(int nranks, std::function<void(Communicator& comm)> work) {
    auto pack = launch_communicators(nranks, std::move(work));
    pack->join();
}
