// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/checkpointer.h"
#include "checkpoint/parallel_state.h"
#include "checkpoint/payload.h"

#include "training/checkpoint_options.h"
#include "training/logging.h"

#include "utilities/comm.h"
#include "utilities/tensor.h"
#include "utilities/tensor_container.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace {
/**
 * @brief Deterministic content for a simulated tensor.
 *
 * @param t FP32 tensor to fill.
 * @param step Training step the content belongs to.
 * @param index Index of the tensor within its container.
 * @param salt Extra offset; differs between ranks for state that is not replicated.
 */
void fill_pattern(Tensor& t, int step, int index, int salt) {
    float* data = t.get<float>();
    for (std::size_t i = 0; i < t.nelem(); ++i) {
        data[i] = static_cast<float>(step) * 1000.f + static_cast<float>(index) * 10.f
                  + static_cast<float>(salt) + static_cast<float>(i % 7) * 0.25f;
    }
}

NamedTensors make_container(const std::string& prefix, int count, long elements) {
    NamedTensors container;
    for (int i = 0; i < count; ++i) {
        // uneven sizes, so the bin packing has something to do
        long n = elements * (1 + i % 3);
        container.add(fmt::format("{}.{}", prefix, i), Tensor::zeros(ETensorDType::FP32, {n}));
    }
    return container;
}

void fill_container(NamedTensors& container, int step, int salt) {
    int index = 0;
    container.iterate_tensors([&](const std::string&, const Tensor& t) {
        Tensor view = t;
        fill_pattern(view, step, index++, salt);
    });
}

bool containers_equal(NamedTensors& a, NamedTensors& b) {
    bool equal = a.size() == b.size();
    a.iterate_tensors([&](const std::string& name, const Tensor& t) {
        equal = equal && tensors_equal(t, b.get(name));
    });
    return equal;
}
} // namespace

/**
 * @brief Simulated multi-rank job that repeatedly checkpoints synthetic model and optimizer state,
 * then restores the newest checkpoint and verifies it.
 *
 * "Parameters" are stored as public fields so CLI11 can bind options directly.
 */
struct BenchRunner {
    /// Root directory of the checkpoints.
    std::string CkptDir = "./checkpoints";
    /// Optional JSON file with checkpoint options; explicit command line options take precedence.
    std::string OptionsFile;
    /// Where to write the JSON event log (empty: no log file).
    std::string LogFile;

    /// Number of simulated ranks (threads).
    int NRanks = 4;
    /// Tensor-parallel size.
    int TPSize = 1;
    /// Pipeline-parallel size.
    int PPSize = 1;

    /// Number of checkpoints to write.
    int Steps = 3;
    /// Number of model tensors per rank.
    int NumTensors = 8;
    /// Base number of fp32 elements per tensor.
    long TensorElements = 1024;

    /// Also restore the newest checkpoint and compare against the saved state.
    bool Verify = true;
    bool Verbose = false;
    bool Quiet = false;

    CheckpointOptions Options;

    void load_config(int argc, const char** argv);
    void run(int argc, const char** argv);

private:
    void run_rank(Communicator& comm, int argc, const char** argv);
    std::atomic<bool> mVerifyFailed{false};
};

void BenchRunner::load_config(int argc, const char** argv) {
    CLI::App app{"Simulated distributed checkpointing benchmark"};

    CheckpointOptions cli;
    int num_kept = -1;

    app.add_option("--checkpoint-dir", CkptDir, "Directory in which to save checkpoints.");
    app.add_option("--config", OptionsFile, "JSON file with checkpoint options")->check(CLI::ExistingFile);
    app.add_option("--log-file", LogFile, "Where to save the checkpoint event log");

    app.add_option("--ranks", NRanks, "Number of simulated ranks")->check(CLI::PositiveNumber);
    app.add_option("--tp", TPSize, "Tensor-parallel size")->check(CLI::PositiveNumber);
    app.add_option("--pp", PPSize, "Pipeline-parallel size")->check(CLI::PositiveNumber);

    app.add_option("--steps", Steps, "Number of checkpoints to write")->check(CLI::PositiveNumber);
    app.add_option("--num-tensors", NumTensors, "Number of model tensors")->check(CLI::PositiveNumber);
    app.add_option("--tensor-elements", TensorElements, "Base number of fp32 elements per tensor")->check(CLI::PositiveNumber);
    app.add_flag("--verify,!--no-verify", Verify, "Restore the newest checkpoint and compare it against the saved state");

    auto async_opt = app.add_flag("--async-save,!--no-async-save", cli.AsyncSave, "Write checkpoints and remove old ones in the background");
    auto sharded_opt = app.add_flag("--sharded,!--no-sharded", cli.UseShardedFormat, "Write one file per tensor, split across data-parallel replicas");
    auto keep_opt = app.add_option("--ckpt-keep-n", num_kept, "Clean up old checkpoints, only preserving the latest n.");
    auto workers_opt = app.add_option("--num-workers", cli.NumWorkers, "Ranks loading a non-sharded checkpoint at the same time")->check(CLI::Range(1, 32));
    auto zero1_opt = app.add_flag("--zero1", cli.Zero1Optimizer, "Optimizer state is partitioned across data-parallel ranks");
    auto strict_opt = app.add_flag("--strict,!--no-strict", cli.Strict, "Reject missing or unexpected model tensors when loading");

    auto verbose = app.add_flag("--verbose", Verbose, "Print debug messages");
    app.add_flag("--quiet", Quiet, "Only print warnings")->excludes(verbose);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Options = OptionsFile.empty() ? CheckpointOptions{} : load_checkpoint_options(OptionsFile);
    if (async_opt->count() > 0) Options.AsyncSave = cli.AsyncSave;
    if (sharded_opt->count() > 0) Options.UseShardedFormat = cli.UseShardedFormat;
    if (keep_opt->count() > 0) Options.NumKept = num_kept >= 0 ? std::optional<int>(num_kept) : std::nullopt;
    if (workers_opt->count() > 0) Options.NumWorkers = cli.NumWorkers;
    if (zero1_opt->count() > 0) Options.Zero1Optimizer = cli.Zero1Optimizer;
    if (strict_opt->count() > 0) Options.Strict = cli.Strict;
    Options.validate();

    // fail early, before any thread is started
    ParallelState::create(NRanks, 0, TPSize, PPSize);
}

void BenchRunner::run_rank(Communicator& comm, int argc, const char** argv) {
    CheckpointLogger::EVerbosity verbosity = Verbose ? CheckpointLogger::VERBOSE
                                            : Quiet ? CheckpointLogger::QUIET : CheckpointLogger::DEFAULT;
    CheckpointLogger logger(LogFile, comm.rank(), verbosity);
    logger.log_cmd(argc, argv);
    logger.log_options(Options.to_log_options());

    ParallelState layout = ParallelState::create(comm.world_size(), comm.rank(), TPSize, PPSize);
    // replicas of the same (tp, pp) position hold identical model state
    const int replica_salt = layout.PPRank * layout.TPSize + layout.TPRank;
    const int optimizer_salt = Options.Zero1Optimizer ? comm.rank() : replica_salt;

    NamedTensors model = make_container("model", NumTensors, TensorElements);
    NamedTensors moments = make_container("adam.m", NumTensors, TensorElements);
    nlohmann::json hyper_params = {{"lr", 1e-4}, {"beta1", 0.9}, {"beta2", 0.999}};

    TensorContainerPayload model_payload(model);
    OptimizerPayload optimizer_payload(moments, hyper_params, Options.Zero1Optimizer);

    Checkpointer checkpointer(CkptDir, comm, layout, Options, &logger);
    auto start = std::chrono::steady_clock::now();
    for (int step = 1; step <= Steps; ++step) {
        fill_container(model, step, replica_salt);
        fill_container(moments, step, optimizer_salt);
        hyper_params["step"] = step;

        SaveRequest request;
        request.Model = &model_payload;
        request.Optimizer = &optimizer_payload;
        request.Scheduler = nlohmann::json{{"step", step}};
        request.UserContent = nlohmann::json{{"step", step}, {"world_size", comm.world_size()}};
        checkpointer.save(fmt::format("step_{:08d}", step), request);
    }
    checkpointer.finalize();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    logger.log_message("", fmt::format("wrote {} checkpoints in {} ms", Steps, elapsed.count()));

    if (!Verify) {
        return;
    }

    NamedTensors restored_model = make_container("model", NumTensors, TensorElements);
    NamedTensors restored_moments = make_container("adam.m", NumTensors, TensorElements);
    nlohmann::json restored_hyper_params;
    nlohmann::json scheduler;
    TensorContainerPayload restored_model_payload(restored_model);
    OptimizerPayload restored_optimizer_payload(restored_moments, restored_hyper_params, Options.Zero1Optimizer);

    LoadRequest request;
    request.Model = &restored_model_payload;
    request.Optimizer = &restored_optimizer_payload;
    request.Scheduler = &scheduler;
    std::optional<nlohmann::json> user_content;
    {
        auto section = logger.log_section_start("", "restoring newest checkpoint");
        user_content = checkpointer.load(std::nullopt, request);
    }

    bool ok = containers_equal(model, restored_model) && containers_equal(moments, restored_moments)
              && restored_hyper_params == hyper_params && scheduler.value("step", -1) == Steps
              && user_content.has_value() && user_content->value("step", -1) == Steps;
    if (!ok) {
        mVerifyFailed = true;
        fprintf(stderr, "[rank %d] restored state does not match the saved state\n", comm.rank());
    }
    comm.barrier("verification done");
    if (comm.rank() == 0 && !mVerifyFailed) {
        logger.log_message("", "restored state matches the saved state");
    }
}

void BenchRunner::run(int argc, const char** argv) {
    Communicator::run_communicators(NRanks, [&](Communicator& comm) {
        run_rank(comm, argc, argv);
    });
    if (mVerifyFailed) {
        throw std::runtime_error("Checkpoint verification failed");
    }
}

int main(int argc, const char** argv) {
    try {
        BenchRunner runner;
        runner.load_config(argc, argv);
        runner.run(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
