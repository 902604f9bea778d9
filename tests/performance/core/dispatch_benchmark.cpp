#include "typehook/core/extension_dispatcher.h"
#include "typehook/utils/logging.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace typehook;
using namespace typehook::core;

namespace {

class IgnoringExtension : public TypeCheckingExtension {};

class ClaimingExtension : public TypeCheckingExtension {
public:
    bool handleUnresolvedVariableExpression(ast::VariableExpression&) override { return true; }
};

class NarrowingExtension : public TypeCheckingExtension {
public:
    ast::MethodNodeList handleAmbiguousMethods(const ast::MethodNodeList& nodes,
                                               const ast::Expression&) override {
        return ast::MethodNodeList(nodes.begin(), nodes.end() - 1);
    }
};

class SynthesizingExtension : public TypeCheckingExtension {
public:
    ast::MethodNodeList handleMissingMethod(const ast::ClassNode&, const std::string& name,
                                            const ast::ArgumentListExpression&,
                                            const std::vector<ast::ClassNodePtr>&,
                                            const ast::MethodCall&) override {
        return {std::make_shared<ast::MethodNode>(name, ast::ClassNode::objectType())};
    }
};

// Global extensions: state.range(0), local extensions: state.range(1)
class DispatchBenchmark : public benchmark::Fixture {
protected:
    void SetUp(const benchmark::State& state) override {
        utils::setLogLevel(utils::LogLevel::Off);
        dispatcher_ = std::make_unique<ExtensionDispatcher>();
        for (int64_t i = 0; i < state.range(0); ++i) {
            dispatcher_->addGlobal(std::make_shared<IgnoringExtension>());
        }
        auto local = std::make_shared<ExtensionList>();
        for (int64_t i = 0; i < state.range(1); ++i) {
            local->push_back(std::make_shared<IgnoringExtension>());
        }
        dispatcher_->pushLocal(local);
    }

    void TearDown(const benchmark::State&) override {
        dispatcher_.reset();
    }

    std::unique_ptr<ExtensionDispatcher> dispatcher_;
};

} // namespace

BENCHMARK_DEFINE_F(DispatchBenchmark, UnclaimedVariable)(benchmark::State& state) {
    ast::VariableExpression variable("x");
    for (auto _ : state) {
        benchmark::DoNotOptimize(dispatcher_->handleUnresolvedVariableExpression(variable));
    }
    state.SetItemsProcessed(state.iterations() * (state.range(0) + state.range(1)));
}

BENCHMARK_DEFINE_F(DispatchBenchmark, ClaimedByLastLocal)(benchmark::State& state) {
    dispatcher_->popLocal();
    auto local = std::make_shared<ExtensionList>();
    for (int64_t i = 0; i < state.range(1); ++i) {
        local->push_back(std::make_shared<IgnoringExtension>());
    }
    local->push_back(std::make_shared<ClaimingExtension>());
    dispatcher_->pushLocal(local);

    ast::VariableExpression variable("x");
    for (auto _ : state) {
        benchmark::DoNotOptimize(dispatcher_->handleUnresolvedVariableExpression(variable));
    }
}

BENCHMARK_DEFINE_F(DispatchBenchmark, Broadcast)(benchmark::State& state) {
    ast::ClassNode node("Widget");
    for (auto _ : state) {
        dispatcher_->afterVisitClass(node);
    }
    state.SetItemsProcessed(state.iterations() * (state.range(0) + state.range(1)));
}

BENCHMARK_DEFINE_F(DispatchBenchmark, AccumulateMissingMethods)(benchmark::State& state) {
    for (int i = 0; i < 4; ++i) {
        dispatcher_->addGlobal(std::make_shared<SynthesizingExtension>());
    }
    ast::ClassNode receiver("Widget");
    auto arguments = std::make_shared<ast::ArgumentListExpression>();
    ast::MethodCallExpression call(std::make_shared<ast::VariableExpression>("widget"), "resize", arguments);
    for (auto _ : state) {
        auto methods = dispatcher_->handleMissingMethod(receiver, "resize", *arguments, {}, call);
        benchmark::DoNotOptimize(methods.data());
    }
}

static void BM_NarrowAmbiguousMethods(benchmark::State& state) {
    utils::setLogLevel(utils::LogLevel::Off);
    ExtensionDispatcher dispatcher;
    for (int64_t i = 0; i < state.range(0); ++i) {
        dispatcher.addGlobal(std::make_shared<NarrowingExtension>());
    }
    ast::MethodNodeList candidates;
    for (int64_t i = 0; i < state.range(0) + 1; ++i) {
        candidates.push_back(std::make_shared<ast::MethodNode>("with", ast::ClassNode::objectType()));
    }
    ast::VariableExpression origin("builder");
    for (auto _ : state) {
        auto narrowed = dispatcher.handleAmbiguousMethods(candidates, origin);
        benchmark::DoNotOptimize(narrowed.data());
    }
}

BENCHMARK_REGISTER_F(DispatchBenchmark, UnclaimedVariable)
    ->Args({1, 0})->Args({8, 0})->Args({8, 8})->Args({64, 8});
BENCHMARK_REGISTER_F(DispatchBenchmark, ClaimedByLastLocal)
    ->Args({8, 8})->Args({64, 8});
BENCHMARK_REGISTER_F(DispatchBenchmark, Broadcast)
    ->Args({8, 0})->Args({64, 8});
BENCHMARK_REGISTER_F(DispatchBenchmark, AccumulateMissingMethods)
    ->Args({8, 0});
BENCHMARK(BM_NarrowAmbiguousMethods)->Arg(2)->Arg(16);

BENCHMARK_MAIN();
