#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>

#include "lib/engineFacade.hpp"
#include "lib/imageReference.hpp"
#include "lib/progressBroadcaster.hpp"

struct TransferRequest {
    std::string imageName;
    std::string targetDomain;

    // Empty target domain falls back to the configured default.
    TransferRequest resolved(const std::string& fallbackDomain) const;
};

struct TransferOutcome {
    bool success = false;
    std::string source;
    std::string target;
    std::string error;
};

/**
 * One pull -> tag -> push run. Each stage waits on the engine facade without
 * blocking the io_context and reports to the broadcaster; the first failure ends
 * the run. Keeps itself alive through its pending handlers.
 */
class TransferPipeline : public std::enable_shared_from_this<TransferPipeline> {
public:
    enum class State {Start, Parsing, Pulling, Tagging, Pushing, Done, Failed};
    using CompletionHandler = std::function<void(const TransferOutcome&)>;

    static std::shared_ptr<TransferPipeline> create(Retagger::EngineFacade& engine,
                                                    Retagger::ProgressBroadcaster& broadcaster,
                                                    TransferRequest request);

    void run(CompletionHandler handler = nullptr);

    State state() const { return state_; }
    const TransferOutcome& outcome() const { return outcome_; }

private:
    TransferPipeline(Retagger::EngineFacade& engine, Retagger::ProgressBroadcaster& broadcaster, TransferRequest request);

    void parse();
    void pull();
    void onPulled(std::exception_ptr error, const Retagger::ImageHandle& image);
    void onTagged(std::exception_ptr error);
    void push();
    void onPushed(std::exception_ptr error);
    void finish();
    void fail(const std::string& message);

    template<typename Step>
    void guarded(Step&& step);

    void report(const std::string& message, int progress);

    Retagger::EngineFacade& engine_;
    Retagger::ProgressBroadcaster& broadcaster_;
    TransferRequest request_;
    Retagger::ImageReference reference_;
    Retagger::ImageHandle image_;
    State state_ = State::Start;
    TransferOutcome outcome_;
    CompletionHandler handler_;
};

const char* toString(TransferPipeline::State state);
