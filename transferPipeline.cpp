#include "transferPipeline.hpp"

#include <utility>

#include "lib/logger.hpp"

using namespace Retagger;

TransferRequest TransferRequest::resolved(const std::string& fallbackDomain) const {
    return {imageName, targetDomain.empty() ? fallbackDomain : targetDomain};
}

const char* toString(TransferPipeline::State state) {
    switch (state) {
        case TransferPipeline::State::Start:   return "start";
        case TransferPipeline::State::Parsing: return "parsing";
        case TransferPipeline::State::Pulling: return "pulling";
        case TransferPipeline::State::Tagging: return "tagging";
        case TransferPipeline::State::Pushing: return "pushing";
        case TransferPipeline::State::Done:    return "done";
        case TransferPipeline::State::Failed:  return "failed";
    }
    return "unknown";
}

std::shared_ptr<TransferPipeline> TransferPipeline::create(EngineFacade& engine, ProgressBroadcaster& broadcaster,
                                                           TransferRequest request) {
    return std::shared_ptr<TransferPipeline>(new TransferPipeline(engine, broadcaster, std::move(request)));
}

TransferPipeline::TransferPipeline(EngineFacade& engine, ProgressBroadcaster& broadcaster, TransferRequest request)
    : engine_(engine), broadcaster_(broadcaster), request_(std::move(request)) {}

template<typename Step>
void TransferPipeline::guarded(Step&& step) {
    try {
        step();
    } catch (const std::exception& e) {
        if (state_ == State::Done || state_ == State::Failed) {
            logMessage(std::string("Error after the run had ended: ") + e.what(), "pipeline", LogLevel::ERROR);
            return;
        }
        fail(std::string("Unexpected error while processing image: ") + e.what());
    }
}

void TransferPipeline::run(CompletionHandler handler) {
    handler_ = std::move(handler);
    guarded([this] { parse(); });
}

void TransferPipeline::report(const std::string& message, int progress) {
    broadcaster_.publish(message, progress);
}

void TransferPipeline::parse() {
    state_ = State::Parsing;
    try {
        reference_ = ImageReference::parse(request_.imageName);
    } catch (const ParseError& e) {
        fail(std::string("Error: ") + e.what());
        return;
    }

    outcome_.source = reference_.source();
    outcome_.target = reference_.target(request_.targetDomain);
    report("Processing image: " + outcome_.source + " -> " + outcome_.target, 10);
    pull();
}

void TransferPipeline::pull() {
    state_ = State::Pulling;
    report("Pulling image " + outcome_.source + "...", 20);
    auto self = shared_from_this();
    engine_.pullAsync(outcome_.source, [self](std::exception_ptr error, ImageHandle image) {
        self->guarded([&] { self->onPulled(error, image); });
    });
}

void TransferPipeline::onPulled(std::exception_ptr error, const ImageHandle& image) {
    if (error) {
        fail("Failed to pull image: " + describeError(error));
        return;
    }
    image_ = image;
    report("Image pulled: " + image_.shortId, 40);

    state_ = State::Tagging;
    report("Re-tagging image...", 60);
    auto self = shared_from_this();
    engine_.tagAsync(image_, request_.targetDomain, reference_.bucket, reference_.repository, reference_.tag,
                     [self](std::exception_ptr error) {
        self->guarded([&] { self->onTagged(error); });
    });
}

void TransferPipeline::onTagged(std::exception_ptr error) {
    if (error) {
        fail("Failed to tag image: " + describeError(error));
        return;
    }
    report("Image tagged as " + outcome_.target, 80);
    push();
}

void TransferPipeline::push() {
    state_ = State::Pushing;
    outcome_.target = buildTargetReference(request_.targetDomain, reference_.bucket, reference_.repository, reference_.tag);
    report("Pushing image to " + outcome_.target + "...", 90);
    auto self = shared_from_this();
    engine_.pushAsync(outcome_.target,
        [self](const std::string& line) {
            if (self->state_ == State::Pushing) {
                self->report("Push status: " + line, 95);
            }
        },
        [self](std::exception_ptr error) {
            self->guarded([&] { self->onPushed(error); });
        });
}

void TransferPipeline::onPushed(std::exception_ptr error) {
    if (error) {
        fail("Failed to push image: " + describeError(error));
        return;
    }
    finish();
}

void TransferPipeline::finish() {
    state_ = State::Done;
    outcome_.success = true;
    report("Done! Image pushed to: " + outcome_.target, 100);
    logMessage("Transferred " + outcome_.source + " to " + outcome_.target, "pipeline", LogLevel::INFO);
    if (handler_) handler_(outcome_);
}

void TransferPipeline::fail(const std::string& message) {
    logMessage(boost::format("%s (%s, while %s)") % message % request_.imageName % toString(state_), "pipeline", LogLevel::ERROR);
    state_ = State::Failed;
    outcome_.success = false;
    outcome_.error = message;
    report(message, 0);
    if (handler_) handler_(outcome_);
}
