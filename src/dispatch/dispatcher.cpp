#include "proxypool/dispatch/dispatcher.hpp"
#include "proxypool/translate/response_translator.hpp"
#include "proxypool/translate/stream_translator.hpp"
#include "proxypool/translate/token_estimator.hpp"

#include <spdlog/spdlog.h>

namespace proxypool::dispatch {

namespace {

std::vector<std::string> credential_secrets(const rotation::CredentialModelRotator& rotator) {
    std::vector<std::string> secrets;
    for (const auto& credential : rotator.credentials()) {
        secrets.push_back(credential.secret);
    }
    return secrets;
}

long long elapsed_ms(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

ErrorEnvelope missing_client_envelope() {
    ErrorEnvelope envelope;
    envelope.category = ErrorCategory::Internal;
    envelope.message = "No upstream client available";
    return envelope;
}

}  // namespace

ErrorEnvelope disconnected_envelope() {
    ErrorEnvelope envelope;
    envelope.category = ErrorCategory::Cancelled;
    envelope.message = "Client disconnected";
    return envelope;
}

DispatcherOptions DispatcherOptions::from_config(const UpstreamConfig& config) {
    DispatcherOptions options;
    options.limits.min_tokens = config.min_tokens_limit;
    options.limits.max_tokens = config.max_tokens_limit;
    options.limits.request_stream_usage = config.request_stream_usage;
    options.passthrough_prefixes = config.passthrough_prefixes;
    return options;
}

Dispatcher::Dispatcher(rotation::CredentialModelRotator& rotator,
                       upstream::UpstreamClientFactory factory,
                       DispatcherOptions options)
    : rotator_(rotator)
    , mapper_(rotator, options.passthrough_prefixes)
    , translator_(options.limits)
    , classifier_(credential_secrets(rotator))
    , factory_(std::move(factory))
{
}

bool Dispatcher::cancel(const RequestId& id) {
    bool found = registry_.cancel(id);
    if (found) {
        spdlog::info("{} cancellation requested", id);
    }
    return found;
}

Result<CanonicalResponse, ErrorEnvelope> Dispatcher::complete(const CanonicalRequest& request,
                                                              const ConnectionProbe& still_connected) {
    using R = Result<CanonicalResponse, ErrorEnvelope>;

    if (still_connected && !still_connected()) {
        spdlog::info("Caller disconnected before dispatch, model={}", request.model);
        return R::err(disconnected_envelope());
    }

    auto start = Clock::now();
    RequestHandle handle = registry_.open();
    rotation::Selection selection = rotator_.select();
    ModelId target = mapper_.resolve(request.model, selection.model);

    auto upstream_request = translator_.translate(request, target);
    upstream_request.stream = false;
    upstream_request.include_usage = false;

    spdlog::debug("{} key#{} {} -> {} (stream=false)",
                  handle.id(), selection.credential.ordinal, request.model, target);

    auto client = factory_(selection.credential.secret);
    if (!client) {
        return R::err(missing_client_envelope());
    }

    auto result = client->complete(upstream_request, handle.token());
    if (result.is_err()) {
        ErrorEnvelope envelope = classifier_.classify(result.error());
        spdlog::warn("{} key#{} model={} stream=false failed: {} ({} ms)",
                     handle.id(), selection.credential.ordinal, target,
                     envelope.to_string(), elapsed_ms(start));
        return R::err(std::move(envelope));
    }

    CanonicalResponse response = translate::translate_response(
        result.value(), request.model, translate::TokenEstimator::estimate_input(request));

    spdlog::info("{} key#{} model={} stream=false ok stop={} tokens={}/{} ({} ms)",
                 handle.id(), selection.credential.ordinal, target,
                 stop_reason_to_string(response.stop_reason),
                 response.usage.input_tokens, response.usage.output_tokens,
                 elapsed_ms(start));
    return R::ok(std::move(response));
}

Result<void, ErrorEnvelope> Dispatcher::stream(const CanonicalRequest& request,
                                               const EventSink& sink,
                                               const ConnectionProbe& still_connected) {
    using R = Result<void, ErrorEnvelope>;

    if (still_connected && !still_connected()) {
        spdlog::info("Caller disconnected before dispatch, model={}", request.model);
        return R::err(disconnected_envelope());
    }

    auto start = Clock::now();
    RequestHandle handle = registry_.open();
    rotation::Selection selection = rotator_.select();
    ModelId target = mapper_.resolve(request.model, selection.model);

    auto upstream_request = translator_.translate(request, target);
    upstream_request.stream = true;

    spdlog::debug("{} key#{} {} -> {} (stream=true)",
                  handle.id(), selection.credential.ordinal, request.model, target);

    translate::StreamTranslator machine(request.model, translate::TokenEstimator::estimate_input(request));

    // A cancel may land between two events of the same chunk
    auto deliver = [&](const std::vector<StreamEvent>& events) {
        for (const auto& event : events) {
            if (handle.is_cancelled() || !sink(event)) {
                return false;
            }
        }
        return true;
    };

    auto abandon = [&]() {
        machine.cancel();
        handle.token().cancel();
    };

    auto client = factory_(selection.credential.secret);
    if (!client) {
        ErrorEnvelope envelope = missing_client_envelope();
        if (!deliver(machine.fail(envelope))) {
            spdlog::debug("{} caller gone before the error event", handle.id());
        }
        return R::err(std::move(envelope));
    }

    upstream::ChunkCallback on_chunk = [&](const protocol::UpstreamChunk& chunk) {
        if (handle.is_cancelled() || (still_connected && !still_connected())) {
            abandon();
            return false;
        }
        if (!deliver(machine.on_chunk(chunk))) {
            abandon();
            return false;
        }
        return true;
    };

    auto result = client->stream(upstream_request, on_chunk, handle.token());

    if (machine.state() == translate::StreamState::Cancelled || handle.is_cancelled()) {
        machine.cancel();
        spdlog::info("{} key#{} model={} stream=true cancelled ({} ms)",
                     handle.id(), selection.credential.ordinal, target, elapsed_ms(start));
        return R::err(disconnected_envelope());
    }

    if (result.is_err()) {
        ErrorEnvelope envelope = classifier_.classify(result.error());
        if (envelope.category == ErrorCategory::Cancelled) {
            machine.cancel();
            return R::err(std::move(envelope));
        }
        spdlog::warn("{} key#{} model={} stream=true failed after {}: {} ({} ms)",
                     handle.id(), selection.credential.ordinal, target,
                     machine.started() ? "message_start" : "nothing",
                     envelope.to_string(), elapsed_ms(start));
        if (!deliver(machine.fail(envelope))) {
            spdlog::debug("{} caller gone before the error event", handle.id());
        }
        return R::err(std::move(envelope));
    }

    if (!deliver(machine.finish())) {
        machine.cancel();
        spdlog::info("{} key#{} model={} stream=true caller gone at end ({} ms)",
                     handle.id(), selection.credential.ordinal, target, elapsed_ms(start));
        return R::err(disconnected_envelope());
    }

    TokenUsage usage = machine.current_usage();
    spdlog::info("{} key#{} model={} stream=true ok tokens={}/{}{} ({} ms)",
                 handle.id(), selection.credential.ordinal, target,
                 usage.input_tokens, usage.output_tokens, usage.estimated ? " (estimated)" : "",
                 elapsed_ms(start));
    return R::ok();
}

}  // namespace proxypool::dispatch
