#pragma once

#include "proxypool/core/config.hpp"
#include "proxypool/dispatch/request_registry.hpp"
#include "proxypool/protocol/messages.hpp"
#include "proxypool/protocol/stream_event.hpp"
#include "proxypool/rotation/credential_rotator.hpp"
#include "proxypool/rotation/model_mapper.hpp"
#include "proxypool/translate/error_classifier.hpp"
#include "proxypool/translate/request_translator.hpp"
#include "proxypool/upstream/upstream_client.hpp"

#include <functional>
#include <string>
#include <vector>

namespace proxypool::dispatch {

using namespace proxypool::core;
using protocol::CanonicalRequest;
using protocol::CanonicalResponse;
using protocol::StreamEvent;

// "Is the caller still there?" Empty means always yes.
using ConnectionProbe = std::function<bool()>;

// Delivers one event to the caller. Returns false once the caller is gone.
using EventSink = std::function<bool(const StreamEvent& event)>;

struct DispatcherOptions {
    translate::TranslationLimits limits;
    std::vector<std::string> passthrough_prefixes;

    static DispatcherOptions from_config(const UpstreamConfig& config);
};

// Runs one inbound call end to end: rotation, request translation, the
// upstream call, then response translation or error classification.
//
// Each call gets its own RequestHandle; Dispatcher::cancel() aborts the
// upstream transport and silences the stream. No retries happen here.
class Dispatcher {
public:
    Dispatcher(rotation::CredentialModelRotator& rotator,
               upstream::UpstreamClientFactory factory,
               DispatcherOptions options);

    // Non-streaming. The caller is checked once, before a credential is used.
    Result<CanonicalResponse, ErrorEnvelope> complete(const CanonicalRequest& request,
                                                      const ConnectionProbe& still_connected = {});

    // Streaming. Every event goes through `sink`; a failure is delivered as an
    // error event and also returned. A cancelled call returns the Cancelled
    // category and delivers nothing further.
    Result<void, ErrorEnvelope> stream(const CanonicalRequest& request,
                                       const EventSink& sink,
                                       const ConnectionProbe& still_connected = {});

    bool cancel(const RequestId& id);

    const RequestRegistry& registry() const { return registry_; }
    const translate::ErrorClassifier& classifier() const { return classifier_; }

private:
    rotation::CredentialModelRotator& rotator_;
    rotation::ModelMapper mapper_;
    translate::RequestTranslator translator_;
    translate::ErrorClassifier classifier_;
    upstream::UpstreamClientFactory factory_;
    RequestRegistry registry_;
};

// Envelope for a caller that went away
ErrorEnvelope disconnected_envelope();

}  // namespace proxypool::dispatch
