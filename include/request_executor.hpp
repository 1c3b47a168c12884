//
// Created by Sanger Steel on 6/16/25.
//

#pragma once
#include "cancellation.hpp"
#include "prompts.hpp"
#include "request_parameters.hpp"
#include "result_types.hpp"
#include "transport.hpp"

// Sends exactly one request per call and turns whatever happened into a
// RequestOutcome. Never throws for request failures and never retries.
class RequestExecutor {
public:
    RequestExecutor(SharedClient shared_client, RequestParameters defaults);

    RequestOutcome execute(const PromptRecord& prompt, const CancellationToken& token) const;

    const RequestParameters& request_defaults() const {
        return defaults;
    }

private:
    SharedClient shared_client;
    RequestParameters defaults;
};

// Fills tokens or the failure classification of `outcome` from a finished
// transport call.
void classify_response(
    RequestOutcome& outcome,
    const TransportResponse& response,
    const PromptRecord& prompt,
    EndpointFormat format
);
