#include "provider/iprovider.hpp"

namespace provider
{

const char *status_name(int code)
{
    switch (code)
    {
        case status::kSuccess:
            return "SUCCESS";
        case status::kError:
            return "ERROR";
        case status::kAlreadyAdvertising:
            return "ALREADY_ADVERTISING";
        case status::kAlreadyDiscovering:
            return "ALREADY_DISCOVERING";
        case status::kAlreadyConnectedToEndpoint:
            return "ALREADY_CONNECTED_TO_ENDPOINT";
        case status::kConnectionRejected:
            return "CONNECTION_REJECTED";
        case status::kNotConnectedToEndpoint:
            return "NOT_CONNECTED_TO_ENDPOINT";
        case status::kEndpointUnknown:
            return "ENDPOINT_UNKNOWN";
        case status::kEndpointIoError:
            return "ENDPOINT_IO_ERROR";
        case status::kPayloadIoError:
            return "PAYLOAD_IO_ERROR";
        case status::kUnsupportedMedium:
            return "UNSUPPORTED_MEDIUM";
    }
    return "UNKNOWN_STATUS";
}

}  // namespace provider
