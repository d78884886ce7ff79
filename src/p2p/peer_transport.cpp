#include "peer_transport.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace p2p {

namespace {

json parseObject(const std::string &payload) {
    json parsed;
    try {
        parsed = json::parse(payload);
    } catch (const json::parse_error &e) {
        throw WireFormatError(std::string("invalid JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw WireFormatError("payload is not a JSON object");
    }
    return parsed;
}

std::string requireString(const json &object, const char *field) {
    if (!object.contains(field) || !object[field].is_string()) {
        throw WireFormatError(std::string("missing string field '") + field + "'");
    }
    return object[field].get<std::string>();
}

} // namespace

std::string encodeRequest(const WorkerRequest &request) {
    json payload = {
        {"prompt", request.prompt},
        {"request_id", request.requestId},
        {"requester", request.requester}
    };
    // Invalid UTF-8 is replaced rather than failing the send
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

WorkerRequest decodeRequest(const std::string &payload) {
    json parsed = parseObject(payload);
    WorkerRequest request;
    request.prompt = requireString(parsed, "prompt");
    request.requestId = requireString(parsed, "request_id");
    if (parsed.contains("requester") && parsed["requester"].is_string()) {
        request.requester = parsed["requester"].get<std::string>();
    }
    return request;
}

std::string encodeReply(const WorkerReply &reply) {
    json payload = {{"request_id", reply.requestId}};
    if (reply.output) {
        payload["output"] = *reply.output;
    } else {
        payload["output"] = nullptr;
    }
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

WorkerReply decodeReply(const std::string &payload) {
    json parsed = parseObject(payload);
    WorkerReply reply;
    reply.requestId = requireString(parsed, "request_id");
    if (parsed.contains("output") && parsed["output"].is_string()) {
        reply.output = parsed["output"].get<std::string>();
    } else if (parsed.contains("output") && !parsed["output"].is_null()) {
        throw WireFormatError("field 'output' must be a string or null");
    }
    return reply;
}

} // namespace p2p
