#include <codenexus/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <string>

namespace codenexus::mcp {

StdioTransport::StdioTransport() : StdioTransport(std::cin, std::cout) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    // Responses must reach the client immediately
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void StdioTransport::send(const json& message) {
    if (state_.load() != TransportState::Connected) {
        return;
    }
    std::string payload;
    try {
        // Replace invalid UTF-8 rather than throwing mid-response
        payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        spdlog::error("StdioTransport::send serialization failed: {}", e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(outMutex_);
    out_ << payload << "\n";
    out_.flush();
    if (!out_) {
        spdlog::error("StdioTransport: write to stdout failed; closing transport");
        state_.store(TransportState::Error);
    }
}

MessageResult StdioTransport::receive() {
    if (state_.load() != TransportState::Connected) {
        return Error{ErrorCode::InternalError, "Transport not connected"};
    }

    auto is_ws = [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    while (state_.load() == TransportState::Connected) {
        if (externalShutdown_ && externalShutdown_->load()) {
            state_.store(TransportState::Closing);
            return Error{ErrorCode::InternalError, "External shutdown requested"};
        }

        std::string line;
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::info("StdioTransport: EOF on stdin; treating as client disconnect");
                state_.store(TransportState::Disconnected);
                return Error{ErrorCode::InternalError, "EOF on stdin"};
            }
            // Transient stream failure; clear and retry
            in_.clear();
            recordError();
            if (!shouldRetryAfterError()) {
                state_.store(TransportState::Error);
                return Error{ErrorCode::InternalError, "Repeated stdin read failures"};
            }
            continue;
        }

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        auto firstNonWs =
            std::find_if_not(line.begin(), line.end(), [&](unsigned char c) { return is_ws(c); });
        line.erase(line.begin(), firstNonWs);
        // UTF-8 BOM
        if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line.erase(0, 3);
        }
        if (line.empty()) {
            continue;
        }

        spdlog::debug("StdioTransport: Read line: '{}'", line);

        if (line.front() != '{' && line.front() != '[') {
            spdlog::error("StdioTransport: Invalid message format (expected NDJSON): {}", line);
            recordError();
            if (!shouldRetryAfterError())
                state_.store(TransportState::Error);
            return Error{ErrorCode::SerializationError, "Invalid message format - expected NDJSON"};
        }

        auto parsed = json_utils::parse_json(line);
        if (!parsed) {
            spdlog::error("StdioTransport: Failed to parse JSON: {}", line);
            recordError();
            if (!shouldRetryAfterError())
                state_.store(TransportState::Error);
            return parsed.error();
        }
        resetErrorCount();
        return parsed.value();
    }

    return Error{ErrorCode::InternalError, "Transport closed during receive"};
}

bool StdioTransport::shouldRetryAfterError() const noexcept {
    constexpr size_t MAX_CONSECUTIVE_ERRORS = 5;
    return errorCount_.load() < MAX_CONSECUTIVE_ERRORS;
}

void StdioTransport::recordError() noexcept {
    errorCount_.fetch_add(1);
}

void StdioTransport::resetErrorCount() noexcept {
    errorCount_.store(0);
}

} // namespace codenexus::mcp
