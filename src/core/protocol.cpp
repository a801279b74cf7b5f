#include "minikv/protocol.hpp"
#include <charconv>
#include <iterator>

namespace minikv {

namespace {

// Parses the decimal integer in buffer[begin, end). Throws on anything else.
int64_t parse_length(const std::string& buffer, size_t begin, size_t end) {
    int64_t value = 0;
    const char* first = buffer.data() + begin;
    const char* last = buffer.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || first == last)
        throw ProtocolError{"protocol error"};
    return value;
}

} // namespace


std::optional<Request> Protocol::parse(std::string_view line) {
    // CRLF tolerance (windows, telnet, netcat)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string> tokens;
    tokens.reserve(3);

    size_t pos = 0;

    while (pos < line.size()) {
        // Skip spaces
        while (pos < line.size() && line[pos] == ' ')
            ++pos;

        if (pos >= line.size())
            break;

        size_t start = pos;
        while (pos < line.size() && line[pos] != ' ')
            ++pos;

        tokens.emplace_back(line.substr(start, pos - start));
    }

    if (tokens.empty()) {
        return std::nullopt;
    }

    return make_request(std::move(tokens));
}

std::optional<Request> Protocol::extract(std::string& buffer) {
    while (!buffer.empty()) {
        if (buffer.front() == '*')
            return extract_multibulk(buffer);

        auto pos = buffer.find('\n');
        if (pos == std::string::npos)
            return std::nullopt; // No full line yet

        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        if (auto request = parse(line))
            return request;
    }
    return std::nullopt;
}

std::optional<Request> Protocol::extract_multibulk(std::string& buffer) {
    auto header_end = buffer.find("\r\n");
    if (header_end == std::string::npos)
        return std::nullopt;

    int64_t count = parse_length(buffer, 1, header_end);
    if (count < 0 || count > MAX_MULTIBULK_ITEMS)
        throw ProtocolError{"protocol error"};

    size_t pos = header_end + 2;
    if (count == 0) {
        // Empty frame, nothing to run
        buffer.erase(0, pos);
        return extract(buffer);
    }

    std::vector<std::string> tokens;
    tokens.reserve(static_cast<size_t>(count));

    for (int64_t i = 0; i < count; ++i) {
        if (pos >= buffer.size())
            return std::nullopt;
        if (buffer[pos] != '$')
            throw ProtocolError{"protocol error"};

        auto length_end = buffer.find("\r\n", pos);
        if (length_end == std::string::npos)
            return std::nullopt;

        int64_t length = parse_length(buffer, pos + 1, length_end);
        if (length < 0)
            throw ProtocolError{"protocol error"};

        size_t data_begin = length_end + 2;
        size_t data_end = data_begin + static_cast<size_t>(length);
        if (data_end + 2 > buffer.size())
            return std::nullopt;
        if (buffer[data_end] != '\r' || buffer[data_end + 1] != '\n')
            throw ProtocolError{"protocol error"};

        tokens.emplace_back(buffer, data_begin, static_cast<size_t>(length));
        pos = data_end + 2;
    }

    buffer.erase(0, pos);
    return make_request(std::move(tokens));
}

Request Protocol::make_request(std::vector<std::string> tokens) {
    Request request;
    request.name = std::move(tokens.front());
    request.args.assign(std::make_move_iterator(tokens.begin() + 1),
                        std::make_move_iterator(tokens.end()));
    return request;
}

std::string Protocol::encode(const Reply& reply) {
    std::string out;
    encode_into(reply, out);
    return out;
}

void Protocol::encode_into(const Reply& reply, std::string& out) {
    switch (reply.kind) {
    case Reply::Kind::Status:
        out += "+" + reply.text + "\r\n";
        break;
    case Reply::Kind::Error:
        out += "-" + reply.text + "\r\n";
        break;
    case Reply::Kind::Integer:
        out += ":" + std::to_string(reply.integer) + "\r\n";
        break;
    case Reply::Kind::Bulk:
        out += "$" + std::to_string(reply.text.size()) + "\r\n";
        out += reply.text;
        out += "\r\n";
        break;
    case Reply::Kind::Nil:
        out += "$-1\r\n";
        break;
    case Reply::Kind::Array:
        out += "*" + std::to_string(reply.elements.size()) + "\r\n";
        for (const auto& element : reply.elements)
            encode_into(element, out);
        break;
    }
}

} // namespace minikv
