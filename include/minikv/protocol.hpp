#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace minikv {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * A framed request: command name plus its string arguments.
 * The name is kept exactly as the client sent it.
 */
struct Request {
    std::string name;
    std::vector<std::string> args;
};

struct Reply {
    enum class Kind { Status, Error, Integer, Bulk, Nil, Array };

    Kind kind{Kind::Nil};
    std::string text;
    int64_t integer{0};
    std::vector<Reply> elements;

    static Reply status(std::string text) { return Reply{Kind::Status, std::move(text), 0, {}}; }
    static Reply ok() { return status("OK"); }
    static Reply error(std::string message) { return Reply{Kind::Error, std::move(message), 0, {}}; }
    static Reply number(int64_t value) { return Reply{Kind::Integer, {}, value, {}}; }
    static Reply bulk(std::string value) { return Reply{Kind::Bulk, std::move(value), 0, {}}; }
    static Reply nil() { return Reply{}; }
    static Reply array(std::vector<Reply> elements) { return Reply{Kind::Array, {}, 0, std::move(elements)}; }

    bool operator==(const Reply&) const = default;
};

/*
 * Request framing and reply encoding.
 *
 * Two framings share one connection:
 *   inline:  "SET key value\n" (a trailing \r is tolerated)
 *   RESP:    "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n"
 * Replies are always RESP2 encoded.
 */
class Protocol {
public:
    // Splits one inline line. Returns std::nullopt for a blank line.
    static std::optional<Request> parse(std::string_view line);

    // Removes and returns the next complete request from `buffer`.
    // Returns std::nullopt when more bytes are needed.
    // Throws ProtocolError on a malformed RESP frame.
    static std::optional<Request> extract(std::string& buffer);

    static std::string encode(const Reply& reply);

private:
    static constexpr int64_t MAX_MULTIBULK_ITEMS = 1024 * 1024;

    static std::optional<Request> extract_multibulk(std::string& buffer);
    static Request make_request(std::vector<std::string> tokens);
    static void encode_into(const Reply& reply, std::string& out);
};

} // namespace minikv
