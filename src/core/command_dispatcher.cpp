#include "minikv/command_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <type_traits>

namespace minikv {

namespace {

constexpr const char* kUnknownCommand = "ERROR: unknown command";
constexpr const char* kWrongArity = "ERROR: wrong number of arguments";
constexpr const char* kInvalidExpire = "ERROR: invalid expire time";
constexpr const char* kSyntaxError = "ERROR: syntax error";

// Keeps now + ttl inside the range of the system clock
constexpr std::chrono::milliseconds kMaxTtl = std::chrono::hours{24 * 365 * 100};

std::string to_upper(std::string_view text) {
    std::string upper{text};
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return std::toupper(c);
    });
    return upper;
}

void require_args(const Request& request, size_t count) {
    if (request.args.size() != count)
        throw ProtocolError{kWrongArity};
}

} // namespace


Command CommandDispatcher::parse(const Request& request) {
    std::string cmd = to_upper(request.name);
    const auto& args = request.args;

    if (cmd == "GET") {
        require_args(request, 1);
        return Get{ args[0] };
    }

    if (cmd == "SET") {
        if (args.size() != 2 && args.size() != 4)
            throw ProtocolError{kWrongArity};

        Set set{ args[0], args[1], std::nullopt };
        if (args.size() == 4)
            set.ttl = parse_ttl(args[2], args[3]);
        return set;
    }

    if (cmd == "DEL") {
        require_args(request, 1);
        return Del{ args[0] };
    }

    if (cmd == "EXISTS") {
        require_args(request, 1);
        return Exists{ args[0] };
    }

    if (cmd == "MGET") {
        if (args.empty())
            throw ProtocolError{kWrongArity};
        return MGet{ args };
    }

    if (cmd == "MSET") {
        if (args.empty() || args.size() % 2 != 0)
            throw ProtocolError{kWrongArity};

        MSet mset;
        mset.pairs.reserve(args.size() / 2);
        for (size_t i = 0; i < args.size(); i += 2)
            mset.pairs.emplace_back(args[i], args[i + 1]);
        return mset;
    }

    if (cmd == "FLUSH") {
        require_args(request, 0);
        return Flush{ };
    }

    if (cmd == "PING") {
        require_args(request, 0);
        return Ping{ };
    }

    throw ProtocolError{kUnknownCommand};
}

std::optional<std::chrono::milliseconds> CommandDispatcher::parse_ttl(const std::string& option,
                                                                      const std::string& amount) {
    std::string unit = to_upper(option);
    if (unit != "EX" && unit != "PX")
        throw ProtocolError{kSyntaxError};

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(amount.data(), amount.data() + amount.size(), value);
    if (ec != std::errc{} || ptr != amount.data() + amount.size() || value <= 0)
        throw ProtocolError{kInvalidExpire};

    const int64_t per_unit = unit == "EX" ? 1000 : 1;
    if (value > kMaxTtl.count() / per_unit)
        throw ProtocolError{kInvalidExpire};
    return std::chrono::milliseconds{value * per_unit};
}

Reply CommandDispatcher::execute(const Request& request, Keyspace& store) {
    try {
        return execute(parse(request), store);
    } catch (const ProtocolError& e) {
        return Reply::error(e.what());
    }
}

Reply CommandDispatcher::execute(const Command& command, Keyspace& store) {
    return std::visit([&](const auto& cmd) -> Reply {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, Get>) {
            auto value = store.get(cmd.key);
            return value ? Reply::bulk(std::move(*value)) : Reply::nil();

        } else if constexpr (std::is_same_v<T, Set>) {
            store.set(cmd.key, cmd.value, cmd.ttl);
            return Reply::ok();

        } else if constexpr (std::is_same_v<T, Del>) {
            return Reply::number(store.del(cmd.key) ? 1 : 0);

        } else if constexpr (std::is_same_v<T, Exists>) {
            return Reply::number(store.exists(cmd.key) ? 1 : 0);

        } else if constexpr (std::is_same_v<T, MGet>) {
            std::vector<Reply> elements;
            for (auto& value : store.get_many(cmd.keys))
                elements.push_back(value ? Reply::bulk(std::move(*value)) : Reply::nil());
            return Reply::array(std::move(elements));

        } else if constexpr (std::is_same_v<T, MSet>) {
            store.set_many(cmd.pairs);
            return Reply::ok();

        } else if constexpr (std::is_same_v<T, Flush>) {
            return Reply::number(static_cast<int64_t>(store.clear()));

        } else if constexpr (std::is_same_v<T, Ping>) {
            return Reply::status("PONG");
        }
    }, command);
}

} // namespace minikv
