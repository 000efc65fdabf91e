#include "remotectl/core/protocol/session_codec.hpp"
#include "remotectl/core/util/logger.hpp"
#include <nlohmann/json.hpp>
#include <limits>

namespace remotectl {

    using json = nlohmann::json;

    namespace {

        std::string dump(const json& j) {
            // replace invalid UTF-8 instead of throwing
            return j.dump(-1, ' ', false, json::error_handler_t::replace);
        }

        json toJson(const CommandValue& v) {
            return std::visit([](const auto& x) -> json {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, std::monostate>) return nullptr;
                else return json(x);
            }, v);
        }

        bool fromJson(const json& j, CommandValue& out) {
            switch (j.type()) {
                case json::value_t::null:            out = std::monostate{};               return true;
                case json::value_t::boolean:         out = j.get<bool>();                  return true;
                case json::value_t::number_integer:  out = j.get<std::int64_t>();          return true;
                case json::value_t::number_unsigned: {
                    auto u = j.get<std::uint64_t>();
                    if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                        out = static_cast<std::int64_t>(u);
                    else
                        out = static_cast<double>(u);
                    return true;
                }
                case json::value_t::number_float:    out = j.get<double>();                return true;
                case json::value_t::string:          out = j.get<std::string>();           return true;
                default:                             return false;
            }
        }

        std::string stringField(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string()) return {};
            return it->get<std::string>();
        }

    }

    std::string SessionCodec::encode(const RemoteCommand& command) const {
        json j;
        j["type"] = command.name();
        if (!command.data().empty()) {
            json data = json::object();
            for (const auto& [key, value] : command.data())
                data[key] = toJson(value);
            j["data"] = std::move(data);
        }
        return dump(j);
    }

    std::string SessionCodec::encode(const AuthFrame& auth) const {
        json j;
        j["type"] = std::string(commandTypeName(CommandType::Auth));
        j["sessionId"] = auth.sessionId;
        j["pin"] = auth.pin;
        j["deviceName"] = auth.deviceName;
        j["platform"] = auth.platform;
        return dump(j);
    }

    std::string SessionCodec::encode(const AuthSuccessFrame&) const {
        json j;
        j["type"] = std::string(commandTypeName(CommandType::AuthSuccess));
        return dump(j);
    }

    std::string SessionCodec::encode(const AuthFailedFrame& failed) const {
        json j;
        j["type"] = std::string(commandTypeName(CommandType::AuthFailed));
        j["message"] = failed.message;
        return dump(j);
    }

    std::string SessionCodec::encode(const Frame& frame) const {
        return std::visit([this](const auto& f) { return encode(f); }, frame);
    }

    DecodeResult SessionCodec::decode(std::string_view text) const {
        DecodeResult result;

        json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) {
            result.error = "malformed JSON";
            return result;
        }
        if (!j.is_object()) {
            result.error = "frame is not a JSON object";
            return result;
        }
        auto typeIt = j.find("type");
        if (typeIt == j.end() || !typeIt->is_string()) {
            result.error = "missing \"type\"";
            return result;
        }

        const auto name = typeIt->get<std::string>();
        if (name.empty()) {
            result.error = "empty \"type\"";
            return result;
        }
        switch (commandTypeFromName(name)) {
            case CommandType::Auth:
                result.frame = AuthFrame{ stringField(j, "sessionId"), stringField(j, "pin"),
                                          stringField(j, "deviceName"), stringField(j, "platform") };
                return result;
            case CommandType::AuthSuccess:
                result.frame = AuthSuccessFrame{};
                return result;
            case CommandType::AuthFailed:
                result.frame = AuthFailedFrame{ stringField(j, "message") };
                return result;
            default:
                break;
        }

        CommandData data;
        if (auto dataIt = j.find("data"); dataIt != j.end() && !dataIt->is_null()) {
            if (!dataIt->is_object()) {
                result.error = "\"data\" is not an object";
                return result;
            }
            for (const auto& [key, value] : dataIt->items()) {
                CommandValue v;
                if (!fromJson(value, v)) {
                    result.error = "non-primitive value for data key \"" + key + "\"";
                    return result;
                }
                data.emplace(key, std::move(v));
            }
        }

        result.frame = RemoteCommand::fromName(name, std::move(data));
        LOG_TRACE("SessionCodec: decoded " + name);
        return result;
    }

}
