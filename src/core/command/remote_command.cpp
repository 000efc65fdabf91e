#include "remotectl/core/command/remote_command.hpp"
#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace remotectl {

    namespace {
        // 2^63: the first double past the int64 range
        constexpr double kInt64Bound = 9223372036854775808.0;

        struct TypeName {
            CommandType type;
            std::string_view name;
        };

        constexpr std::array<TypeName, 21> kTypeNames{ {
            { CommandType::Ping,          "ping" },
            { CommandType::Pong,          "pong" },
            { CommandType::Ack,           "ack" },
            { CommandType::DeviceInfo,    "deviceInfo" },
            { CommandType::Auth,          "auth" },
            { CommandType::AuthSuccess,   "authSuccess" },
            { CommandType::AuthFailed,    "authFailed" },
            { CommandType::Play,          "play" },
            { CommandType::Pause,         "pause" },
            { CommandType::PlayPause,     "playPause" },
            { CommandType::Stop,          "stop" },
            { CommandType::Seek,          "seek" },
            { CommandType::SeekForward,   "seekForward" },
            { CommandType::SeekBackward,  "seekBackward" },
            { CommandType::Volume,        "volume" },
            { CommandType::VolumeUp,      "volumeUp" },
            { CommandType::VolumeDown,    "volumeDown" },
            { CommandType::Mute,          "mute" },
            { CommandType::NextTrack,     "nextTrack" },
            { CommandType::PreviousTrack, "previousTrack" },
            { CommandType::SyncState,     "syncState" },
        } };
    }

    std::string_view commandTypeName(CommandType type) noexcept {
        for (const auto& tn : kTypeNames) {
            if (tn.type == type) return tn.name;
        }
        return {};
    }

    CommandType commandTypeFromName(std::string_view name) noexcept {
        for (const auto& tn : kTypeNames) {
            if (tn.name == name) return tn.type;
        }
        return CommandType::Custom;
    }

    RemoteCommand::RemoteCommand(CommandType type, CommandData data)
        : type_(type), name_(commandTypeName(type)), data_(std::move(data)) {
        if (type == CommandType::Custom)
            throw std::invalid_argument("RemoteCommand: custom commands are built with fromName");
    }

    RemoteCommand::RemoteCommand(CommandType type, std::string name, CommandData data)
        : type_(type), name_(std::move(name)), data_(std::move(data)) {}

    RemoteCommand RemoteCommand::fromName(std::string_view name, CommandData data) {
        if (name.empty())
            throw std::invalid_argument("RemoteCommand: empty command name");
        return RemoteCommand(commandTypeFromName(name), std::string(name), std::move(data));
    }

    bool RemoteCommand::has(std::string_view key) const {
        return data_.find(key) != data_.end();
    }

    std::optional<std::string> RemoteCommand::getString(std::string_view key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        if (auto* s = std::get_if<std::string>(&it->second)) return *s;
        return std::nullopt;
    }

    std::optional<std::int64_t> RemoteCommand::getInt(std::string_view key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        if (auto* i = std::get_if<std::int64_t>(&it->second)) return *i;
        if (auto* d = std::get_if<double>(&it->second)) {
            if (!std::isfinite(*d) || *d < -kInt64Bound || *d >= kInt64Bound) return std::nullopt;
            return static_cast<std::int64_t>(*d);
        }
        return std::nullopt;
    }

    std::optional<double> RemoteCommand::getDouble(std::string_view key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        if (auto* d = std::get_if<double>(&it->second)) return *d;
        if (auto* i = std::get_if<std::int64_t>(&it->second)) return static_cast<double>(*i);
        return std::nullopt;
    }

    std::optional<bool> RemoteCommand::getBool(std::string_view key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        if (auto* b = std::get_if<bool>(&it->second)) return *b;
        return std::nullopt;
    }

    bool RemoteCommand::isControlTraffic() const noexcept {
        return type_ == CommandType::Ping
            || type_ == CommandType::Pong
            || type_ == CommandType::Ack
            || type_ == CommandType::DeviceInfo;
    }

}
