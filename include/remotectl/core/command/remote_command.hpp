/**
 * @file remote_command.hpp
 * @brief Wire-level command model for remotectl.
 *
 * A RemoteCommand is an immutable pair of a type discriminator and an open
 * map of primitive values. Known types map to CommandType; any other type
 * string survives as CommandType::Custom with its original name.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace remotectl {

    /**
     * @enum CommandType
     * @brief Discriminator of a command frame.
     *
     * Auth, AuthSuccess and AuthFailed are handshake-only and never travel
     * through the command channel; they exist here so the names are shared
     * with the codec.
     */
    enum class CommandType : uint8_t {
        Ping,
        Pong,
        Ack,
        DeviceInfo,
        Auth,
        AuthSuccess,
        AuthFailed,
        Play,
        Pause,
        PlayPause,
        Stop,
        Seek,
        SeekForward,
        SeekBackward,
        Volume,
        VolumeUp,
        VolumeDown,
        Mute,
        NextTrack,
        PreviousTrack,
        SyncState,
        Custom          ///< any type string not listed above
    };

    /// Wire name of a known type. Custom has no fixed name and yields "".
    std::string_view commandTypeName(CommandType type) noexcept;

    /// Inverse of commandTypeName; unknown names map to CommandType::Custom.
    CommandType commandTypeFromName(std::string_view name) noexcept;

    /// Primitive payload value: null, bool, integer, floating point or string.
    using CommandValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    /// Ordered so encoding is deterministic.
    using CommandData = std::map<std::string, CommandValue, std::less<>>;

    /**
     * @class RemoteCommand
     * @brief Immutable {type, data} message exchanged after authentication.
     */
    class RemoteCommand {
    public:
        /// @throws std::invalid_argument for CommandType::Custom, which needs a name
        explicit RemoteCommand(CommandType type, CommandData data = {});

        /**
         * @brief Build a command from a wire type name.
         *
         * Known names become their CommandType; anything else is kept as a
         * Custom command carrying the name verbatim.
         *
         * @throws std::invalid_argument when @p name is empty
         */
        static RemoteCommand fromName(std::string_view name, CommandData data = {});

        CommandType type() const noexcept { return type_; }

        /// Wire name, including the original name of Custom commands.
        const std::string& name() const noexcept { return name_; }

        const CommandData& data() const noexcept { return data_; }

        bool has(std::string_view key) const;

        /// @return the string at @p key, or std::nullopt when absent or not a string
        std::optional<std::string> getString(std::string_view key) const;
        /// @return the number at @p key as int64; doubles are truncated, and
        ///         std::nullopt when non-finite or outside the int64 range
        std::optional<std::int64_t> getInt(std::string_view key) const;
        /// @return the number at @p key as double
        std::optional<double> getDouble(std::string_view key) const;
        std::optional<bool> getBool(std::string_view key) const;

        /// True for ping, pong, ack and deviceInfo: liveness and identity traffic.
        bool isControlTraffic() const noexcept;

        bool operator==(const RemoteCommand& o) const = default;

    private:
        RemoteCommand(CommandType type, std::string name, CommandData data);

        CommandType type_;
        std::string name_;
        CommandData data_;
    };

}
