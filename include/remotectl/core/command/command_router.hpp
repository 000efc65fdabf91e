/**
 * @file command_router.hpp
 * @brief CommandRouter for dispatching received commands to handlers.
 *
 * Handlers are keyed by wire name, so custom command types route the same
 * way as the built-in playback commands.
 */
#pragma once
#include "remotectl/core/command/remote_command.hpp"
#include "remotectl/core/interfaces/imedia_player.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace remotectl {

    /**
     * @typedef CommandHandler
     * @brief Handles one received command.
     */
    using CommandHandler = std::function<void(const RemoteCommand&)>;

    /**
     * @class CommandRouter
     * @brief Maps command types to handlers. Thread-safe.
     */
    class CommandRouter {
    public:
        /**
         * @brief Register or replace the handler for a command type.
         */
        void registerHandler(CommandType type, CommandHandler handler);

        /**
         * @brief Register or replace the handler for a wire name, including custom ones.
         */
        void registerHandler(const std::string& name, CommandHandler handler);

        void unregisterHandler(const std::string& name);

        bool hasHandler(const std::string& name) const;

        /**
         * @brief Invoke the handler registered for @p command.
         *
         * Exceptions thrown by the handler are logged and do not propagate.
         * @return True if a handler was found and called, false otherwise
         */
        bool dispatch(const RemoteCommand& command) const;

    private:
        std::unordered_map<std::string, CommandHandler> handlers_;  ///< keyed by wire name
        mutable std::mutex mutex_;
    };

    /**
     * @brief Route the playback commands to @p player.
     *
     * Wires play, pause, playPause, stop, seek (data.position ms),
     * seekForward/seekBackward (data.offset ms, default 10 s), volume
     * (data.volume, clamped to 0..100), volumeUp/volumeDown (steps of 5),
     * mute (data.muted, toggles when absent), nextTrack and previousTrack.
     * The player must outlive the router's handlers.
     */
    void bindMediaPlayer(CommandRouter& router, IMediaPlayer& player);

}
