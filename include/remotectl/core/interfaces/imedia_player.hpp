/**
 * @file imedia_player.hpp
 * @brief Playback capability supplied by the host application.
 */
#pragma once
#include <chrono>

namespace remotectl {

    /**
     * @class IMediaPlayer
     * @brief The player a host drives from remote commands.
     *
     * Volume is a percentage in [0, 100]. Positions are milliseconds from
     * the start of the current item.
     */
    class IMediaPlayer {
    public:
        virtual ~IMediaPlayer() = default;

        virtual void play() = 0;
        virtual void pause() = 0;
        virtual void stop() = 0;
        virtual bool isPlaying() const = 0;

        virtual void seek(std::chrono::milliseconds position) = 0;
        virtual std::chrono::milliseconds position() const = 0;

        virtual void setVolume(int percent) = 0;
        virtual int volume() const = 0;

        virtual void setMuted(bool muted) = 0;
        virtual bool isMuted() const = 0;

        /// Playlist navigation; players without a queue ignore it.
        virtual void nextTrack() {}
        virtual void previousTrack() {}
    };

}
