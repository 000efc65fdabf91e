#include "remotectl/core/command/command_router.hpp"
#include "remotectl/core/util/logger.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace remotectl {

    namespace {
        constexpr std::int64_t kDefaultSeekOffsetMs = 10'000;
        constexpr std::int64_t kMaxSeekMs = 24LL * 60 * 60 * 1000;
        constexpr int kVolumeStep = 5;

        // relative seeks are bounded to a day so position +/- offset cannot overflow
        std::chrono::milliseconds seekOffset(const RemoteCommand& c) {
            const auto offset = c.getInt("offset").value_or(kDefaultSeekOffsetMs);
            return std::chrono::milliseconds(std::clamp<std::int64_t>(offset, -kMaxSeekMs, kMaxSeekMs));
        }

        std::chrono::milliseconds clampPosition(std::chrono::milliseconds p) {
            return std::max(std::chrono::milliseconds(0), p);
        }

        // saturates instead of wrapping when the player already sits near the int64 limit
        std::chrono::milliseconds movePosition(std::chrono::milliseconds from, std::chrono::milliseconds by) {
            const auto cur = from.count();
            const auto step = by.count();
            if (step > 0 && cur > std::numeric_limits<std::int64_t>::max() - step)
                return std::chrono::milliseconds::max();
            if (step < 0 && cur < std::numeric_limits<std::int64_t>::min() - step)
                return std::chrono::milliseconds(0);
            return clampPosition(from + by);
        }

        int clampVolume(std::int64_t v) {
            return static_cast<int>(std::clamp<std::int64_t>(v, 0, 100));
        }
    }

    void CommandRouter::registerHandler(CommandType type, CommandHandler handler) {
        if (type == CommandType::Custom)
            throw std::invalid_argument("CommandRouter: custom commands are registered by name");
        registerHandler(std::string(commandTypeName(type)), std::move(handler));
    }

    void CommandRouter::registerHandler(const std::string& name, CommandHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[name] = std::move(handler);
    }

    void CommandRouter::unregisterHandler(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(name);
    }

    bool CommandRouter::hasHandler(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.contains(name);
    }

    bool CommandRouter::dispatch(const RemoteCommand& command) const {
        CommandHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(command.name());
            if (it == handlers_.end()) {
                LOG_DEBUG("[CommandRouter] No handler for: " + command.name());
                return false;
            }
            handler = it->second;
        }
        try {
            handler(command);
        } catch (const std::exception& ex) {
            LOG_WARN("[CommandRouter] Handler exception in " + command.name() + ": " + ex.what());
        }
        return true;
    }

    void bindMediaPlayer(CommandRouter& router, IMediaPlayer& player) {
        using std::chrono::milliseconds;
        IMediaPlayer* p = &player;

        router.registerHandler(CommandType::Play, [p](const RemoteCommand&) { p->play(); });
        router.registerHandler(CommandType::Pause, [p](const RemoteCommand&) { p->pause(); });
        router.registerHandler(CommandType::PlayPause, [p](const RemoteCommand&) {
            if (p->isPlaying()) p->pause();
            else p->play();
        });
        router.registerHandler(CommandType::Stop, [p](const RemoteCommand&) { p->stop(); });

        router.registerHandler(CommandType::Seek, [p](const RemoteCommand& c) {
            auto pos = c.getInt("position");
            if (!pos) {
                LOG_WARN("[CommandRouter] seek without a position ignored");
                return;
            }
            p->seek(clampPosition(milliseconds(*pos)));
        });
        router.registerHandler(CommandType::SeekForward, [p](const RemoteCommand& c) {
            p->seek(movePosition(p->position(), seekOffset(c)));
        });
        router.registerHandler(CommandType::SeekBackward, [p](const RemoteCommand& c) {
            p->seek(movePosition(p->position(), -seekOffset(c)));
        });

        router.registerHandler(CommandType::Volume, [p](const RemoteCommand& c) {
            auto v = c.getInt("volume");
            if (!v) {
                LOG_WARN("[CommandRouter] volume without a level ignored");
                return;
            }
            p->setVolume(clampVolume(*v));
        });
        router.registerHandler(CommandType::VolumeUp, [p](const RemoteCommand&) {
            p->setVolume(clampVolume(p->volume() + kVolumeStep));
        });
        router.registerHandler(CommandType::VolumeDown, [p](const RemoteCommand&) {
            p->setVolume(clampVolume(p->volume() - kVolumeStep));
        });
        router.registerHandler(CommandType::Mute, [p](const RemoteCommand& c) {
            p->setMuted(c.getBool("muted").value_or(!p->isMuted()));
        });

        router.registerHandler(CommandType::NextTrack, [p](const RemoteCommand&) { p->nextTrack(); });
        router.registerHandler(CommandType::PreviousTrack, [p](const RemoteCommand&) { p->previousTrack(); });
    }

}
