// Demo for the remotectl library.
//
//   remotectl_demo host [name]                          host a session and print its credentials
//   remotectl_demo join <address> <sessionId> <pin> [name]  join and send playPause every second

#include "remotectl/remotectl.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

using namespace remotectl;

namespace {

    std::atomic_bool g_running{ true };

    void onSignal(int) { g_running = false; }

    /// Prints what a real player would do.
    class ConsoleMediaPlayer : public IMediaPlayer {
    public:
        void play() override { playing_ = true; LOG_INFO("player: play"); }
        void pause() override { playing_ = false; LOG_INFO("player: pause"); }
        void stop() override { playing_ = false; position_ = {}; LOG_INFO("player: stop"); }
        bool isPlaying() const override { return playing_; }

        void seek(std::chrono::milliseconds position) override {
            position_ = position;
            LOG_INFO("player: seek to " + std::to_string(position.count()) + "ms");
        }
        std::chrono::milliseconds position() const override { return position_; }

        void setVolume(int percent) override {
            volume_ = percent;
            LOG_INFO("player: volume " + std::to_string(percent));
        }
        int volume() const override { return volume_; }

        void setMuted(bool muted) override {
            muted_ = muted;
            LOG_INFO(std::string("player: ") + (muted ? "muted" : "unmuted"));
        }
        bool isMuted() const override { return muted_; }

        void nextTrack() override { LOG_INFO("player: next track"); }
        void previousTrack() override { LOG_INFO("player: previous track"); }

    private:
        std::atomic_bool          playing_{ false };
        std::atomic_bool          muted_{ false };
        std::atomic_int           volume_{ 50 };
        std::chrono::milliseconds position_{ 0 };
    };

    void printUsage() {
        std::cerr << "usage:\n"
                  << "  remotectl_demo host [name]\n"
                  << "  remotectl_demo join <address> <sessionId> <pin> [name]\n";
    }

    int runHost(SessionController& controller) {
        ConsoleMediaPlayer player;
        CommandRouter router;
        bindMediaPlayer(router, player);

        controller.setCommandCallback([&router](const RemoteCommand& c) {
            if (!router.dispatch(c)) LOG_INFO("demo: unhandled command " + c.name());
        });

        SessionInfo info;
        try {
            info = controller.createSession();
        } catch (const RemotePeerError& e) {
            std::cerr << "cannot host: " << e.what() << '\n';
            return 1;
        }

        std::cout << "Session ID: " << info.sessionId << '\n'
                  << "PIN:        " << info.pin << '\n'
                  << "Address:    " << info.address << '\n' << std::flush;

        while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));
        controller.leaveSession();
        return 0;
    }

    int runJoin(SessionController& controller, const std::string& address,
                const std::string& sessionId, const std::string& pin) {
        controller.setCommandCallback([](const RemoteCommand& c) {
            LOG_INFO("demo: host sent " + c.name());
        });

        try {
            controller.joinSession(sessionId, pin, address).get();
        } catch (const RemotePeerError& e) {
            std::cerr << "cannot join: " << e.what() << '\n';
            return 1;
        }
        std::cout << "Connected to " << address << '\n' << std::flush;

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            controller.sendCommand(CommandType::PlayPause);
        }
        controller.leaveSession();
        return 0;
    }

}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 2;
    }
    const std::string mode = argv[1];

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    Logger::inst().setLevel(LogLevel::Info);

    DeviceIdentity identity;
    identity.platform = "linux";

    auto scheduler = std::make_shared<TimerQueue>();
    std::shared_ptr<ITransport> transport = std::make_shared<WebSocketTransport>();

    int rc = 0;
    {
        if (mode == "host") {
            identity.name = argc > 2 ? argv[2] : "remotectl host";
            SessionController controller(transport, scheduler, identity);
            controller.setSnapshotCallback([](const SessionSnapshot& s) {
                LOG_INFO("demo: status " + std::string(toString(s.status)));
            });
            rc = runHost(controller);
        } else if (mode == "join" && argc >= 5) {
            identity.name = argc > 5 ? argv[5] : "remotectl remote";
            SessionController controller(transport, scheduler, identity);
            controller.setSnapshotCallback([](const SessionSnapshot& s) {
                LOG_INFO("demo: status " + std::string(toString(s.status)) +
                         (s.errorMessage ? " (" + *s.errorMessage + ")" : ""));
            });
            rc = runJoin(controller, argv[2], argv[3], argv[4]);
        } else {
            printUsage();
            rc = 2;
        }
    }

    transport->shutdown();
    scheduler->stop();
    return rc;
}
